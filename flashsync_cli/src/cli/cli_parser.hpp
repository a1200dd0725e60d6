#ifndef FLASHSYNC_CLI_PARSER_HPP
#define FLASHSYNC_CLI_PARSER_HPP

#include <string>
#include <filesystem>

// forward declaration
namespace CLI { class App; }

struct Settings {
    bool dry_run = false;
    bool quiet = false;

    int max_retries = 0;
    int num_threads = 0;
    std::string patterns = ".*";
    std::string log_level = "ERROR";
    std::filesystem::path log_file;
    std::filesystem::path report_path;

    std::filesystem::path source;
    std::filesystem::path destination;
};

/**
 * @brief Configures the CLI11 parser with all options, flags, and arguments.
 * @param app The CLI::App instance to configure.
 * @param settings The Settings struct to map the options to.
 */
void setup_cli_parser(CLI::App& app, Settings& settings);

#endif //FLASHSYNC_CLI_PARSER_HPP
