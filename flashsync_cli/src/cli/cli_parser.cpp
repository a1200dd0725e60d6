#include "cli_parser.hpp"
#include <CLI/CLI.hpp>
#include <thread>
#include <algorithm>
#include <cctype>

void setup_cli_parser(CLI::App& app, Settings& settings) {
    app.set_help_flag("-h,--help", "Show this help message and exit.");
    app.set_version_flag("--version", "0.1");

    // --- Flags (booleans) ---
    app.add_flag("-n,--dry-run", settings.dry_run,
                 "Report what would be copied without touching the destination tree.");

    app.add_flag("-q,--quiet", settings.quiet,
                 "Suppress non-error console output (progress bar, summary).");

    // --- Options ---
    app.add_option("-p,--patterns", settings.patterns,
                   "Semicolon-separated, case-insensitive regexes matched against file names.")
                   ->default_val(".*");

    app.add_option("-r,--retries", settings.max_retries,
                   "Extra attempts per file on I/O errors (exponential backoff from 100ms).")
                   ->default_val(0)
                   ->check(CLI::NonNegativeNumber);

    settings.num_threads = static_cast<int>(std::max(1U, std::thread::hardware_concurrency()));
    app.add_option("-j,--threads", settings.num_threads,
                   "Maximum number of files copied concurrently.")
                   ->default_val(settings.num_threads)
                   ->check(CLI::PositiveNumber);

    app.add_option("--log-level", settings.log_level,
                   "Log level: ERROR, WARNING, INFO, DEBUG, NONE.")
                   ->default_val("ERROR")
                   ->check(CLI::IsMember({"ERROR", "WARNING", "INFO", "DEBUG", "NONE"}, CLI::ignore_case));

    app.add_option("--log-file", settings.log_file,
                   "Write logs to a specific file (default: no file logging).");

    app.add_option("--report", settings.report_path,
                   "CSV report export filename.")
                   ->take_last();

    // --- Positional Arguments ---
    app.add_option("source", settings.source, "Directory to copy from.")
        ->required()
        ->check(CLI::ExistingDirectory);

    app.add_option("destination", settings.destination, "Directory to copy into (created if missing).")
        ->required();

    // --- Cross-validation logic ---
    app.callback([&settings]() {
        std::transform(settings.log_level.begin(), settings.log_level.end(),
                       settings.log_level.begin(), ::toupper);

        std::error_code ec;
        if (std::filesystem::exists(settings.destination, ec) &&
            std::filesystem::equivalent(settings.source, settings.destination, ec)) {
            throw CLI::ValidationError("Source and destination must be different directories.");
        }
    });
}
