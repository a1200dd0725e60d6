#ifndef FLASHSYNC_REPORT_GENERATOR_HPP
#define FLASHSYNC_REPORT_GENERATOR_HPP

#include <filesystem>
#include <string>
#include <vector>
#include "../../../libflashsync/include/sync_types.hpp"

// per-file row of the final report
struct Result {
    std::filesystem::path relative;
    flashsync::SyncAction action = flashsync::SyncAction::Skipped;
    int attempts = 1;
    double seconds = 0.0;
    std::string error_msg;
};

unsigned get_terminal_width();

/**
 * @brief Per-file result text for the report table: "Would Create" etc. in
 * dry-run, without the run-level "[DRY RUN] " prefix.
 */
std::string outcome_label(flashsync::SyncAction action, bool dry_run);

/**
 * @brief Prints a table of per-file outcomes followed by the run summary.
 */
void print_console_report(const std::vector<Result>& results,
                          const flashsync::SyncResult& summary,
                          unsigned num_threads,
                          double total_seconds);

/**
 * @brief Writes one CSV row per file. Returns false if the file could not be opened.
 */
bool export_csv_report(const std::vector<Result>& results,
                       const std::filesystem::path& output_path,
                       bool dry_run);

#endif // FLASHSYNC_REPORT_GENERATOR_HPP
