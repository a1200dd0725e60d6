/**
 * @file sync_types.hpp
 * @brief Value types exchanged between the synchronization stages and callers.
 */

#ifndef FLASHSYNC_SYNC_TYPES_HPP
#define FLASHSYNC_SYNC_TYPES_HPP

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace flashsync {

/**
 * @brief Classification of what happened (or would happen) to one file.
 */
enum class SyncAction {
    Skipped, ///< Destination already up to date
    Created, ///< File was missing from the destination
    Updated, ///< Source copy was strictly newer
    Failed   ///< All attempts raised an error
};

/**
 * @brief A source file selected by the pattern set.
 */
struct MatchedFile {
    std::filesystem::path source;   ///< Absolute (or root-joined) source path
    std::filesystem::path relative; ///< Path below the source root, reused below the destination root
};

/**
 * @brief Per-file result produced by the retry executor.
 *
 * `error` is set only when `action == SyncAction::Failed`.
 */
struct FileOutcome {
    SyncAction action = SyncAction::Skipped;
    std::filesystem::path relative;
    int attempts = 1;
    std::optional<std::string> error;
};

/**
 * @brief Aggregated statistics of one synchronization run.
 */
struct SyncResult {
    bool dry_run = false;
    std::size_t total_files = 0;
    std::size_t files_created = 0;
    std::size_t files_updated = 0;
    std::size_t files_skipped = 0;
    std::size_t files_failed = 0;
    std::size_t total_retry_attempts = 0; ///< Sum of (attempts - 1) over all files
    std::vector<std::string> errors;      ///< "<relative path>: <message>", unordered

    [[nodiscard]] bool is_success() const { return files_failed == 0; }
    [[nodiscard]] std::size_t files_modified() const { return files_created + files_updated; }

    /**
     * @brief Summary line, e.g.
     * "[DRY RUN] Sync completed: 3 total, 1 created, 1 updated, 1 skipped, 0 failed, 2 retries".
     */
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Immutable progress snapshot handed to the progress callback.
 */
struct SyncProgress {
    std::size_t processed_files = 0;
    std::size_t total_files = 0;
    std::string current_operation;

    /// 0..100, 0 when there is nothing to process.
    [[nodiscard]] double percent_complete() const {
        return total_files > 0
                   ? static_cast<double>(processed_files) / static_cast<double>(total_files) * 100.0
                   : 0.0;
    }

    /// "{processed}/{total} ({percent}%) - {operation}" with one decimal.
    [[nodiscard]] std::string to_string() const;
};

/**
 * @brief Per-run inputs of Synchronizer::synchronize.
 */
struct SyncRequest {
    std::string origin;      ///< Source root
    std::string destination; ///< Destination root
    std::string patterns;    ///< Semicolon-separated regular expressions
    int max_retries = 0;     ///< Extra attempts per file after the first one
    bool dry_run = false;
};

using ProgressCallback = std::function<void(const SyncProgress&)>;

/**
 * @brief Label used in progress events for a finished file ("Created", "[DRY RUN] Would Skip", ...).
 */
std::string action_label(SyncAction action, bool dry_run);

const char* action_to_string(SyncAction action);

} // namespace flashsync

#endif // FLASHSYNC_SYNC_TYPES_HPP
