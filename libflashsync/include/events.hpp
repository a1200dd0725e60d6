#ifndef FLASHSYNC_EVENTS_HPP
#define FLASHSYNC_EVENTS_HPP

#include "sync_types.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace flashsync {

/**
 * @brief Events published on the EventBus during a synchronization run.
 *
 * Plain data carriers. Per-file events are published from worker threads.
 */

// --- Scan ---

/**
 * @brief Emitted once the source tree has been walked.
 */
struct ScanCompleteEvent {
    std::filesystem::path root; ///< Source root
    std::size_t matched = 0;    ///< Number of files selected by the patterns
};

// --- Per file ---

/**
 * @brief Emitted when a file has been admitted and its first attempt starts.
 */
struct FileSyncStartEvent {
    std::filesystem::path relative;
};

/**
 * @brief Emitted after a failed attempt, before the backoff sleep.
 */
struct FileSyncRetryEvent {
    std::filesystem::path relative;
    int failed_attempt = 1;
    std::chrono::milliseconds delay{0};
    std::string error_message;
};

/**
 * @brief Emitted once per file with its final outcome (Failed included).
 */
struct FileSyncCompleteEvent {
    FileOutcome outcome;
    bool dry_run = false;
    std::chrono::milliseconds duration{0};
};

} // namespace flashsync

#endif // FLASHSYNC_EVENTS_HPP
