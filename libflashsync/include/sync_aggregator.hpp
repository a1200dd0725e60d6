/**
 * @file sync_aggregator.hpp
 * @brief Thread-safe accumulation of per-file outcomes into a SyncResult.
 */

#ifndef FLASHSYNC_SYNC_AGGREGATOR_HPP
#define FLASHSYNC_SYNC_AGGREGATOR_HPP

#include "sync_types.hpp"
#include <cstddef>
#include <mutex>

namespace flashsync {

/**
 * @brief Owns the SyncResult of one run and the progress stream derived from it.
 *
 * @details record() may be called concurrently from any worker thread. The
 * counters, the error list, the processed count and the progress callback
 * are all serialized by one mutex, so every progress event carries a
 * processed count exactly one higher than the previous one.
 */
class SyncAggregator {
public:
    SyncAggregator(std::size_t total_files, bool dry_run, ProgressCallback on_progress = {});

    SyncAggregator(const SyncAggregator&) = delete;
    SyncAggregator& operator=(const SyncAggregator&) = delete;

    /// Emit the initial event (processed = 0).
    void begin();

    /// Fold one finished file into the result and report progress.
    void record(const FileOutcome& outcome);

    /// Emit the final event (processed = total).
    void finish();

    [[nodiscard]] SyncResult snapshot() const;

private:
    void report(std::size_t processed, std::string label);

    const bool dry_run_;
    ProgressCallback on_progress_;
    SyncResult result_;
    std::size_t processed_{0};
    mutable std::mutex mtx_;
};

} // namespace flashsync

#endif // FLASHSYNC_SYNC_AGGREGATOR_HPP
