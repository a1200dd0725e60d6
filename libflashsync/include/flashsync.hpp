/**
 * @file flashsync.hpp
 * @brief Public API for the flashsync library.
 */

#ifndef FLASHSYNC_HPP
#define FLASHSYNC_HPP

#include "sync_errors.hpp"
#include "sync_types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <future>
#include <memory>
#include <stop_token>
#include <string>

namespace flashsync {

/**
 * @brief Interface for receiving per-file notifications during a run.
 *
 * Called from worker threads, one call at a time.
 */
struct SyncObserver {
    virtual ~SyncObserver() = default;

    virtual void onScanComplete(const std::filesystem::path& root, std::size_t matched) {}

    virtual void onFileStart(const std::filesystem::path& relative) {}

    virtual void onFileRetry(const std::filesystem::path& relative,
                             int failed_attempt,
                             std::chrono::milliseconds delay,
                             const std::string& error) {}

    virtual void onFileFinish(const FileOutcome& outcome,
                              bool dry_run,
                              std::chrono::milliseconds duration) {}
};

/**
 * @brief One-way, pattern-filtered directory synchronizer.
 *
 * @details Copies every file below the origin whose name matches one of the
 * patterns and that is missing from the destination, or strictly newer
 * than the destination copy. Relative paths are preserved, nothing is ever
 * deleted from the destination.
 *
 * The concurrency bound is fixed per instance and shared by every run on
 * it. Uses PIMPL to keep the thread pool and event plumbing out of the
 * public header.
 */
class Synchronizer {
public:
    /**
     * @param max_concurrency Maximum number of files in flight. Values <= 0
     *        select std::thread::hardware_concurrency().
     */
    explicit Synchronizer(int max_concurrency = 0);
    ~Synchronizer();

    Synchronizer(const Synchronizer&) = delete;
    Synchronizer& operator=(const Synchronizer&) = delete;
    Synchronizer(Synchronizer&&) noexcept;
    Synchronizer& operator=(Synchronizer&&) noexcept;

    /**
     * @brief Run one synchronization pass. Blocks until completion.
     *
     * @param request Origin, destination, patterns, retries, dry-run flag.
     * @param on_progress Optional callback, invoked on worker threads.
     * @param stop Optional cancellation token.
     * @return Aggregated statistics; `is_success()` is false if any file failed.
     * @throws ValidationError / InvalidPatternError before any filesystem access.
     * @throws SourceNotFoundError if the origin is not an existing directory.
     * @throws SyncCancelled if a stop was requested.
     * @throws std::filesystem::filesystem_error on setup failures (destination root, scan).
     */
    SyncResult synchronize(const SyncRequest& request,
                           const ProgressCallback& on_progress = {},
                           std::stop_token stop = {});

    /**
     * @brief Same as synchronize(), on a separate thread. Errors surface through the future.
     *
     * The Synchronizer must outlive the returned future's completion and must
     * not be moved from until then: the task keeps a pointer to this object.
     */
    std::future<SyncResult> synchronize_async(SyncRequest request,
                                              ProgressCallback on_progress = {},
                                              std::stop_token stop = {});

    /**
     * @brief Sets the observer for per-file events.
     * The caller retains ownership of the observer. Pass nullptr to detach.
     */
    void setObserver(SyncObserver* observer);

    /**
     * @brief Requests cancellation of every run in progress. Thread-safe.
     */
    void stop();

    [[nodiscard]] unsigned max_concurrency() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace flashsync

#endif // FLASHSYNC_HPP
