/**
 * @file sync_executor.hpp
 * @brief Runs the per-file synchronization work with bounded parallelism.
 */

#ifndef FLASHSYNC_SYNC_EXECUTOR_HPP
#define FLASHSYNC_SYNC_EXECUTOR_HPP

#include "admission_gate.hpp"
#include "event_bus.hpp"
#include "sync_aggregator.hpp"
#include "sync_types.hpp"
#include "thread_pool.hpp"
#include <atomic>
#include <exception>
#include <filesystem>
#include <functional>
#include <mutex>
#include <stop_token>
#include <vector>

namespace flashsync {

/**
 * @brief Options of one run that the executor needs for every file.
 */
struct ExecutorOptions {
    std::filesystem::path destination_root;
    int max_retries = 0;
    bool dry_run = false;
};

/**
 * @brief Fans matched files out over a thread pool, at most N in flight.
 *
 * @details Each unit takes a slot from the AdmissionGate before doing any
 * work and gives it back through AdmissionSlot on every exit path. The gate
 * is owned by the Synchronizer, so concurrent runs on one instance share
 * the bound; the ThreadPool belongs to this executor and lives for one run.
 *
 * A caller stop request is forwarded to the pool: queued units are
 * discarded, running ones observe it at their next copy chunk or backoff
 * sleep. An exception escaping a unit (anything other than a per-file
 * failure, which the retry executor absorbs) stops the pool and is rethrown
 * from dispatch().
 */
class SyncExecutor {
public:
    using FileTask = std::function<void(const MatchedFile&, const std::stop_token&)>;

    SyncExecutor(AdmissionGate& gate, EventBus& bus, unsigned threads);

    /**
     * @brief Synchronize every file of @p files and record each outcome in @p aggregator.
     * @throws SyncCancelled if @p stop fired before every file completed.
     */
    void process(const std::vector<MatchedFile>& files,
                 const ExecutorOptions& options,
                 SyncAggregator& aggregator,
                 const std::stop_token& stop);

    /**
     * @brief Run @p task once per file and wait for all of them.
     * @throws SyncCancelled if the run was cancelled; rethrows the first
     *         exception that escaped a task otherwise.
     */
    void dispatch(const std::vector<MatchedFile>& files,
                  const FileTask& task,
                  const std::stop_token& stop);

private:
    void capture_error(std::exception_ptr error);

    AdmissionGate& gate_;
    EventBus& event_bus_;
    ThreadPool pool_;
    std::mutex error_mtx_;
    std::exception_ptr first_error_;
    std::atomic<bool> cancelled_{false};
};

} // namespace flashsync

#endif // FLASHSYNC_SYNC_EXECUTOR_HPP
