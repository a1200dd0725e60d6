#include "../../include/sync_executor.hpp"
#include "../../include/action_resolver.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"
#include "../../include/retry_executor.hpp"
#include "../../include/sync_errors.hpp"
#include <chrono>

namespace fs = std::filesystem;

namespace flashsync {

SyncExecutor::SyncExecutor(AdmissionGate& gate, EventBus& bus, const unsigned threads)
    : gate_(gate),
      event_bus_(bus),
      pool_(threads) {}

void SyncExecutor::capture_error(std::exception_ptr error) {
    {
        std::lock_guard lock(error_mtx_);
        if (!first_error_) {
            first_error_ = std::move(error);
        }
    }
    pool_.request_stop();
}

void SyncExecutor::dispatch(const std::vector<MatchedFile>& files,
                            const FileTask& task,
                            const std::stop_token& stop) {
    std::stop_callback forward_stop(stop, [this] { pool_.request_stop(); });

    for (const auto& file : files) {
        if (stop.stop_requested()) break;
        try {
            pool_.enqueue([this, &task, file](const std::stop_token& st) {
                AdmissionSlot slot(gate_, st);
                if (!slot || st.stop_requested()) {
                    cancelled_ = true;
                    return;
                }
                try {
                    task(file, st);
                } catch (const SyncCancelled&) {
                    cancelled_ = true;
                } catch (const std::exception& e) {
                    Logger::log(LogLevel::Error,
                                "Aborting run on " + file.relative.string() + ": " + e.what(),
                                "Executor");
                    capture_error(std::current_exception());
                } catch (...) {
                    Logger::log(LogLevel::Error,
                                "Aborting run on " + file.relative.string() + ": unknown exception",
                                "Executor");
                    capture_error(std::current_exception());
                }
            });
        } catch (const std::runtime_error& e) {
            // the pool refuses work once stopped; the cause is reported below
            Logger::log(LogLevel::Debug, std::string("Dispatch halted: ") + e.what(), "Executor");
            break;
        }
    }

    pool_.wait_idle();

    {
        std::lock_guard lock(error_mtx_);
        if (first_error_) {
            std::rethrow_exception(first_error_);
        }
    }
    if (cancelled_ || stop.stop_requested()) {
        throw SyncCancelled();
    }
}

void SyncExecutor::process(const std::vector<MatchedFile>& files,
                           const ExecutorOptions& options,
                           SyncAggregator& aggregator,
                           const std::stop_token& stop) {
    Logger::log(LogLevel::Debug,
                "Dispatching " + std::to_string(files.size()) + " files on " +
                std::to_string(pool_.size()) + " workers (gate capacity " +
                std::to_string(gate_.capacity()) + ")",
                "Executor");

    dispatch(files, [this, &options, &aggregator](const MatchedFile& file, const std::stop_token& st) {
        event_bus_.publish(FileSyncStartEvent{file.relative});
        const auto start = std::chrono::steady_clock::now();
        const fs::path destination = options.destination_root / file.relative;

        FileOutcome outcome = execute_with_retry(
            file.relative,
            options.max_retries,
            st,
            [&](int) { return sync_file(file.source, destination, options.dry_run, st); },
            [&](const int attempt, const std::chrono::milliseconds delay, const std::string& error) {
                event_bus_.publish(FileSyncRetryEvent{file.relative, attempt, delay, error});
            });

        const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        if (outcome.action == SyncAction::Failed) {
            Logger::log(LogLevel::Error,
                        file.relative.string() + ": " + outcome.error.value_or("Unknown error"),
                        "Executor");
        }
        event_bus_.publish(FileSyncCompleteEvent{outcome, options.dry_run, duration});
        aggregator.record(outcome);
    }, stop);
}

} // namespace flashsync
