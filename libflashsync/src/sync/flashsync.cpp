/**
 * @file flashsync.cpp
 * @brief Implementation of the public Synchronizer API.
 */

#include "../../include/flashsync.hpp"

#include "../../include/admission_gate.hpp"
#include "../../include/event_bus.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/pattern_set.hpp"
#include "../../include/sync_aggregator.hpp"
#include "../../include/sync_executor.hpp"
#include "../../include/tree_scanner.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace fs = std::filesystem;

namespace flashsync {

namespace {
    constexpr std::string_view TAG = "Synchronizer";

    unsigned normalize_concurrency(const int requested) {
        if (requested > 0) return static_cast<unsigned>(requested);
        const unsigned hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }

    void require_non_blank(const std::string& value, const char* name) {
        if (trim(value).empty()) {
            throw ValidationError(std::string(name) + " must not be empty or whitespace");
        }
    }
} // namespace

struct Synchronizer::Impl {
    const unsigned maxConcurrency;
    AdmissionGate gate;
    EventBus eventBus;
    std::atomic<SyncObserver*> observer{nullptr};

    std::mutex runsMutex;
    std::vector<std::stop_source*> activeRuns;

    explicit Impl(const unsigned concurrency)
        : maxConcurrency(concurrency), gate(concurrency) {
        setupEventBridging();
    }

    void setupEventBridging() {
        eventBus.subscribe<ScanCompleteEvent>([this](const ScanCompleteEvent& e) {
            if (auto* obs = observer.load()) obs->onScanComplete(e.root, e.matched);
        });

        eventBus.subscribe<FileSyncStartEvent>([this](const FileSyncStartEvent& e) {
            if (auto* obs = observer.load()) obs->onFileStart(e.relative);
        });

        eventBus.subscribe<FileSyncRetryEvent>([this](const FileSyncRetryEvent& e) {
            if (auto* obs = observer.load()) obs->onFileRetry(e.relative, e.failed_attempt, e.delay, e.error_message);
        });

        eventBus.subscribe<FileSyncCompleteEvent>([this](const FileSyncCompleteEvent& e) {
            if (auto* obs = observer.load()) obs->onFileFinish(e.outcome, e.dry_run, e.duration);
        });
    }

    /// Keeps a run's stop source reachable from Synchronizer::stop() while the run lasts.
    class RunRegistration {
    public:
        explicit RunRegistration(Impl& impl) : impl_(impl) {
            std::lock_guard lock(impl_.runsMutex);
            impl_.activeRuns.push_back(&source_);
        }
        ~RunRegistration() {
            std::lock_guard lock(impl_.runsMutex);
            std::erase(impl_.activeRuns, &source_);
        }
        RunRegistration(const RunRegistration&) = delete;
        RunRegistration& operator=(const RunRegistration&) = delete;

        std::stop_source& source() { return source_; }

    private:
        Impl& impl_;
        std::stop_source source_;
    };

    void stopAll() {
        std::lock_guard lock(runsMutex);
        for (auto* source : activeRuns) {
            source->request_stop();
        }
    }
};

Synchronizer::Synchronizer(const int max_concurrency)
    : impl_(std::make_unique<Impl>(normalize_concurrency(max_concurrency))) {}

Synchronizer::~Synchronizer() {
    if (impl_) stop();
}

Synchronizer::Synchronizer(Synchronizer&&) noexcept = default;
Synchronizer& Synchronizer::operator=(Synchronizer&&) noexcept = default;

unsigned Synchronizer::max_concurrency() const {
    return impl_->maxConcurrency;
}

void Synchronizer::setObserver(SyncObserver* observer) {
    impl_->observer.store(observer);
}

void Synchronizer::stop() {
    impl_->stopAll();
}

SyncResult Synchronizer::synchronize(const SyncRequest& request,
                                     const ProgressCallback& on_progress,
                                     std::stop_token stop) {
    // --- validation, no filesystem access ---
    require_non_blank(request.origin, "Origin path");
    require_non_blank(request.destination, "Destination path");
    require_non_blank(request.patterns, "Pattern string");
    if (request.max_retries < 0) {
        throw ValidationError("Retry count must not be negative");
    }
    const PatternSet patterns = PatternSet::compile(request.patterns);

    const fs::path origin(request.origin);
    const fs::path destination(request.destination);

    std::error_code ec;
    if (!fs::is_directory(origin, ec)) {
        throw SourceNotFoundError("Origin directory not found: " + request.origin);
    }

    Impl::RunRegistration run(*impl_);
    std::stop_callback link_caller_stop(stop, [&run] { run.source().request_stop(); });
    const std::stop_token run_stop = run.source().get_token();

    Logger::log(LogLevel::Info,
                std::string(request.dry_run ? "[DRY RUN] " : "") + "Synchronizing " + origin.string() +
                " -> " + destination.string() + " (" + std::to_string(patterns.size()) +
                " pattern(s), " + std::to_string(request.max_retries) + " retries)",
                TAG);

    try {
        if (run_stop.stop_requested()) {
            throw SyncCancelled();
        }
        // the root is created even in dry-run to prove it is writable
        ensure_directory(destination);

        const auto files = scan_tree(origin, patterns, run_stop);
        if (run_stop.stop_requested()) {
            throw SyncCancelled();
        }
        impl_->eventBus.publish(ScanCompleteEvent{origin, files.size()});

        SyncAggregator aggregator(files.size(), request.dry_run, on_progress);
        aggregator.begin();

        if (!files.empty()) {
            const auto workers = static_cast<unsigned>(
                std::min<std::size_t>(impl_->maxConcurrency, files.size()));
            SyncExecutor executor(impl_->gate, impl_->eventBus, workers);
            executor.process(files,
                             ExecutorOptions{destination, request.max_retries, request.dry_run},
                             aggregator,
                             run_stop);
        }

        aggregator.finish();
        SyncResult result = aggregator.snapshot();
        Logger::log(result.is_success() ? LogLevel::Info : LogLevel::Warning, result.to_string(), TAG);
        return result;
    } catch (const SyncCancelled& e) {
        Logger::log(LogLevel::Warning, e.what(), TAG);
        throw;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, std::string("Synchronization failed: ") + e.what(), TAG);
        throw;
    }
}

std::future<SyncResult> Synchronizer::synchronize_async(SyncRequest request,
                                                        ProgressCallback on_progress,
                                                        std::stop_token stop) {
    return std::async(std::launch::async,
                      [this, request = std::move(request), on_progress = std::move(on_progress), stop] {
                          return synchronize(request, on_progress, stop);
                      });
}

} // namespace flashsync
