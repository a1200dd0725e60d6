#include "../../include/sync_aggregator.hpp"
#include "../../include/logger.hpp"

namespace flashsync {

SyncAggregator::SyncAggregator(const std::size_t total_files,
                               const bool dry_run,
                               ProgressCallback on_progress)
    : dry_run_(dry_run), on_progress_(std::move(on_progress)) {
    result_.dry_run = dry_run;
    result_.total_files = total_files;
}

void SyncAggregator::report(const std::size_t processed, std::string label) {
    if (on_progress_) {
        on_progress_(SyncProgress{processed, result_.total_files, std::move(label)});
    }
}

void SyncAggregator::begin() {
    std::lock_guard lock(mtx_);
    report(0, dry_run_ ? "[DRY RUN] Starting synchronization..." : "Starting synchronization...");
}

void SyncAggregator::record(const FileOutcome& outcome) {
    std::lock_guard lock(mtx_);

    if (outcome.attempts > 1) {
        result_.total_retry_attempts += static_cast<std::size_t>(outcome.attempts - 1);
    }

    switch (outcome.action) {
        case SyncAction::Created:
            ++result_.files_created;
            break;
        case SyncAction::Updated:
            ++result_.files_updated;
            break;
        case SyncAction::Skipped:
            ++result_.files_skipped;
            break;
        case SyncAction::Failed:
            ++result_.files_failed;
            result_.errors.push_back(outcome.relative.string() + ": " +
                                     outcome.error.value_or("Unknown error"));
            break;
    }

    ++processed_;
    report(processed_, action_label(outcome.action, dry_run_) + ": " + outcome.relative.filename().string());
}

void SyncAggregator::finish() {
    std::lock_guard lock(mtx_);
    if (processed_ != result_.total_files) {
        Logger::log(LogLevel::Warning,
                    "Recorded " + std::to_string(processed_) + " of " +
                    std::to_string(result_.total_files) + " files",
                    "Aggregator");
    }
    report(result_.total_files,
           dry_run_ ? "[DRY RUN] Synchronization analysis completed" : "Synchronization completed");
}

SyncResult SyncAggregator::snapshot() const {
    std::lock_guard lock(mtx_);
    return result_;
}

} // namespace flashsync
