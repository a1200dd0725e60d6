#include "../../include/sync_types.hpp"
#include <iomanip>
#include <sstream>

namespace flashsync {

std::string SyncResult::to_string() const {
    std::ostringstream oss;
    if (dry_run) {
        oss << "[DRY RUN] ";
    }
    oss << "Sync completed: " << total_files << " total, "
        << files_created << " created, "
        << files_updated << " updated, "
        << files_skipped << " skipped, "
        << files_failed << " failed";
    if (total_retry_attempts > 0) {
        oss << ", " << total_retry_attempts << " retries";
    }
    return oss.str();
}

std::string SyncProgress::to_string() const {
    std::ostringstream oss;
    oss << processed_files << "/" << total_files << " ("
        << std::fixed << std::setprecision(1) << percent_complete() << "%) - "
        << current_operation;
    return oss.str();
}

const char* action_to_string(const SyncAction action) {
    switch (action) {
        case SyncAction::Created: return "Created";
        case SyncAction::Updated: return "Updated";
        case SyncAction::Skipped: return "Skipped";
        case SyncAction::Failed:  return "Failed";
    }
    return "Processed";
}

std::string action_label(const SyncAction action, const bool dry_run) {
    if (!dry_run || action == SyncAction::Failed) {
        return action_to_string(action);
    }
    switch (action) {
        case SyncAction::Created: return "[DRY RUN] Would Create";
        case SyncAction::Updated: return "[DRY RUN] Would Update";
        case SyncAction::Skipped: return "[DRY RUN] Would Skip";
        default: break;
    }
    return "[DRY RUN] Would Process";
}

} // namespace flashsync
