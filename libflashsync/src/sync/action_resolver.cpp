#include "../../include/action_resolver.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"

namespace fs = std::filesystem;

namespace flashsync {

SyncAction resolve_action(const fs::path& source, const fs::path& destination) {
    const auto dest_status = fs::status(destination);
    if (!fs::exists(dest_status) || fs::is_directory(dest_status)) {
        return SyncAction::Created;
    }

    if (fs::last_write_time(source) > fs::last_write_time(destination)) {
        return SyncAction::Updated;
    }
    return SyncAction::Skipped;
}

SyncAction sync_file(const fs::path& source,
                     const fs::path& destination,
                     const bool dry_run,
                     const std::stop_token& stop) {
    if (!dry_run) {
        ensure_directory(destination.parent_path());
    }

    const SyncAction action = resolve_action(source, destination);
    if (action == SyncAction::Skipped || dry_run) {
        return action;
    }

    const auto bytes = copy_file_contents(source, destination, stop);
    if (Logger::has_sinks()) {
        Logger::log(LogLevel::Debug,
                    std::string(action_to_string(action)) + " " + destination.string() +
                    " (" + std::to_string(bytes) + " bytes)",
                    "Executor");
    }
    return action;
}

} // namespace flashsync
