#ifndef FLASHSYNC_ACTION_RESOLVER_HPP
#define FLASHSYNC_ACTION_RESOLVER_HPP

#include "sync_types.hpp"
#include <filesystem>
#include <stop_token>

namespace flashsync {

/**
 * @brief Decide what a synchronization pass has to do with one file.
 *
 * - no file at @p destination            -> SyncAction::Created
 * - mtime(source) >  mtime(destination)  -> SyncAction::Updated
 * - otherwise (equal timestamps included) -> SyncAction::Skipped
 *
 * Only reads metadata. A directory sitting at @p destination is not a file
 * and resolves to Created; the copy that follows is what reports the clash.
 *
 * @throws std::filesystem::filesystem_error on metadata errors.
 */
SyncAction resolve_action(const std::filesystem::path& source,
                          const std::filesystem::path& destination);

/**
 * @brief One synchronization attempt for one file.
 *
 * Ensures the parent directory of @p destination exists (never in dry-run),
 * resolves the action and, for Created/Updated outside dry-run, streams the
 * content over. In dry-run the resolved action is returned untouched.
 *
 * @throws std::exception on any I/O error; SyncCancelled if @p stop fires mid-copy.
 */
SyncAction sync_file(const std::filesystem::path& source,
                     const std::filesystem::path& destination,
                     bool dry_run,
                     const std::stop_token& stop = {});

} // namespace flashsync

#endif // FLASHSYNC_ACTION_RESOLVER_HPP
