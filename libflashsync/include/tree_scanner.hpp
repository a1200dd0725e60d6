#ifndef FLASHSYNC_TREE_SCANNER_HPP
#define FLASHSYNC_TREE_SCANNER_HPP

#include "pattern_set.hpp"
#include "sync_types.hpp"
#include <filesystem>
#include <stop_token>
#include <vector>

namespace flashsync {

/**
 * @brief Collect every regular file below @p root whose base name matches @p patterns.
 *
 * Directory names never take part in matching. The order of the result is
 * the filesystem enumeration order.
 *
 * @throws SyncCancelled if @p stop is triggered during the walk (no partial list).
 * @throws std::filesystem::filesystem_error if the tree cannot be enumerated.
 */
std::vector<MatchedFile> scan_tree(const std::filesystem::path& root,
                                   const PatternSet& patterns,
                                   const std::stop_token& stop = {});

} // namespace flashsync

#endif // FLASHSYNC_TREE_SCANNER_HPP
