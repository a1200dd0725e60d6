#include "../../include/tree_scanner.hpp"
#include "../../include/sync_errors.hpp"
#include "../../include/logger.hpp"

namespace fs = std::filesystem;

namespace flashsync {

std::vector<MatchedFile> scan_tree(const fs::path& root,
                                   const PatternSet& patterns,
                                   const std::stop_token& stop) {
    std::vector<MatchedFile> result;
    std::size_t scanned = 0;

    for (const auto& entry : fs::recursive_directory_iterator(root)) {
        if (stop.stop_requested()) {
            Logger::log(LogLevel::Info, "Scan interrupted after " + std::to_string(scanned) + " files", "scanner");
            throw SyncCancelled("Scan of " + root.string() + " cancelled");
        }
        if (!entry.is_regular_file()) {
            continue;
        }
        ++scanned;

        const auto& path = entry.path();
        if (patterns.matches(path.filename().string())) {
            result.push_back(MatchedFile{path, path.lexically_relative(root)});
        }
    }

    Logger::log(LogLevel::Info,
                "Scanner matched " + std::to_string(result.size()) + " of " +
                std::to_string(scanned) + " files in " + root.string(),
                "scanner");
    return result;
}

} // namespace flashsync
