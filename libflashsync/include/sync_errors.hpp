#ifndef FLASHSYNC_SYNC_ERRORS_HPP
#define FLASHSYNC_SYNC_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace flashsync {

/**
 * @brief Bad arguments detected before any filesystem access.
 */
class ValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief The pattern string produced no pattern, or one segment is not a valid regex.
 */
class InvalidPatternError : public ValidationError {
public:
    using ValidationError::ValidationError;
};

/**
 * @brief The source root does not exist or is not a directory.
 */
class SourceNotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A stop was requested while the run was in progress.
 *
 * Kept separate from per-file failures: files completed before the request
 * keep their effects, and the caller receives no SyncResult.
 */
class SyncCancelled : public std::runtime_error {
public:
    SyncCancelled() : std::runtime_error("Synchronization cancelled") {}
    explicit SyncCancelled(const std::string& what) : std::runtime_error(what) {}
};

} // namespace flashsync

#endif // FLASHSYNC_SYNC_ERRORS_HPP
