/**
 * @file retry_executor.hpp
 * @brief Bounded retry loop with exponential backoff for one file.
 */

#ifndef FLASHSYNC_RETRY_EXECUTOR_HPP
#define FLASHSYNC_RETRY_EXECUTOR_HPP

#include "sync_types.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <stop_token>
#include <string>

namespace flashsync {

/**
 * @brief One attempt at synchronizing a file.
 *
 * Receives the 1-based attempt number and returns the action performed (or,
 * in dry-run, the action that would have been performed). Any
 * std::exception it throws counts as a failed attempt, except SyncCancelled.
 */
using AttemptFn = std::function<SyncAction(int attempt)>;

/**
 * @brief Notified before every backoff sleep.
 */
using RetryCallback = std::function<void(int failed_attempt,
                                         std::chrono::milliseconds delay,
                                         const std::string& error)>;

/**
 * @brief Delay after the given failed attempt: 100ms * 2^(attempt-1).
 *
 * The exponent is clamped so very large retry counts cannot overflow.
 */
std::chrono::milliseconds backoff_delay(int failed_attempt);

/**
 * @brief Sleep for @p delay unless @p stop fires first.
 * @return false if the sleep was cut short by a stop request.
 */
bool interruptible_sleep(std::chrono::milliseconds delay, const std::stop_token& stop);

/**
 * @brief Run @p attempt_fn until it succeeds or @p max_retries extra attempts are used up.
 *
 * @details States: Attempting -> Succeeded | RetryWait | Failed.
 * With max_retries == 0 the function is called exactly once and never sleeps.
 * The returned outcome carries the number of attempts consumed; on failure it
 * also carries the message of the last exception.
 *
 * @throws SyncCancelled if @p attempt_fn throws it, or if @p stop fires during a backoff.
 */
FileOutcome execute_with_retry(const std::filesystem::path& relative,
                               int max_retries,
                               const std::stop_token& stop,
                               const AttemptFn& attempt_fn,
                               const RetryCallback& on_retry = {});

} // namespace flashsync

#endif // FLASHSYNC_RETRY_EXECUTOR_HPP
