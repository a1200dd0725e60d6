#include "../../include/retry_executor.hpp"
#include "../../include/sync_errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <condition_variable>
#include <mutex>

namespace flashsync {

namespace {
    constexpr std::chrono::milliseconds BASE_DELAY{100};
    constexpr int MAX_BACKOFF_EXPONENT = 20;
}

std::chrono::milliseconds backoff_delay(const int failed_attempt) {
    const int exponent = std::clamp(failed_attempt - 1, 0, MAX_BACKOFF_EXPONENT);
    return BASE_DELAY * (1LL << exponent);
}

bool interruptible_sleep(const std::chrono::milliseconds delay, const std::stop_token& stop) {
    std::mutex mtx;
    std::condition_variable_any cv;
    std::unique_lock lock(mtx);
    cv.wait_for(lock, stop, delay, [] { return false; });
    return !stop.stop_requested();
}

FileOutcome execute_with_retry(const std::filesystem::path& relative,
                               const int max_retries,
                               const std::stop_token& stop,
                               const AttemptFn& attempt_fn,
                               const RetryCallback& on_retry) {
    const int limit = std::max(0, max_retries);
    int attempt = 0;
    std::string last_error;

    while (attempt <= limit) {
        ++attempt;
        try {
            const SyncAction action = attempt_fn(attempt);
            if (attempt > 1) {
                Logger::log(LogLevel::Info,
                            relative.string() + " succeeded on attempt " + std::to_string(attempt),
                            "retry");
            }
            return FileOutcome{action, relative, attempt, std::nullopt};
        } catch (const SyncCancelled&) {
            throw;
        } catch (const std::exception& e) {
            last_error = e.what();
            if (attempt > limit) {
                break;
            }
            const auto delay = backoff_delay(attempt);
            Logger::log(LogLevel::Warning,
                        "Attempt " + std::to_string(attempt) + " on " + relative.string() +
                        " failed (" + last_error + "), retrying in " +
                        std::to_string(delay.count()) + "ms",
                        "retry");
            if (on_retry) {
                on_retry(attempt, delay, last_error);
            }
            if (!interruptible_sleep(delay, stop)) {
                throw SyncCancelled("Retry of " + relative.string() + " cancelled");
            }
        }
    }

    Logger::log(LogLevel::Warning,
                relative.string() + " failed after " + std::to_string(attempt) + " attempt(s): " + last_error,
                "retry");
    return FileOutcome{SyncAction::Failed, relative, attempt, last_error};
}

} // namespace flashsync
