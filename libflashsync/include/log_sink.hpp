#ifndef FLASHSYNC_LOG_SINK_HPP
#define FLASHSYNC_LOG_SINK_HPP

#include <string_view>

namespace flashsync {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Per-file decisions and retry details
    Info,    ///< Run start/end, scan totals
    Warning, ///< Retried or failed files
    Error    ///< Aborted runs
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations decide where messages go (console, file, a GUI log view).
 * The Logger facade fans every message out to all installed sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Component that produced the message.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

} // namespace flashsync

#endif // FLASHSYNC_LOG_SINK_HPP
