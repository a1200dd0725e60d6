/**
 * @file logger.hpp
 * @brief Static, thread-safe logging facade used across libflashsync.
 */

#ifndef FLASHSYNC_LOGGER_HPP
#define FLASHSYNC_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flashsync {

/**
 * @brief Static logging facade.
 *
 * Delegates every message to the registered ILogSink implementations.
 * With no sinks installed, logging is a no-op.
 */
class Logger {
public:
    /**
     * @brief Add a sink. The Logger takes ownership.
     */
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove all configured sinks.
     */
    static void clear_sinks();

    /**
     * @brief True if at least one sink is installed.
     *
     * Hot paths check this before formatting per-file debug messages.
     */
    static bool has_sinks();

    /**
     * @brief Log a message to all registered sinks.
     * @param level Severity level.
     * @param msg Message text.
     * @param tag Optional tag (default: "flashsync").
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "flashsync");

    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /**
     * @brief Parse a level name ("DEBUG", "INFO", "WARNING", "ERROR").
     * Case-sensitive. Unknown names map to LogLevel::Error.
     */
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG")
            return LogLevel::Debug;
        if (level == "INFO")
            return LogLevel::Info;
        if (level == "WARNING")
            return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace flashsync

#endif // FLASHSYNC_LOGGER_HPP
