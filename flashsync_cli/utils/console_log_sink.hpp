#ifndef FLASHSYNC_CONSOLE_LOG_SINK_HPP
#define FLASHSYNC_CONSOLE_LOG_SINK_HPP

#include "../../libflashsync/include/log_sink.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes messages at or above log_level; warnings and errors go to stderr.
 */
class ConsoleLogSink final : public flashsync::ILogSink {
public:
    flashsync::LogLevel log_level = flashsync::LogLevel::Error;

    void log(const flashsync::LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        using flashsync::LogLevel;
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        switch (level) {
            case LogLevel::Debug:
                std::cout << "[DEBUG][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Info:
                std::cout << "[INFO ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Warning:
                std::cerr << "[WARN ][" << tag << "] " << message << std::endl;
                break;
            case LogLevel::Error:
                std::cerr << "[ERROR][" << tag << "] " << message << std::endl;
                break;
        }
    }

private:
    std::mutex mtx_;
};

#endif // FLASHSYNC_CONSOLE_LOG_SINK_HPP
