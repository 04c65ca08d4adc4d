#ifndef MAINTLOG_CONSOLE_LOG_SINK_HPP
#define MAINTLOG_CONSOLE_LOG_SINK_HPP

#include "../../libmaintlog/include/log_sink.hpp"
#include "../../libmaintlog/include/logger.hpp"
#include "color.hpp"
#include <iostream>
#include <mutex>

/**
 * @brief Writes log lines at or above log_level to stderr, colored by severity.
 */
class ConsoleLogSink final : public ILogSink {
public:
    LogLevel log_level = LogLevel::Warning;

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        if (level < log_level) return;

        std::lock_guard lock(mtx_);
        const bool colored = stderr_is_tty();
        if (colored) std::cerr << color_for(level);
        std::cerr << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message;
        if (colored) std::cerr << RESET;
        std::cerr << "\n";
    }

private:
    static const char* color_for(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return CYAN;
            case LogLevel::Info:    return "";
            case LogLevel::Warning: return YELLOW;
            case LogLevel::Error:   return RED;
        }
        return "";
    }

    std::mutex mtx_;
};

#endif // MAINTLOG_CONSOLE_LOG_SINK_HPP
