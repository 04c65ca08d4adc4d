/**
 * @file logger.hpp
 * @brief Provides a static, thread-safe logging facade.
 *
 * Logger is the single entry point for logging inside libmaintlog. The
 * library never decides where messages end up: the embedding application
 * registers one or more ILogSink implementations.
 */

#ifndef MAINTLOG_LOGGER_HPP
#define MAINTLOG_LOGGER_HPP

#include "log_sink.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Static logging facade for maintlog.
 *
 * Sinks are invoked under a single mutex, so an ILogSink never sees two
 * messages at once even though normalization workers log concurrently.
 */
class Logger {
public:
    /// Takes ownership of `sink`; null is ignored.
    static void add_sink(std::unique_ptr<ILogSink> sink);

    /**
     * @brief Remove one sink previously passed to add_sink().
     * @param sink The sink to destroy; unknown pointers are ignored.
     */
    static void remove_sink(const ILogSink* sink);

    /// Destroys every registered sink.
    static void clear_sinks();

    /**
     * @brief Hands a message to every sink, in registration order.
     *
     * A sink that logs from inside its own log() call (an observer callback,
     * for instance) has that nested message dropped instead of deadlocking.
     */
    static void log(LogLevel level,
                    std::string_view msg,
                    std::string_view tag = "maintlog");

    /// Short upper-case name used as the line prefix by the CLI sinks.
    static const char* level_to_string(const LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    /// @return Level named by `level` (any case; "warn" accepted); Error when unknown.
    static LogLevel string_to_level(std::string_view level);

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

#endif // MAINTLOG_LOGGER_HPP
