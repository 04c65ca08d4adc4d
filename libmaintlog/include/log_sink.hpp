/**
 * @file log_sink.hpp
 * @brief Severity levels and the abstract sink interface used by Logger.
 */

#ifndef MAINTLOG_LOG_SINK_HPP
#define MAINTLOG_LOG_SINK_HPP

#include <string_view>

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel {
    Debug,   ///< Detailed diagnostic information (decoder choices, scale factors)
    Info,    ///< Normal progress of an export
    Warning, ///< Degradations: skipped records, omitted images, library warnings
    Error    ///< Fatal export failures and unexpected library errors
};

/**
 * @brief Abstract sink interface for logging.
 *
 * Implementations of ILogSink define where log messages go (console, file,
 * an observer bridge). The Logger facade fans every message out to all
 * registered sinks.
 */
struct ILogSink {
    virtual ~ILogSink() = default;

    /**
     * @brief Log a message.
     * @param level Severity level of the message.
     * @param message The message text.
     * @param tag Tag identifying the source component.
     */
    virtual void log(LogLevel level,
                     std::string_view message,
                     std::string_view tag) = 0;
};

#endif // MAINTLOG_LOG_SINK_HPP
