#ifndef MAINTLOG_FILE_LOG_SINK_HPP
#define MAINTLOG_FILE_LOG_SINK_HPP

#include "../../libmaintlog/include/log_sink.hpp"
#include "../../libmaintlog/include/logger.hpp"
#include "../../libmaintlog/include/text_utils.hpp"
#include <chrono>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <string>

// Appends "<utc time> [LEVEL][tag] message" lines to the --log-file target.
class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::filesystem::path& filename, const bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {}

    [[nodiscard]] bool is_open() const { return out_.is_open(); }

    void log(const LogLevel level,
             const std::string_view message,
             const std::string_view tag) override {
        std::string line = maintlog::format_utc(std::chrono::system_clock::now(), "%Y-%m-%dT%H:%M:%SZ");
        line += std::format(" [{}]", Logger::level_to_string(level));
        if (!tag.empty()) line += std::format("[{}]", tag);
        line += ' ';
        line += message;
        line += '\n';

        std::lock_guard lock(mtx_);
        if (!out_) return;
        out_ << line << std::flush;
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

#endif // MAINTLOG_FILE_LOG_SINK_HPP
