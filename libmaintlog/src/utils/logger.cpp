#include "../../include/logger.hpp"
#include "../../include/text_utils.hpp"
#include <vector>

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

namespace {
// set while this thread is inside a sink; nested calls are dropped
thread_local bool in_dispatch = false;

struct DispatchScope {
    DispatchScope() { in_dispatch = true; }
    ~DispatchScope() { in_dispatch = false; }
};
}

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(mtx_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const ILogSink* sink) {
    std::lock_guard lock(mtx_);
    std::erase_if(sinks_, [sink](const auto& s) { return s.get() == sink; });
}

void Logger::clear_sinks() {
    std::lock_guard lock(mtx_);
    sinks_.clear();
}

void Logger::log(const LogLevel level,
                 const std::string_view msg,
                 const std::string_view tag) {
    if (in_dispatch) return;
    std::lock_guard lock(mtx_);
    DispatchScope scope;
    for (const auto& sink : sinks_) {
        sink->log(level, msg, tag);
    }
}

LogLevel Logger::string_to_level(const std::string_view level) {
    const std::string name = maintlog::to_lower_copy(level);
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warning" || name == "warn") return LogLevel::Warning;
    return LogLevel::Error;
}
