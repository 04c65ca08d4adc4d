#include "../../include/thread_pool.hpp"
#include "../../include/logger.hpp"
#include <string>

namespace maintlog {

ThreadPool::ThreadPool(unsigned threads) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (unsigned i = 0; i < threads; ++i) {
        workers_.emplace_back([this](const std::stop_token stop) { work(stop); });
    }
    Logger::log(LogLevel::Debug, "Started " + std::to_string(threads) + " normalization workers", "thread_pool");
}

ThreadPool::~ThreadPool() {
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    workers_.clear(); // joins
}

void ThreadPool::work(const std::stop_token stop) {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock lock(mutex_);
            // a stop request still lets the queue drain
            ready_.wait(lock, stop, [this] { return !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        task();
    }
}

} // namespace maintlog
