/**
 * @file thread_pool.hpp
 * @brief Fixed-size worker pool used for attachment normalization.
 */

#ifndef MAINTLOG_THREAD_POOL_HPP
#define MAINTLOG_THREAD_POOL_HPP

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <vector>

namespace maintlog {

/**
 * @brief A pool of std::jthread workers fed from a FIFO queue.
 *
 * @details One pool is created per export and destroyed with it. Tasks
 * report their value or exception through the returned future. Destroying
 * the pool runs every task still queued, then joins the workers, so no
 * future is left without a result.
 */
class ThreadPool {
public:
    /**
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Queues a callable taking no arguments.
     * @return Future receiving the callable's result or exception.
     */
    template <class F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using R = std::invoke_result_t<F>;
        auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(f));
        std::future<R> result = task->get_future();
        {
            std::lock_guard lock(mutex_);
            tasks_.emplace([task] { (*task)(); });
        }
        ready_.notify_one();
        return result;
    }

    /// @return Number of worker threads.
    [[nodiscard]] size_t size() const noexcept { return workers_.size(); }

private:
    void work(std::stop_token stop);

    std::mutex mutex_;
    std::condition_variable_any ready_;
    std::queue<std::function<void()>> tasks_;
    std::vector<std::jthread> workers_; ///< Declared last: joined before the queue goes away
};

} // namespace maintlog

#endif // MAINTLOG_THREAD_POOL_HPP
