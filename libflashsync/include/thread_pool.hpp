/**
 * @file thread_pool.hpp
 * @brief Fixed-size thread pool with cooperative cancellation.
 *
 * Used by SyncExecutor to run file operations in parallel.
 */

#ifndef FLASHSYNC_THREAD_POOL_HPP
#define FLASHSYNC_THREAD_POOL_HPP

#include <vector>
#include <queue>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <stdexcept>
#include <stop_token>
#include <thread>

namespace flashsync {

/**
 * @brief A fixed-size thread pool for executing tasks concurrently.
 *
 * @details Workers are std::jthread, joined on destruction. Every task
 * receives the pool's stop token, which is triggered by request_stop();
 * long-running tasks are expected to poll it.
 */
class ThreadPool {
public:
    /**
     * @brief Starts the worker threads.
     * @param threads Number of workers; 0 is treated as 1.
     */
    explicit ThreadPool(unsigned threads = std::thread::hardware_concurrency());

    /**
     * @brief Stops accepting work and joins the workers once the queue drains.
     */
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * @brief Enqueues a task accepting a `std::stop_token`.
     * @return A future for the task's result.
     * @throws std::runtime_error if the pool is stopping.
     */
    template<class F>
    auto enqueue(F&& f) -> std::future<std::invoke_result_t<F, std::stop_token>> {
        using return_type = std::invoke_result_t<F, std::stop_token>;
        auto task = std::make_shared<std::packaged_task<return_type(std::stop_token)>>(
            std::forward<F>(f)
        );
        {
            std::unique_lock lock(queue_mutex_);
            if (stop_) throw std::runtime_error("enqueue on stopped ThreadPool");
            ++pending_;
            tasks_.emplace([task](std::stop_token st) { (*task)(st); });
        }
        condition_.notify_one();
        return task->get_future();
    }

    /**
     * @brief Blocks until every enqueued task has finished or been discarded.
     */
    void wait_idle();

    /**
     * @brief Discards queued tasks and signals running tasks through their stop token.
     */
    void request_stop();

    [[nodiscard]] unsigned size() const { return static_cast<unsigned>(workers_.size()); }

private:
    std::mutex queue_mutex_;                ///< Protects tasks_, stop_, and pending_
    std::condition_variable_any condition_; ///< Notifies workers of new tasks or stop requests
    std::condition_variable idle_cv_;       ///< Notifies wait_idle() when pending_ is zero
    std::queue<std::function<void(std::stop_token)>> tasks_;
    bool stop_{false};
    size_t pending_{0};                     ///< Number of tasks enqueued or running
    std::stop_source task_stop_;            ///< Token handed to every task
    std::vector<std::jthread> workers_;
};

} // namespace flashsync

#endif // FLASHSYNC_THREAD_POOL_HPP
