/// @file thread_pool.hpp
/// @brief Fixed-size worker pool with cooperative cancellation

#pragma once

#include <concepts>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stop_token>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace laxy {

struct ThreadPoolConfig {
    size_t num_threads = 0;  // 0 = hardware_concurrency()
    std::string name_prefix = "laxy-worker";
};

/// @brief Worker pool on std::jthread
///
/// The engine owns one pool for submitted operations; batch execution
/// creates short-lived pools sized to the batch's worker bound. Once
/// requestStop() has been called, new tasks run inline on the caller so
/// their futures are always satisfied. The destructor drains the queue.
class ThreadPool {
public:
    ThreadPool();
    explicit ThreadPool(ThreadPoolConfig config);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Queue @p task; exceptions surface through the future
    template <std::invocable F>
    [[nodiscard]] auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;
        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));
        auto future = packaged->get_future();
        enqueue([packaged = std::move(packaged)]() { (*packaged)(); });
        return future;
    }

    /// @brief Queue @p task with the pool's stop token
    template <std::invocable<std::stop_token> F>
    [[nodiscard]] auto submitCancellable(F&& task)
        -> std::future<std::invoke_result_t<F, std::stop_token>> {
        return submit([task = std::forward<F>(task), stop = stop_source_.get_token()]() mutable {
            return task(stop);
        });
    }

    [[nodiscard]] size_t workerCount() const noexcept { return workers_.size(); }

    /// @brief Tasks waiting for a worker
    [[nodiscard]] size_t pendingCount() const {
        std::lock_guard lock(queue_mutex_);
        return tasks_.size();
    }

    /// @brief Tasks currently running on a worker
    [[nodiscard]] size_t activeCount() const {
        std::lock_guard lock(queue_mutex_);
        return active_tasks_;
    }

    [[nodiscard]] bool stopping() const noexcept { return stop_source_.stop_requested(); }

    /// @brief Signal the stop token handed to cancellable tasks (does not wait)
    void requestStop() noexcept {
        stop_source_.request_stop();
        queue_cv_.notify_all();
    }

    /// @brief Block until the queue is empty and no task is running
    void waitIdle();

private:
    void enqueue(std::function<void()> task);
    void workerLoop(std::stop_token stop_token, size_t worker_id);

    std::vector<std::jthread> workers_;
    std::stop_source stop_source_;

    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::queue<std::function<void()>> tasks_;

    size_t active_tasks_ = 0;  // guarded by queue_mutex_
    std::condition_variable_any idle_cv_;

    ThreadPoolConfig config_;
};

}  // namespace laxy
