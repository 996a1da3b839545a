/// @file thread_pool.hpp
/// @brief Thread pool implementation using std::jthread and stop_token
///
/// Backs both the scheduling/IO pool and the decode execution pool of the
/// loader.

#pragma once

#include <atomic>
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

namespace lumen {

/// @brief Configuration for thread pool
struct ThreadPoolConfig {
    size_t num_threads = 0;  // 0 = hardware_concurrency()
    std::string name_prefix = "lumen-worker";
};

/// @brief A thread pool using std::jthread
///
/// Features:
/// - Automatic thread count based on hardware_concurrency
/// - Cooperative shutdown via std::stop_token
/// - Returns std::future for task results
class ThreadPool {
public:
    /// @brief Create a thread pool with default configuration
    ThreadPool();

    /// @brief Create a thread pool with custom configuration
    explicit ThreadPool(ThreadPoolConfig config);

    /// @brief Destructor - requests stop and waits for all threads
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    /// @brief Submit a task to the pool
    /// @param task Callable to execute
    /// @return Future for the task result
    template <std::invocable F>
    [[nodiscard]] auto submit(F&& task) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto packaged = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(task));

        auto future = packaged->get_future();

        {
            std::lock_guard lock(queue_mutex_);
            if (stop_source_.stop_requested()) {
                // Pool is stopping, run on the caller so the future still resolves
                packaged->operator()();
                return future;
            }

            tasks_.emplace([packaged = std::move(packaged)]() { (*packaged)(); });
        }

        queue_cv_.notify_one();
        return future;
    }

    /// @brief Submit a task whose result is not needed
    void post(std::function<void()> task);

    /// @brief Get the number of worker threads
    [[nodiscard]] size_t workerCount() const noexcept { return workers_.size(); }

    /// @brief Get the number of pending tasks
    [[nodiscard]] size_t pendingCount() const {
        std::lock_guard lock(queue_mutex_);
        return tasks_.size();
    }

    /// @brief Check if the pool is stopping
    [[nodiscard]] bool stopping() const noexcept { return stop_source_.stop_requested(); }

    /// @brief Stop accepting work, finish queued tasks and join the workers
    void shutdown();

    /// @brief Wait for all pending tasks to complete
    ///
    /// Note: Does not prevent new tasks from being submitted.
    void waitIdle();

private:
    void workerLoop(std::stop_token stop_token, size_t worker_id);

    std::stop_source stop_source_;

    mutable std::mutex queue_mutex_;
    std::condition_variable_any queue_cv_;
    std::queue<std::function<void()>> tasks_;

    size_t active_tasks_ = 0;
    std::condition_variable_any idle_cv_;

    ThreadPoolConfig config_;

    // Declared last so workers are joined before the queue is destroyed
    std::vector<std::jthread> workers_;
};

}  // namespace lumen
