/// @file thread_pool.cpp
/// @brief Thread pool implementation

#include "thread_pool.hpp"

#include <pthread.h>

#include <fmt/format.h>

#include "logger.hpp"

namespace lumen {

ThreadPool::ThreadPool() : ThreadPool(ThreadPoolConfig{}) {
}

ThreadPool::ThreadPool(ThreadPoolConfig config) : config_(std::move(config)) {
    size_t num_threads = config_.num_threads;
    if (num_threads == 0) {
        num_threads = std::thread::hardware_concurrency();
        if (num_threads == 0) {
            num_threads = 4;  // Fallback
        }
    }

    workers_.reserve(num_threads);

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this, i](std::stop_token stop_token) { workerLoop(stop_token, i); });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::post(std::function<void()> task) {
    {
        std::lock_guard lock(queue_mutex_);
        if (!stop_source_.stop_requested()) {
            tasks_.push(std::move(task));
            task = nullptr;
        }
    }

    if (task) {
        task();
        return;
    }
    queue_cv_.notify_one();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(queue_mutex_);
        stop_source_.request_stop();
    }
    for (auto& worker : workers_) {
        worker.request_stop();
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }
}

void ThreadPool::workerLoop(std::stop_token stop_token, size_t worker_id) {
    // Linux limits thread names to 15 characters
    std::string thread_name = fmt::format("{}-{}", config_.name_prefix, worker_id).substr(0, 15);
    pthread_setname_np(pthread_self(), thread_name.c_str());

    while (true) {
        std::function<void()> task;

        {
            std::unique_lock lock(queue_mutex_);

            // Wait for a task or stop request
            queue_cv_.wait(lock, stop_token, [this] { return !tasks_.empty(); });

            // Queued work is finished before the worker exits
            if (tasks_.empty()) {
                if (stop_token.stop_requested()) {
                    break;
                }
                continue;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_tasks_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("{}: task failed: {}", thread_name, e.what());
        }

        {
            std::lock_guard lock(queue_mutex_);
            --active_tasks_;
        }
        idle_cv_.notify_all();
    }
}

void ThreadPool::waitIdle() {
    std::unique_lock lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && active_tasks_ == 0; });
}

}  // namespace lumen
