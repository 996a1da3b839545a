/// @file serial_executor.cpp
/// @brief SerialExecutor implementation

#include "serial_executor.hpp"

#include <pthread.h>

#include "logger.hpp"

namespace lumen {

SerialExecutor::SerialExecutor(std::string name) : name_(std::move(name)) {
    worker_ = std::jthread([this] { run(); });
}

SerialExecutor::~SerialExecutor() {
    shutdown();
}

bool SerialExecutor::post(Task task) {
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool SerialExecutor::postAfter(std::chrono::milliseconds delay, Task task) {
    if (delay.count() <= 0) {
        return post(std::move(task));
    }
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            return false;
        }
        timers_.emplace(Clock::now() + delay, std::move(task));
    }
    cv_.notify_one();
    return true;
}

bool SerialExecutor::isCurrentThread() const noexcept {
    return std::this_thread::get_id() == worker_.get_id();
}

bool SerialExecutor::accepting() const {
    std::lock_guard lock(mutex_);
    return !stopping_;
}

void SerialExecutor::shutdown() {
    {
        std::lock_guard lock(mutex_);
        if (stopping_ && !worker_.joinable()) {
            return;
        }
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();

    if (isCurrentThread()) {
        LOG_ERROR("SerialExecutor[{}]: shutdown requested from its own thread", name_);
        return;
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

void SerialExecutor::run() {
    pthread_setname_np(pthread_self(), name_.substr(0, 15).c_str());

    while (true) {
        Task task;

        {
            std::unique_lock lock(mutex_);

            while (true) {
                // Promote timers that are due
                auto now = Clock::now();
                while (!timers_.empty() && timers_.begin()->first <= now) {
                    tasks_.push_back(std::move(timers_.begin()->second));
                    timers_.erase(timers_.begin());
                }

                if (!tasks_.empty()) {
                    break;
                }
                if (stopping_) {
                    return;
                }
                if (timers_.empty()) {
                    cv_.wait(lock);
                } else {
                    cv_.wait_until(lock, timers_.begin()->first);
                }
            }

            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("SerialExecutor[{}]: task failed: {}", name_, e.what());
        }
    }
}

}  // namespace lumen
