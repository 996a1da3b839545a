/// @file serial_executor.hpp
/// @brief Single-threaded task queue with delayed tasks
///
/// A SerialExecutor is the execution context of one coordinating component:
/// every task posted to it runs on the same dedicated thread, one at a time,
/// in submission order. State owned by the component is touched only from
/// tasks, so it needs no locking.

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace lumen {

class SerialExecutor {
public:
    using Task = std::function<void()>;
    using Clock = std::chrono::steady_clock;

    /// @param name Thread name (truncated to 15 characters)
    explicit SerialExecutor(std::string name);

    /// @brief Drains queued tasks and joins the thread
    ~SerialExecutor();

    SerialExecutor(const SerialExecutor&) = delete;
    SerialExecutor& operator=(const SerialExecutor&) = delete;
    SerialExecutor(SerialExecutor&&) = delete;
    SerialExecutor& operator=(SerialExecutor&&) = delete;

    /// @brief Queue a task
    /// @return false if the executor is shutting down and the task was dropped
    bool post(Task task);

    /// @brief Queue a task to run once the delay has elapsed
    ///
    /// Delayed tasks still pending at shutdown are discarded.
    bool postAfter(std::chrono::milliseconds delay, Task task);

    /// @brief True when called from the executor's own thread
    [[nodiscard]] bool isCurrentThread() const noexcept;

    /// @brief Finish already queued tasks, then stop the thread
    ///
    /// Must not be called from a task running on this executor.
    void shutdown();

    [[nodiscard]] bool accepting() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    void run();

    std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Task> tasks_;
    std::multimap<Clock::time_point, Task> timers_;
    bool stopping_ = false;

    std::jthread worker_;
};

}  // namespace lumen
