#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

namespace detail
{
struct TaskState;
}

// Cancellation token for a scheduled task. Destroying a handle cancels the task.
class TaskHandle
{
public:
    TaskHandle() = default;
    explicit TaskHandle(std::shared_ptr<detail::TaskState> state);
    ~TaskHandle();

    TaskHandle(TaskHandle&& other) noexcept = default;
    TaskHandle& operator=(TaskHandle&& other) noexcept;

    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    // Stops future firings. Waits for an in-flight firing unless called from the task itself.
    void cancel();

    bool isActive() const;
    std::size_t fireCount() const;
    std::string name() const;

private:
    std::shared_ptr<detail::TaskState> state_;
};

// Runs deferred and recurring callbacks on their own threads
class Scheduler
{
public:
    using Task = std::function<void()>;

    Scheduler() = default;
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    TaskHandle schedulePeriodic(const std::string& name, std::chrono::milliseconds initialDelay,
                                std::chrono::milliseconds period, Task task);

    TaskHandle scheduleOnce(const std::string& name, std::chrono::milliseconds delay, Task task);

    // Cancels every task this scheduler created that is still alive
    void cancelAll();

private:
    TaskHandle start(const std::string& name, std::chrono::milliseconds initialDelay,
                     std::chrono::milliseconds period, bool repeat, Task task);

    std::mutex mutex_;
    std::vector<std::weak_ptr<detail::TaskState>> tasks_;
};

} // namespace utils
