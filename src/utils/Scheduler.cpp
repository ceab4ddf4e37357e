#include "Scheduler.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <thread>

namespace utils
{

namespace detail
{

struct TaskState
{
    std::string name;
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
    std::atomic<bool> finished{ false };
    std::atomic<std::size_t> fires{ 0 };

    std::mutex join_mutex;
    std::thread thread;

    void cancel()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            cancelled = true;
        }
        cv.notify_all();

        std::thread worker;
        {
            std::lock_guard<std::mutex> join_lock(join_mutex);
            // Cancelled from its own callback: the loop exits after the callback returns
            if (!thread.joinable() || thread.get_id() == std::this_thread::get_id())
                return;
            worker = std::move(thread);
        }
        worker.join();
    }

    // Called by the task thread on exit; a thread nobody is joining releases itself
    void release()
    {
        std::lock_guard<std::mutex> join_lock(join_mutex);
        if (thread.joinable())
            thread.detach();
    }
};

} // namespace detail

TaskHandle::TaskHandle(std::shared_ptr<detail::TaskState> state)
    : state_(std::move(state))
{
}

TaskHandle::~TaskHandle() { cancel(); }

TaskHandle& TaskHandle::operator=(TaskHandle&& other) noexcept
{
    if (this != &other)
    {
        cancel();
        state_ = std::move(other.state_);
    }
    return *this;
}

void TaskHandle::cancel()
{
    if (state_)
    {
        state_->cancel();
        state_.reset();
    }
}

bool TaskHandle::isActive() const
{
    if (!state_)
        return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return !state_->cancelled && !state_->finished.load();
}

std::size_t TaskHandle::fireCount() const { return state_ ? state_->fires.load() : 0; }

std::string TaskHandle::name() const { return state_ ? state_->name : std::string(); }

Scheduler::~Scheduler() { cancelAll(); }

TaskHandle Scheduler::schedulePeriodic(const std::string& name, std::chrono::milliseconds initialDelay,
                                       std::chrono::milliseconds period, Task task)
{
    return start(name, initialDelay, period, true, std::move(task));
}

TaskHandle Scheduler::scheduleOnce(const std::string& name, std::chrono::milliseconds delay, Task task)
{
    return start(name, delay, std::chrono::milliseconds(0), false, std::move(task));
}

void Scheduler::cancelAll()
{
    std::vector<std::weak_ptr<detail::TaskState>> tasks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks.swap(tasks_);
    }

    for (auto& weak : tasks)
    {
        if (auto state = weak.lock())
        {
            state->cancel();
        }
    }
}

TaskHandle Scheduler::start(const std::string& name, std::chrono::milliseconds initialDelay,
                            std::chrono::milliseconds period, bool repeat, Task task)
{
    auto state = std::make_shared<detail::TaskState>();
    state->name = name;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.erase(std::remove_if(tasks_.begin(), tasks_.end(),
                                    [](const std::weak_ptr<detail::TaskState>& w) { return w.expired(); }),
                     tasks_.end());
        tasks_.push_back(state);
    }

    std::lock_guard<std::mutex> join_lock(state->join_mutex);
    state->thread = std::thread(
        [state, initialDelay, period, repeat, task = std::move(task)]()
        {
            auto delay = initialDelay;
            while (true)
            {
                {
                    std::unique_lock<std::mutex> lock(state->mutex);
                    if (state->cv.wait_for(lock, delay, [&state] { return state->cancelled; }))
                        break;
                }

                ++state->fires;
                try
                {
                    task();
                }
                catch (const std::exception& e)
                {
                    PLOG_ERROR << "Scheduled task '" << state->name << "' threw: " << e.what();
                }

                if (!repeat)
                    break;
                delay = period;
            }
            state->finished = true;
            state->release();
        });

    PLOG_DEBUG << "Scheduled task '" << name << "' (delay " << initialDelay.count() << " ms"
               << (repeat ? ", period " + std::to_string(period.count()) + " ms)" : ")");
    return TaskHandle(state);
}

} // namespace utils
