#include "ShutdownSignal.hpp"

namespace utils
{

bool ShutdownSignal::raise()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (raised_)
            return false;
        raised_ = true;
    }
    cv_.notify_all();
    return true;
}

bool ShutdownSignal::isRaised() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return raised_;
}

void ShutdownSignal::wait() const
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return raised_; });
}

bool ShutdownSignal::waitFor(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return raised_; });
}

} // namespace utils
