#include "RateLimiter.hpp"

namespace utils
{

void RateLimiter::acquire()
{
    std::unique_lock<std::mutex> lock(mutex_);
    while (true)
    {
        if (held_)
        {
            cv_.wait(lock);
            continue;
        }

        if (Clock::now() < free_at_)
        {
            cv_.wait_until(lock, free_at_);
            continue;
        }

        held_ = true;
        ++grants_;
        return;
    }
}

void RateLimiter::releaseAfterDelay(std::chrono::milliseconds delay)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        held_ = false;
        free_at_ = Clock::now() + (delay.count() > 0 ? delay : std::chrono::milliseconds(0));
    }
    // Waiters re-arm on free_at_ instead of grabbing the permit right away
    cv_.notify_all();
}

bool RateLimiter::isHeld() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return held_ || Clock::now() < free_at_;
}

std::uint64_t RateLimiter::grantCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return grants_;
}

RateLimiter::ScopedPermit::ScopedPermit(RateLimiter& limiter, std::chrono::milliseconds delay)
    : limiter_(limiter)
    , delay_(delay)
{
    limiter_.acquire();
}

RateLimiter::ScopedPermit::~ScopedPermit() { limiter_.releaseAfterDelay(delay_); }

} // namespace utils
