#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace utils
{

// Single-permit gate with a delayed release.
//
// acquire() blocks until the permit is free and the cool-down of the previous holder
// has elapsed. releaseAfterDelay() returns immediately; the permit becomes available
// to the next waiter no earlier than `delay` later. Waiters are not served in FIFO order.
class RateLimiter
{
public:
    using Clock = std::chrono::steady_clock;

    RateLimiter() = default;

    RateLimiter(const RateLimiter&) = delete;
    RateLimiter& operator=(const RateLimiter&) = delete;

    void acquire();

    // Must be called exactly once by the holder after every acquire()
    void releaseAfterDelay(std::chrono::milliseconds delay);

    bool isHeld() const;

    // Number of permits granted since construction
    std::uint64_t grantCount() const;

    // RAII holder: acquires on construction, schedules the delayed release on destruction
    class ScopedPermit
    {
    public:
        ScopedPermit(RateLimiter& limiter, std::chrono::milliseconds delay);
        ~ScopedPermit();

        ScopedPermit(const ScopedPermit&) = delete;
        ScopedPermit& operator=(const ScopedPermit&) = delete;

    private:
        RateLimiter& limiter_;
        std::chrono::milliseconds delay_;
    };

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool held_ = false;
    Clock::time_point free_at_{};
    std::uint64_t grants_ = 0;
};

} // namespace utils
