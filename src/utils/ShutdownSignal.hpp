#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace utils
{

// Process-wide one-shot latch. Once raised it never resets.
class ShutdownSignal
{
public:
    ShutdownSignal() = default;

    ShutdownSignal(const ShutdownSignal&) = delete;
    ShutdownSignal& operator=(const ShutdownSignal&) = delete;

    // Returns true only for the call that actually raised the latch
    bool raise();

    bool isRaised() const;

    void wait() const;

    // Returns true if the latch was raised before the timeout expired
    bool waitFor(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool raised_ = false;
};

} // namespace utils
