#pragma once

#include "InteractiveConsole.hpp"
#include "ModeSelector.hpp"
#include "WorkerRegistry.hpp"
#include "config/GlobalConfig.hpp"
#include "utils/RateLimiter.hpp"
#include "utils/ShutdownSignal.hpp"

namespace app
{

// Process-wide state shared by every component. Built once before any worker starts
// and passed by reference; lives until the process exits.
struct RuntimeContext
{
    GlobalConfig config;
    OperatingMode mode = OperatingMode::Normal;

    utils::RateLimiter loginLimiter;
    utils::ShutdownSignal shutdown;
    InteractiveConsole console;
    WorkerRegistry workers;

    // Paces remote logins: blocks until this caller holds the permit, which is handed
    // back after the configured cool-down
    void limitLoginRequests()
    {
        loginLimiter.acquire();
        loginLimiter.releaseAfterDelay(config.loginLimiterDelay());
    }
};

} // namespace app
