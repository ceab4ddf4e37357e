#pragma once

#include <atomic>

namespace utils
{

/**
 * Crash handler for unhandled exceptions.
 *
 * Intercepts std::terminate(), logs the in-flight exception together with a
 * stack trace captured via cpptrace, then hands over to the previous handler.
 */
class CrashHandler
{
public:
    /// Installs the terminate handler
    static void Initialize();

    /// Sets thread-local context string to be included in crash reports
    static void SetContext(const char* operation);

    /// Registers a cleanup function to be called before crash termination (e.g., flush buffers)
    static void RegisterFatalCleanup(void (*fn)());
};

} // namespace utils
