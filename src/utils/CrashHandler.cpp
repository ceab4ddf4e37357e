#include "CrashHandler.hpp"
#include <plog/Log.h>
#include <cpptrace/cpptrace.hpp>
#include <atomic>
#include <cstdlib>
#include <exception>
#include <string>

static std::atomic<void (*)()> g_fatal_cleanup{ nullptr };
static std::terminate_handler g_prev_terminate = nullptr;
static std::atomic<bool> g_installed{ false };

static thread_local const char* g_current_operation = nullptr;

static std::string DescribeCurrentException()
{
    auto current = std::current_exception();
    if (!current)
        return "std::terminate called without an active exception";

    try
    {
        std::rethrow_exception(current);
    }
    catch (const std::exception& e)
    {
        return std::string("Unhandled exception: ") + e.what();
    }
    catch (...)
    {
        return "Unhandled exception of unknown type";
    }
}

static void CrashTerminateHandler()
{
    PLOG_FATAL << "=== PROCESS TERMINATING ===";
    PLOG_FATAL << DescribeCurrentException();
    if (g_current_operation)
    {
        PLOG_FATAL << "While: " << g_current_operation;
    }
    PLOG_FATAL << "Stack trace:\n" << cpptrace::generate_trace(1).to_string();

    if (auto fn = g_fatal_cleanup.load(std::memory_order_acquire))
    {
        fn();
    }

    if (g_prev_terminate)
    {
        g_prev_terminate();
        return;
    }
    std::abort();
}

void utils::CrashHandler::Initialize()
{
    if (g_installed.exchange(true))
        return;

    g_prev_terminate = std::set_terminate(CrashTerminateHandler);
    PLOG_INFO << "Crash handler installed";
}

void utils::CrashHandler::SetContext(const char* operation) { g_current_operation = operation; }

void utils::CrashHandler::RegisterFatalCleanup(void (*fn)()) { g_fatal_cleanup.store(fn, std::memory_order_release); }
