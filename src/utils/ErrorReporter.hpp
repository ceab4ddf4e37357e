#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // Start-up, working directory, logging
    Configuration,  // TOML parsing, invalid values
    Update,         // Release feed, download, binary swap
    IPC,            // Command server and client
    Process,        // Restart, shutdown
    Login,          // Login pacing and prompts
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // Degraded, the daemon carries on
    Error,   // An operation failed, the daemon carries on
    Fatal    // No further automated recovery is possible
};

const char* toString(ErrorCategory category);
const char* toString(ErrorSeverity severity);

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;
    std::string details;
    std::chrono::system_clock::time_point when{};

    bool isFatal() const { return severity == ErrorSeverity::Fatal; }
};

/**
 * @brief Thread-safe warning channel shared by every subsystem
 *
 * Reports are written to plog at the matching severity and kept in a bounded queue
 * so that the `status` command (and tests) can show what went wrong recently.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Update,
 *                                "Could not check latest version",
 *                                "feed returned an empty body");
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                            const std::string& details = "");

    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    static bool HasPendingErrors();
    static std::size_t PendingCount();

    /**
     * @brief Drains the queue, oldest report first
     */
    static std::vector<ErrorReport> GetPendingErrors();

    // Most recent report, or a default Info report when the queue is empty
    static ErrorReport GetLastError();

    static void ClearErrors();

    static constexpr std::size_t kMaxQueued = 100;

private:
    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace utils
