#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <iterator>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;

namespace
{

plog::Severity toPlog(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

const char* toString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Update:
        return "Update";
    case ErrorCategory::IPC:
        return "IPC";
    case ErrorCategory::Process:
        return "Process";
    case ErrorCategory::Login:
        return "Login";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* toString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

void ErrorReporter::ReportError(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                                const std::string& details)
{
    PLOG(toPlog(severity)) << "[" << toString(category) << "] " << message
                           << (details.empty() ? "" : " | Details: ") << details;

    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.message = message;
    report.details = details;
    report.when = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    while (s_queue.size() > kMaxQueued)
        s_queue.pop_front();
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Fatal, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    ReportError(category, ErrorSeverity::Warning, message, details);
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::size_t ErrorReporter::PendingCount()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.size();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return drained;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.empty() ? ErrorReport{} : s_queue.back();
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
}

} // namespace utils
