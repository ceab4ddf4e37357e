#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
LogManager::Settings LogManager::s_settings;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const Settings& settings)
{
    if (s_initialized)
        return true;

    s_settings = settings;
    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        std::unique_ptr<plog::IAppender> appender;
        if (config.write_file)
        {
            PrepareLogDirectory(config.filepath);
            if (!config.append_override.value_or(s_settings.append_logs))
            {
                std::ofstream(config.filepath, std::ios::trunc).close();
            }
            appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));
        }
        else
        {
            appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(
                config.console_to_stderr ? plog::streamStdErr : plog::streamStdOut);
        }

        plog::Severity level = config.level_override.value_or(s_settings.default_level);
        plog::init<InstanceId>(level, appender.get()).setMaxSeverity(level);

        // plog keeps raw pointers to its appenders until exit
        s_appenders.push_back(std::move(appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
