#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders. A logger instance can be registered more than once:
// later registrations add their appender to the same instance and update its severity.
class LogManager
{
public:
    struct Settings
    {
        bool append_logs = true;
        plog::Severity default_level = plog::info;
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        bool write_file = true; // false installs a console appender
        bool console_to_stderr = false;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
    };

    static bool Initialize(const Settings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

private:
    LogManager() = default;

    static void PrepareLogDirectory(const std::string& filepath);

    static bool s_initialized;
    static Settings s_settings;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
