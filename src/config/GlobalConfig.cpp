#include "GlobalConfig.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>

namespace
{

// Reads an integer key, falling back to the current value when absent or out of range
void readInt(const toml::table& section, const char* sectionName, const char* key, int minValue, int maxValue,
             int& target)
{
    auto value = section[key].value<int64_t>();
    if (!value)
        return;

    if (*value < minValue || *value > maxValue)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            std::string("Ignoring out-of-range value for ") + sectionName + "." + key,
                                            "got " + std::to_string(*value) + ", expected " +
                                                std::to_string(minValue) + ".." + std::to_string(maxValue));
        return;
    }
    target = static_cast<int>(*value);
}

} // namespace

void GlobalConfig::Register(ConfigManager& manager, GlobalConfig& config)
{
    manager.registerTable(
        "updates",
        { [&config](const toml::table& t)
          {
              config.autoUpdates = t["auto_updates"].value_or(config.autoUpdates);
              if (auto channel = t["channel"].value<std::string>())
              {
                  config.updateChannel = updater::parseUpdateChannel(*channel);
              }
              config.releaseFeedUrl = t["feed_url"].value_or(config.releaseFeedUrl);
              readInt(t, "updates", "check_interval_hours", 1, 24 * 365, config.checkIntervalHours);
              readInt(t, "updates", "restart_delay_seconds", 0, 600, config.restartDelaySeconds);
              readInt(t, "updates", "max_fetch_retries", 1, 100, config.maxFetchRetries);
          } },
        { "auto_updates", "channel", "feed_url", "check_interval_hours", "restart_delay_seconds",
          "max_fetch_retries" });

    manager.registerTable("login",
                          { [&config](const toml::table& t)
                            { readInt(t, "login", "limiter_delay_seconds", 0, 3600, config.loginLimiterDelaySeconds); } },
                          { "limiter_delay_seconds" });

    manager.registerTable(
        "ipc",
        { [&config](const toml::table& t)
          {
              config.ipcHost = t["host"].value_or(config.ipcHost);
              readInt(t, "ipc", "port", 1, 65535, config.ipcPort);
              readInt(t, "ipc", "response_timeout_ms", 100, 3600 * 1000, config.ipcResponseTimeoutMs);
          } },
        { "host", "port", "response_timeout_ms" });

    manager.registerTable(
        "logging",
        { [&config](const toml::table& t)
          {
              readInt(t, "logging", "level", 0, 6, config.logLevel);
              config.appendLogs = t["append"].value_or(config.appendLogs);
              config.logFile = t["file"].value_or(config.logFile);
          } },
        { "level", "append", "file" });

    manager.registerTable("process",
                          { [&config](const toml::table& t)
                            { readInt(t, "process", "shutdown_grace_seconds", 0, 600, config.shutdownGraceSeconds); } },
                          { "shutdown_grace_seconds" });
}
