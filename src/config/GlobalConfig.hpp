#pragma once

#include "updater/UpdateTypes.hpp"

#include <chrono>
#include <cstdint>
#include <string>

class ConfigManager;

// Process-wide settings read from config/steward.toml
struct GlobalConfig
{
    // [updates]
    bool autoUpdates = true;
    updater::UpdateChannel updateChannel = updater::UpdateChannel::Stable;
    std::string releaseFeedUrl = "https://api.github.com/repos/steward-project/steward/releases";
    int checkIntervalHours = 24;
    int restartDelaySeconds = 5;
    int maxFetchRetries = 5;

    // [login]
    int loginLimiterDelaySeconds = 10;

    // [ipc]
    std::string ipcHost = "127.0.0.1";
    int ipcPort = 1242;
    int ipcResponseTimeoutMs = 30000;

    // [logging]
    int logLevel = 4;
    bool appendLogs = true;
    std::string logFile = "logs/steward.log";

    // [process]
    int shutdownGraceSeconds = 5;

    std::chrono::milliseconds loginLimiterDelay() const { return std::chrono::seconds(loginLimiterDelaySeconds); }
    std::int64_t loginLimiterDelayMs() const { return loginLimiterDelay().count(); }
    std::chrono::milliseconds checkInterval() const { return std::chrono::hours(checkIntervalHours); }
    std::chrono::milliseconds restartDelay() const { return std::chrono::seconds(restartDelaySeconds); }
    std::chrono::milliseconds shutdownGrace() const { return std::chrono::seconds(shutdownGraceSeconds); }

    // Registers the [updates], [login], [ipc], [logging] and [process] sections
    static void Register(ConfigManager& manager, GlobalConfig& config);
};
