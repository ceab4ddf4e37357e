#pragma once

#include "BinarySwapper.hpp"
#include "HttpClient.hpp"
#include "UpdateTypes.hpp"
#include "Version.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace updater
{

struct UpdaterSettings
{
    bool autoUpdates = true;
    UpdateChannel channel = UpdateChannel::Stable;
    std::string feedUrl;
    int maxFetchRetries = 5;
    std::chrono::milliseconds checkInterval = std::chrono::hours(24);
    std::chrono::milliseconds restartDelay = std::chrono::seconds(5);
};

// Spawns the new image; returns false when it did not start
using RestartFunction = std::function<bool()>;

// Self-update orchestrator.
//
// One cycle: fetch release, compare tags ordinally, pick the asset named like the running
// binary, stage it as <exe>.new, swap, then restart. When the running build is current and
// auto-updates are on, a recurring check is armed. A failed restart disarms the updater
// for the rest of the process lifetime.
class UpdaterService
{
public:
    UpdaterService(IHttpClient& http, UpdaterSettings settings, ExecutablePaths paths, Version currentVersion,
                   RestartFunction restart, FileOps fileOps = FileOps::Default());
    ~UpdaterService();

    UpdaterService(const UpdaterService&) = delete;
    UpdaterService& operator=(const UpdaterService&) = delete;

    // Removes a stale <exe>.old. Returns false (and the updater stays unusable) when that fails.
    bool initialize(UpdateError& outError);

    // Runs one cycle synchronously on the calling thread
    CycleOutcome runCycle();

    // Cancels the recurring check; an in-flight cycle is not interrupted
    void shutdown();

    UpdateState getState() const;
    UpdateError getLastError() const;
    ReleaseDescriptor getLastRelease() const;

    bool isInitialized() const;
    bool isTimerArmed() const;
    bool isDisarmed() const;
    bool restartFailed() const;

    const Version& currentVersion() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace updater
