#pragma once

#include <string>
#include <vector>

namespace updater
{

// Release channel selected in configuration
enum class UpdateChannel
{
    Unknown, // Update checking disabled
    Stable, // Single "latest" release
    Experimental // First entry of the full release list
};

// Update cycle state machine
enum class UpdateState
{
    Idle, // No update activity
    CheckingVersion, // Fetching the feed and comparing versions
    UpToDate, // Running version is equal or newer
    AwaitingAssetMatch, // Looking for the asset named like the running binary
    Downloading, // Staging <exe>.new
    Swapping, // current -> old, new -> current
    Done, // Swap succeeded, restart requested
    RolledBack // Swap failed, previous binary restored
};

// How one update cycle ended
enum class CycleOutcome
{
    Disabled, // Channel is Unknown or the updater was disarmed
    Busy, // Another cycle is in flight
    UpToDate,
    UpdateAvailable, // Newer release found, auto-updates off
    Aborted, // Feed, asset or download failure; live binary untouched
    RolledBack, // Swap failed and the previous binary was restored
    RollbackFailed, // Swap failed and the restore failed too
    Restarted, // Swap succeeded and the new image was spawned
    RestartFailed // Swap succeeded but the new image did not start
};

struct AssetDescriptor
{
    std::string name; // File name of the asset
    std::string downloadUrl; // Direct download URL
};

struct ReleaseDescriptor
{
    std::string tag; // Compared ordinally against the running version
    std::vector<AssetDescriptor> assets;
};

enum class UpdateErrorCode
{
    None,
    Network, // Feed unreachable or empty after the retry limit
    Parse, // Malformed feed payload
    EmptyFeed, // No usable release entry
    AssetNotFound, // No asset matches the running binary
    Download, // I/O failure while staging the new binary
    Swap, // Rename failure during activation
    RollbackFailed, // Swap failed and recovery failed too
    RestartFailed, // New image failed to start after a successful swap
    StaleBackup // Leftover <exe>.old could not be removed
};

// Error information for failed update steps
struct UpdateError
{
    UpdateErrorCode code = UpdateErrorCode::None;
    std::string message; // Human-readable error message
    std::string technicalInfo; // Technical details for logging

    UpdateError() = default;

    UpdateError(UpdateErrorCode c, const std::string& msg)
        : code(c)
        , message(msg)
    {
    }

    UpdateError(UpdateErrorCode c, const std::string& msg, const std::string& tech)
        : code(c)
        , message(msg)
        , technicalInfo(tech)
    {
    }

    bool isError() const { return code != UpdateErrorCode::None; }
};

const char* toString(UpdateChannel channel);
const char* toString(UpdateState state);
const char* toString(CycleOutcome outcome);
const char* toString(UpdateErrorCode code);

// "stable", "experimental"; anything else maps to Unknown
UpdateChannel parseUpdateChannel(const std::string& text);

} // namespace updater
