#include "UpdateTypes.hpp"

#include <algorithm>
#include <cctype>

namespace updater
{

const char* toString(UpdateChannel channel)
{
    switch (channel)
    {
    case UpdateChannel::Stable:
        return "stable";
    case UpdateChannel::Experimental:
        return "experimental";
    case UpdateChannel::Unknown:
    default:
        return "none";
    }
}

const char* toString(UpdateState state)
{
    switch (state)
    {
    case UpdateState::Idle:
        return "Idle";
    case UpdateState::CheckingVersion:
        return "CheckingVersion";
    case UpdateState::UpToDate:
        return "UpToDate";
    case UpdateState::AwaitingAssetMatch:
        return "AwaitingAssetMatch";
    case UpdateState::Downloading:
        return "Downloading";
    case UpdateState::Swapping:
        return "Swapping";
    case UpdateState::Done:
        return "Done";
    case UpdateState::RolledBack:
        return "RolledBack";
    default:
        return "Unknown";
    }
}

const char* toString(CycleOutcome outcome)
{
    switch (outcome)
    {
    case CycleOutcome::Disabled:
        return "updates disabled";
    case CycleOutcome::Busy:
        return "update already in progress";
    case CycleOutcome::UpToDate:
        return "up to date";
    case CycleOutcome::UpdateAvailable:
        return "new version available";
    case CycleOutcome::Aborted:
        return "update aborted";
    case CycleOutcome::RolledBack:
        return "update rolled back";
    case CycleOutcome::RollbackFailed:
        return "rollback failed";
    case CycleOutcome::Restarted:
        return "restarting";
    case CycleOutcome::RestartFailed:
        return "restart failed";
    default:
        return "unknown";
    }
}

const char* toString(UpdateErrorCode code)
{
    switch (code)
    {
    case UpdateErrorCode::None:
        return "None";
    case UpdateErrorCode::Network:
        return "NetworkError";
    case UpdateErrorCode::Parse:
        return "ParseError";
    case UpdateErrorCode::EmptyFeed:
        return "EmptyFeedError";
    case UpdateErrorCode::AssetNotFound:
        return "AssetNotFoundError";
    case UpdateErrorCode::Download:
        return "DownloadError";
    case UpdateErrorCode::Swap:
        return "SwapError";
    case UpdateErrorCode::RollbackFailed:
        return "RollbackFailedError";
    case UpdateErrorCode::RestartFailed:
        return "RestartFailedError";
    case UpdateErrorCode::StaleBackup:
        return "StaleBackupError";
    default:
        return "Unknown";
    }
}

UpdateChannel parseUpdateChannel(const std::string& text)
{
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "stable")
        return UpdateChannel::Stable;
    if (lowered == "experimental")
        return UpdateChannel::Experimental;
    return UpdateChannel::Unknown;
}

} // namespace updater
