#include "UpdaterService.hpp"
#include "AssetDownloader.hpp"
#include "ReleaseClient.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Scheduler.hpp"

#include <plog/Log.h>

#include <atomic>
#include <mutex>
#include <thread>

namespace updater
{

struct UpdaterService::Impl
{
    UpdaterSettings settings;
    Version currentVersion;
    RestartFunction restart;

    ReleaseClient releaseClient;
    AssetDownloader downloader;
    BinarySwapper swapper;

    std::atomic<UpdateState> state{ UpdateState::Idle };
    std::atomic<bool> cycleRunning{ false };
    std::atomic<bool> initialized{ false };
    std::atomic<bool> disarmed{ false };
    std::atomic<bool> restartFailed{ false };
    std::atomic<bool> stopping{ false };

    mutable std::mutex infoMutex;
    UpdateError lastError;
    ReleaseDescriptor lastRelease;

    utils::Scheduler scheduler;
    std::mutex timerMutex;
    utils::TaskHandle timer;

    Impl(IHttpClient& http, UpdaterSettings s, ExecutablePaths paths, Version version, RestartFunction r,
         FileOps ops)
        : settings(std::move(s))
        , currentVersion(std::move(version))
        , restart(std::move(r))
        , releaseClient(http, settings.feedUrl, settings.maxFetchRetries)
        , downloader(http)
        , swapper(std::move(paths), std::move(ops))
    {
    }

    void setError(const UpdateError& error)
    {
        std::lock_guard<std::mutex> lock(infoMutex);
        lastError = error;
    }

    // Feed, asset and download problems are recoverable: warn and wait for the next cycle
    CycleOutcome abort(const UpdateError& error)
    {
        setError(error);
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Update, error.message, error.technicalInfo);
        return CycleOutcome::Aborted;
    }

    void disarmTimer()
    {
        utils::TaskHandle handle;
        {
            std::lock_guard<std::mutex> lock(timerMutex);
            handle = std::move(timer);
        }
        handle.cancel();
    }

    bool timerArmed()
    {
        std::lock_guard<std::mutex> lock(timerMutex);
        return timer.isActive();
    }
};

UpdaterService::UpdaterService(IHttpClient& http, UpdaterSettings settings, ExecutablePaths paths,
                               Version currentVersion, RestartFunction restart, FileOps fileOps)
    : impl_(std::make_unique<Impl>(http, std::move(settings), std::move(paths), std::move(currentVersion),
                                   std::move(restart), std::move(fileOps)))
{
}

UpdaterService::~UpdaterService() { shutdown(); }

bool UpdaterService::initialize(UpdateError& outError)
{
    if (!impl_->swapper.cleanupStaleBackup(outError))
    {
        impl_->setError(outError);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Update, outError.message, outError.technicalInfo);
        return false;
    }

    impl_->initialized = true;
    PLOG_INFO << "UpdaterService initialized (current version: " << impl_->currentVersion.toString()
              << ", channel: " << toString(impl_->settings.channel) << ")";
    return true;
}

void UpdaterService::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(impl_->timerMutex);
        if (impl_->stopping.exchange(true))
            return;
    }
    PLOG_DEBUG << "UpdaterService shutting down";
    impl_->disarmTimer();
}

CycleOutcome UpdaterService::runCycle()
{
    auto& d = *impl_;

    if (!d.initialized || d.disarmed || d.stopping || d.settings.channel == UpdateChannel::Unknown)
    {
        return CycleOutcome::Disabled;
    }

    bool expected = false;
    if (!d.cycleRunning.compare_exchange_strong(expected, true))
    {
        PLOG_WARNING << "Update check already in progress";
        return CycleOutcome::Busy;
    }

    struct CycleGuard
    {
        Impl& impl;
        ~CycleGuard()
        {
            impl.state = UpdateState::Idle;
            impl.cycleRunning = false;
        }
    } guard{ d };

    // A previous update that booted fine leaves its backup behind
    UpdateError error;
    if (!d.swapper.cleanupStaleBackup(error))
    {
        return d.abort(error);
    }

    d.state = UpdateState::CheckingVersion;
    PLOG_INFO << "Checking new version...";

    ReleaseDescriptor release;
    if (!d.releaseClient.fetchLatest(d.settings.channel, release, error))
    {
        return d.abort(error);
    }
    {
        std::lock_guard<std::mutex> lock(d.infoMutex);
        d.lastRelease = release;
    }

    PLOG_INFO << "Local version: " << d.currentVersion.toString() << " | Remote version: " << release.tag;

    if (d.currentVersion >= Version(release.tag))
    {
        d.state = UpdateState::UpToDate;
        if (d.settings.autoUpdates)
        {
            std::lock_guard<std::mutex> lock(d.timerMutex);
            if (!d.timer.isActive() && !d.disarmed && !d.stopping)
            {
                PLOG_INFO << "Will check for new versions every "
                          << std::chrono::duration_cast<std::chrono::minutes>(d.settings.checkInterval).count()
                          << " minutes";
                d.timer = d.scheduler.schedulePeriodic("update-check", d.settings.checkInterval,
                                                       d.settings.checkInterval, [this] { runCycle(); });
            }
        }
        return CycleOutcome::UpToDate;
    }

    if (!d.settings.autoUpdates)
    {
        PLOG_INFO << "New version is available: " << release.tag << ". Consider updating yourself!";
        return CycleOutcome::UpdateAvailable;
    }

    d.state = UpdateState::AwaitingAssetMatch;
    const auto& paths = d.swapper.paths();
    AssetDescriptor asset;
    if (!AssetDownloader::selectAsset(release, paths.current.filename().string(), asset, error))
    {
        return d.abort(error);
    }

    d.state = UpdateState::Downloading;
    if (!d.downloader.download(asset, paths.staged, paths.current, error))
    {
        return d.abort(error);
    }

    d.state = UpdateState::Swapping;
    if (!d.swapper.swap(error))
    {
        d.setError(error);
        if (error.code == UpdateErrorCode::RollbackFailed)
        {
            // Already reported as fatal; leave the files alone from here on
            d.disarmed = true;
            d.disarmTimer();
            return CycleOutcome::RollbackFailed;
        }
        d.state = UpdateState::RolledBack;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Update, error.message, error.technicalInfo);
        return CycleOutcome::RolledBack;
    }

    d.state = UpdateState::Done;
    PLOG_INFO << "Update process is finished! Restarting in " << d.settings.restartDelay.count() << " ms";
    std::this_thread::sleep_for(d.settings.restartDelay);

    if (d.restart && d.restart())
    {
        return CycleOutcome::Restarted;
    }

    // Never keep swapping binaries against an image that would not start
    d.disarmed = true;
    d.restartFailed = true;
    d.disarmTimer();
    UpdateError restartError(UpdateErrorCode::RestartFailed, "Could not restart after the update, restart manually",
                             paths.current.string());
    d.setError(restartError);
    utils::ErrorReporter::ReportError(utils::ErrorCategory::Update, restartError.message,
                                      restartError.technicalInfo);
    std::this_thread::sleep_for(d.settings.restartDelay);
    return CycleOutcome::RestartFailed;
}

UpdateState UpdaterService::getState() const { return impl_->state.load(); }

UpdateError UpdaterService::getLastError() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->lastError;
}

ReleaseDescriptor UpdaterService::getLastRelease() const
{
    std::lock_guard<std::mutex> lock(impl_->infoMutex);
    return impl_->lastRelease;
}

bool UpdaterService::isInitialized() const { return impl_->initialized; }

bool UpdaterService::isTimerArmed() const { return impl_->timerArmed(); }

bool UpdaterService::isDisarmed() const { return impl_->disarmed; }

bool UpdaterService::restartFailed() const { return impl_->restartFailed; }

const Version& UpdaterService::currentVersion() const { return impl_->currentVersion; }

} // namespace updater
