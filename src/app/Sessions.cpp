#include "Sessions.hpp"
#include "RuntimeContext.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <ostream>
#include <thread>

namespace app
{

ClientSession::ClientSession(const RuntimeContext& context, std::vector<std::string> commands)
    : client_(context.config.ipcHost, context.config.ipcPort, context.config.ipcResponseTimeoutMs)
    , commands_(std::move(commands))
{
}

int ClientSession::run(std::ostream& out)
{
    for (const auto& command : commands_)
    {
        PLOG_INFO << "Command sent: \"" << command << "\"";
        ipc::CommandResult result = client_.handle(command);

        if (client_.lastErrorCode() != ipc::ChannelError::None)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::IPC, client_.lastError(),
                                              ipc::toString(client_.lastErrorCode()));
            return kExitChannelUnreachable;
        }

        PLOG_DEBUG << "Response received (" << result.text.size() << " bytes)";
        out << result.text << std::endl;
    }
    return kExitClean;
}

ServerSession::ServerSession(RuntimeContext& context, std::filesystem::path executable,
                             std::vector<std::string> args, std::string version)
    : context_(context)
    , version_(version)
    , process_(std::move(executable), std::move(args), context.shutdown)
    , dispatcher_(context.workers, process_, scheduler_, version)
    , server_(context.config.ipcHost, context.config.ipcPort, dispatcher_, context.config.ipcResponseTimeoutMs)
{
    const GlobalConfig& cfg = context_.config;

    updater::UpdaterSettings settings;
    settings.autoUpdates = cfg.autoUpdates;
    settings.channel = cfg.updateChannel;
    settings.feedUrl = cfg.releaseFeedUrl;
    settings.maxFetchRetries = cfg.maxFetchRetries;
    settings.checkInterval = cfg.checkInterval();
    settings.restartDelay = cfg.restartDelay();

    updater_ = std::make_unique<updater::UpdaterService>(
        http_, settings, updater::ExecutablePaths::From(process_.executablePath()), updater::Version(version_),
        [this] { return process_.restart(); });
    dispatcher_.setUpdater(updater_.get());

    process_.setLivenessChecks([this] { return context_.workers.anyKeepRunning(); },
                               [this] { return server_.isListening(); });
    context_.workers.setChangeCallback([this] { process_.evaluateShutdown(); });
    server_.setStateCallback([this](bool) { process_.evaluateShutdown(); });
}

ServerSession::~ServerSession() { stop(); }

bool ServerSession::startCommandServer()
{
    if (server_.isListening())
        return true;

    if (!server_.start())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::IPC, "Could not start the command server",
                                          server_.lastError());
        return false;
    }
    return true;
}

int ServerSession::run()
{
    updater::UpdateError error;
    if (updater_->initialize(error))
    {
        updater::CycleOutcome outcome = updater_->runCycle();
        PLOG_INFO << "Start-up update check: " << updater::toString(outcome);
    }
    else
    {
        PLOG_WARNING << "Self-update disabled for this run: " << error.message;
    }

    process_.evaluateShutdown();
    context_.shutdown.wait();

    // Give the user some time to read the last messages
    std::this_thread::sleep_for(context_.config.shutdownGrace());

    stop();

    if (updater_->restartFailed())
        process_.recordExitCode(kExitRestartFailed);
    return process_.exitCode();
}

void ServerSession::stop()
{
    context_.workers.setChangeCallback({});
    server_.setStateCallback({});

    dispatcher_.cancelPending();
    updater_->shutdown();
    server_.stop();
    scheduler_.cancelAll();
}

} // namespace app
