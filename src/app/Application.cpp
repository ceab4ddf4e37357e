#include "Application.hpp"
#include "app/ModeSelector.hpp"
#include "app/RuntimeContext.hpp"
#include "app/Version.hpp"
#include "config/ConfigManager.hpp"
#include "config/GlobalConfig.hpp"
#include "platform/ProcessUtils.hpp"
#include "utils/CrashHandler.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <iostream>
#include <thread>

namespace
{

void flushBeforeCrash() { std::cout.flush(); }

} // namespace

Application::Application(int argc, char** argv)
    : args_(app::ModeSelector::ArgsFrom(argc, argv))
{
}

Application::~Application() = default;

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize({ .append_logs = true, .default_level = plog::info }))
    {
        return false;
    }

    // stdout carries nothing but command responses in client mode
    return utils::LogManager::RegisterLogger<0>({ .name = "console",
                                                  .filepath = "",
                                                  .write_file = false,
                                                  .console_to_stderr = true,
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt });
}

void Application::enableFileLogging()
{
    const GlobalConfig& cfg = context_->config;
    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = cfg.logFile,
                                           .write_file = true,
                                           .append_override = cfg.appendLogs,
                                           .level_override = static_cast<plog::Severity>(cfg.logLevel),
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3 });
}

void Application::applyLogLevel()
{
    if (auto* logger = plog::get())
    {
        logger->setMaxSeverity(static_cast<plog::Severity>(context_->config.logLevel));
    }
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>();
    GlobalConfig::Register(*config_, context_->config);

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
        return false;
    }

    applyLogLevel();
    return true;
}

app::ServerSession& Application::serverSession()
{
    if (auto* server = std::get_if<app::ServerSession>(&session_))
        return *server;

    return session_.emplace<app::ServerSession>(*context_, executable_, args_, STEWARD_VERSION_STRING);
}

void Application::startCommandServerEarly()
{
    utils::CrashHandler::SetContext("starting command server");
    serverSession().startCommandServer();
}

int Application::failStartup(const std::string& message, const std::string& details)
{
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, message, details);
    std::this_thread::sleep_for(context_->config.shutdownGrace());
    return app::kExitStartupFailure;
}

int Application::runClient(const app::StartupOptions& options)
{
    auto& client = session_.emplace<app::ClientSession>(*context_, options.commands);
    return client.run(std::cout);
}

int Application::runServer()
{
    utils::CrashHandler::SetContext("server session");
    app::ServerSession& server = serverSession();
    if (context_->mode == app::OperatingMode::ServerEnabled && !server.server().isListening())
    {
        return failStartup("Command server could not be started", server.server().lastError());
    }
    return server.run();
}

int Application::run()
{
    utils::CrashHandler::Initialize();
    utils::CrashHandler::RegisterFatalCleanup(flushBeforeCrash);

    if (!initializeLogging())
    {
        std::cerr << "Failed to initialize logging" << std::endl;
        return app::kExitStartupFailure;
    }

    PLOG_INFO << "steward version " << STEWARD_VERSION_STRING << " (pid " << utils::ProcessUtils::GetCurrentProcessId()
              << ")";

    executable_ = utils::ProcessUtils::GetExecutablePath();
    context_ = std::make_unique<app::RuntimeContext>();

    // config/ and logs/ are resolved next to the binary
    if (!executable_.empty())
    {
        std::filesystem::path root = executable_.parent_path();
#ifndef NDEBUG
        // Debug builds run from build/ subdirectories of the source tree
        root = ConfigManager::LocateConfigRoot(root);
#endif
        std::error_code ec;
        std::filesystem::current_path(root, ec);
        if (ec)
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization,
                                                "Could not switch to the executable directory", ec.message());
        }
    }

    utils::CrashHandler::SetContext("loading configuration");
    bool configLoaded = initializeConfig();

    app::ModeSelector selector([this] { startCommandServerEarly(); });
    app::StartupOptions options = selector.parse(args_);
    context_->mode = options.mode;

    if (options.mode == app::OperatingMode::ClientOnly)
    {
        if (options.fileLoggingEnabled())
            enableFileLogging();
        return runClient(options);
    }

    if (!configLoaded)
    {
        return failStartup("Global config could not be loaded, make sure that " + config_->path() +
                               " exists and is valid",
                           config_->lastError());
    }

    if (executable_.empty())
    {
        return failStartup("Could not determine the executable path", "/proc/self/exe");
    }

    if (options.fileLoggingEnabled())
        enableFileLogging();

    return runServer();
}
