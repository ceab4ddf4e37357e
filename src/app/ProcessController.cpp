#include "ProcessController.hpp"
#include "../platform/ProcessUtils.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <iostream>

namespace app
{

ProcessController::ProcessController(std::filesystem::path executable, std::vector<std::string> args,
                                     utils::ShutdownSignal& shutdown, LaunchFunction launch,
                                     TerminateFunction terminate)
    : executable_(std::move(executable))
    , args_(std::move(args))
    , shutdown_(shutdown)
    , launch_(std::move(launch))
    , terminate_(std::move(terminate))
{
    if (!launch_)
    {
        launch_ = [](const std::filesystem::path& exe, const std::vector<std::string>& args, std::string& outError)
        { return utils::ProcessUtils::LaunchProcess(exe, args, true, &outError); };
    }
    if (!terminate_)
    {
        // Runs on scheduler threads too: skip static destructors while other threads still log.
        // plog appenders write each record straight through, only the std streams need flushing.
        terminate_ = [](int code)
        {
            std::cout.flush();
            std::cerr.flush();
            std::_Exit(code);
        };
    }
}

bool ProcessController::restart()
{
    std::string error;
    bool launched = false;
    try
    {
        launched = launch_(executable_, args_, error);
    }
    catch (const std::exception& e)
    {
        error = e.what();
    }

    if (!launched)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Process, "Could not start a new process image",
                                          executable_.string() + ": " + error);
        return false;
    }

    PLOG_INFO << "New process started, exiting";
    terminate_(kExitClean);
    return true;
}

void ProcessController::setLivenessChecks(LivenessCheck anyWorkerRunning, LivenessCheck serverListening)
{
    std::lock_guard<std::mutex> lock(check_mutex_);
    workers_running_ = std::move(anyWorkerRunning);
    server_listening_ = std::move(serverListening);
}

bool ProcessController::evaluateShutdown()
{
    LivenessCheck workers;
    LivenessCheck server;
    {
        std::lock_guard<std::mutex> lock(check_mutex_);
        workers = workers_running_;
        server = server_listening_;
    }

    if (workers && workers())
        return false;
    if (server && server())
        return false;

    if (!shutdown_.raise())
        return false;

    PLOG_INFO << "No workers are running, exiting";
    return true;
}

void ProcessController::requestExit(int exitCode)
{
    recordExitCode(exitCode);
    if (shutdown_.raise())
    {
        PLOG_INFO << "Exit requested (code " << exit_code_.load() << ")";
    }
}

void ProcessController::recordExitCode(int exitCode)
{
    int current = exit_code_.load();
    while (exitCode > current && !exit_code_.compare_exchange_weak(current, exitCode))
    {
    }
}

} // namespace app
