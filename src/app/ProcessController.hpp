#pragma once

#include "../utils/ShutdownSignal.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace app
{

enum ExitCode : int
{
    kExitClean = 0,
    kExitStartupFailure = 1, // Missing or invalid start-up data
    kExitChannelUnreachable = 2, // Client mode could not reach a server
    kExitRestartFailed = 3 // Kept running after an update could not restart
};

// Owns restart and the shutdown decision.
class ProcessController
{
public:
    using LaunchFunction = std::function<bool(const std::filesystem::path& exe,
                                              const std::vector<std::string>& args, std::string& outError)>;
    using TerminateFunction = std::function<void(int exitCode)>;
    using LivenessCheck = std::function<bool()>;

    ProcessController(std::filesystem::path executable, std::vector<std::string> args,
                      utils::ShutdownSignal& shutdown, LaunchFunction launch = {}, TerminateFunction terminate = {});

    // Spawns the executable with the original arguments, then terminates this process.
    // Returns false when the new image did not start. Never throws.
    bool restart();

    // Both checks are consulted by evaluateShutdown(); an unset check counts as idle
    void setLivenessChecks(LivenessCheck anyWorkerRunning, LivenessCheck serverListening);

    // Raises the shutdown signal when no worker keeps running and the command server is
    // not listening. Returns true only for the call that raised it.
    bool evaluateShutdown();

    // Raises the shutdown signal unconditionally with the given exit code
    void requestExit(int exitCode);

    int exitCode() const { return exit_code_.load(); }

    // Escalates the exit code; a lower value never overrides a higher one
    void recordExitCode(int exitCode);

    const std::filesystem::path& executablePath() const { return executable_; }
    const std::vector<std::string>& arguments() const { return args_; }

private:
    std::filesystem::path executable_;
    std::vector<std::string> args_;
    utils::ShutdownSignal& shutdown_;
    LaunchFunction launch_;
    TerminateFunction terminate_;

    std::mutex check_mutex_;
    LivenessCheck workers_running_;
    LivenessCheck server_listening_;

    std::atomic<int> exit_code_{ kExitClean };
};

} // namespace app
