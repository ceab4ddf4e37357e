#pragma once

#include "CommandDispatcher.hpp"
#include "ProcessController.hpp"
#include "ipc/CommandClient.hpp"
#include "ipc/CommandServer.hpp"
#include "updater/HttpClient.hpp"
#include "updater/UpdaterService.hpp"
#include "utils/Scheduler.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace app
{

struct RuntimeContext;

// One-shot client: forwards every queued command to the running instance
class ClientSession
{
public:
    ClientSession(const RuntimeContext& context, std::vector<std::string> commands);

    // Prints each response to `out`. Returns the process exit code.
    int run(std::ostream& out);

    ipc::CommandClient& client() { return client_; }

private:
    ipc::CommandClient client_;
    std::vector<std::string> commands_;
};

// Long-lived server: self-updater, optional command server, shutdown aggregation
class ServerSession
{
public:
    ServerSession(RuntimeContext& context, std::filesystem::path executable, std::vector<std::string> args,
                  std::string version);
    ~ServerSession();

    ServerSession(const ServerSession&) = delete;
    ServerSession& operator=(const ServerSession&) = delete;

    // Safe to call more than once
    bool startCommandServer();

    // Start-up update check, then blocks until the shutdown signal is raised.
    // Returns the process exit code.
    int run();

    void stop();

    ProcessController& process() { return process_; }
    CommandDispatcher& dispatcher() { return dispatcher_; }
    updater::UpdaterService& updater() { return *updater_; }
    ipc::CommandServer& server() { return server_; }

private:
    RuntimeContext& context_;
    std::string version_;

    utils::Scheduler scheduler_;
    ProcessController process_;
    updater::CprHttpClient http_;
    std::unique_ptr<updater::UpdaterService> updater_;
    CommandDispatcher dispatcher_;
    ipc::CommandServer server_;
};

} // namespace app
