#pragma once

#include "ipc/ICommandHandler.hpp"
#include "utils/Scheduler.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace updater
{
class UpdaterService;
}

namespace app
{

class ProcessController;
class WorkerRegistry;

// Server-side command interpreter.
//
//   version            running version
//   status             one line per worker plus the pending warning count
//   update             starts an update cycle in the background
//   restart            restarts shortly after replying
//   exit               stops every worker and shuts down shortly after replying
//   <command> <worker> forwards <command> to the named worker
class CommandDispatcher : public ipc::ICommandHandler
{
public:
    CommandDispatcher(WorkerRegistry& workers, ProcessController& process, utils::Scheduler& scheduler,
                      std::string version, std::chrono::milliseconds deferDelay = std::chrono::milliseconds(500));
    ~CommandDispatcher() override;

    // Updater may be attached after construction; without one "update" is refused
    void setUpdater(updater::UpdaterService* updater);

    ipc::CommandResult handle(const std::string& command) override;

    // Drops pending deferred actions
    void cancelPending();

private:
    std::string status() const;
    void defer(const std::string& name, std::function<void()> action);

    WorkerRegistry& workers_;
    ProcessController& process_;
    utils::Scheduler& scheduler_;
    std::string version_;
    std::chrono::milliseconds defer_delay_;

    std::mutex mutex_;
    updater::UpdaterService* updater_ = nullptr;
    std::vector<utils::TaskHandle> pending_;
};

} // namespace app
