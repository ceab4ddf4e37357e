#include "CommandDispatcher.hpp"
#include "ProcessController.hpp"
#include "WorkerRegistry.hpp"
#include "updater/UpdaterService.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Scheduler.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <sstream>

namespace app
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos)
        return {};
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

ipc::CommandResult reply(std::string text) { return { true, std::move(text) }; }

} // namespace

CommandDispatcher::CommandDispatcher(WorkerRegistry& workers, ProcessController& process,
                                     utils::Scheduler& scheduler, std::string version,
                                     std::chrono::milliseconds deferDelay)
    : workers_(workers)
    , process_(process)
    , scheduler_(scheduler)
    , version_(std::move(version))
    , defer_delay_(deferDelay)
{
}

CommandDispatcher::~CommandDispatcher() { cancelPending(); }

void CommandDispatcher::setUpdater(updater::UpdaterService* updater)
{
    std::lock_guard<std::mutex> lock(mutex_);
    updater_ = updater;
}

void CommandDispatcher::cancelPending()
{
    std::vector<utils::TaskHandle> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending.swap(pending_);
    }
    for (auto& handle : pending)
    {
        handle.cancel();
    }
}

void CommandDispatcher::defer(const std::string& name, std::function<void()> action)
{
    auto handle = scheduler_.scheduleOnce(name, defer_delay_, std::move(action));
    std::lock_guard<std::mutex> lock(mutex_);
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [](const utils::TaskHandle& h) { return !h.isActive(); }),
                   pending_.end());
    pending_.push_back(std::move(handle));
}

std::string CommandDispatcher::status() const
{
    std::ostringstream oss;
    auto workers = workers_.snapshot();
    if (workers.empty())
    {
        oss << "No workers are registered";
    }
    for (std::size_t i = 0; i < workers.size(); ++i)
    {
        if (i > 0)
            oss << '\n';
        oss << "<" << workers[i]->name() << "> " << workers[i]->statusLine();
    }
    oss << "\nPending warnings: " << utils::ErrorReporter::PendingCount();
    return oss.str();
}

ipc::CommandResult CommandDispatcher::handle(const std::string& rawCommand)
{
    const std::string command = trim(rawCommand);

    if (command == "version")
    {
        return reply("steward version " + version_);
    }

    if (command == "status")
    {
        return reply(status());
    }

    if (command == "update")
    {
        updater::UpdaterService* updater = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            updater = updater_;
        }
        if (!updater || !updater->isInitialized() || updater->isDisarmed())
        {
            return reply("Updates are disabled");
        }
        defer("update-now", [updater] { updater->runCycle(); });
        return reply("Checking for updates...");
    }

    if (command == "restart")
    {
        defer("restart", [this]
              {
                  if (!process_.restart())
                  {
                      PLOG_WARNING << "Restart requested over IPC failed";
                  }
              });
        return reply("Restarting...");
    }

    if (command == "exit")
    {
        defer("exit", [this]
              {
                  workers_.stopAll();
                  process_.requestExit(kExitClean);
              });
        return reply("Shutting down...");
    }

    auto space = command.find(' ');
    if (space != std::string::npos)
    {
        std::string verb = command.substr(0, space);
        std::string target = trim(command.substr(space + 1));
        auto worker = workers_.find(target);
        if (!worker)
        {
            return reply("Couldn't find any worker named " + target + "!");
        }
        return reply(worker->handleCommand(verb));
    }

    return reply("Unknown command: " + command);
}

} // namespace app
