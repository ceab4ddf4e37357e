#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace app
{

// A long-running account worker. The protocol behind it lives elsewhere.
class IWorker
{
public:
    virtual ~IWorker() = default;

    virtual const std::string& name() const = 0;

    // Whether this worker still intends to keep running
    virtual bool keepRunning() const = 0;

    virtual void requestStop() = 0;

    virtual std::string handleCommand(const std::string& command) = 0;

    virtual std::string statusLine() const = 0;
};

class WorkerRegistry
{
public:
    using ChangeCallback = std::function<void()>;

    // Rejects a second worker with the same name
    bool add(std::shared_ptr<IWorker> worker);
    bool remove(const std::string& name);

    std::shared_ptr<IWorker> find(const std::string& name) const;
    std::vector<std::shared_ptr<IWorker>> snapshot() const;
    std::size_t size() const;

    bool anyKeepRunning() const;

    // Asks every worker to stop, then reports the liveness change
    void stopAll();

    // Workers call this whenever keepRunning() flips
    void notifyLivenessChanged();

    void setChangeCallback(ChangeCallback cb);

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<IWorker>> workers_;
    ChangeCallback on_change_;
};

} // namespace app
