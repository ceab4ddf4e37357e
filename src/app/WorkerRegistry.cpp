#include "WorkerRegistry.hpp"

#include <plog/Log.h>

#include <algorithm>

namespace app
{

bool WorkerRegistry::add(std::shared_ptr<IWorker> worker)
{
    if (!worker)
        return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(),
                               [&](const auto& w) { return w->name() == worker->name(); });
        if (it != workers_.end())
        {
            PLOG_WARNING << "Worker " << worker->name() << " is already registered";
            return false;
        }
        workers_.push_back(std::move(worker));
    }
    notifyLivenessChanged();
    return true;
}

bool WorkerRegistry::remove(const std::string& name)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(workers_.begin(), workers_.end(), [&](const auto& w) { return w->name() == name; });
        if (it == workers_.end())
            return false;
        workers_.erase(it);
    }
    notifyLivenessChanged();
    return true;
}

std::shared_ptr<IWorker> WorkerRegistry::find(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& w : workers_)
    {
        if (w->name() == name)
            return w;
    }
    return nullptr;
}

std::vector<std::shared_ptr<IWorker>> WorkerRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_;
}

std::size_t WorkerRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

bool WorkerRegistry::anyKeepRunning() const
{
    for (const auto& w : snapshot())
    {
        if (w->keepRunning())
            return true;
    }
    return false;
}

void WorkerRegistry::stopAll()
{
    for (const auto& w : snapshot())
    {
        w->requestStop();
    }
    notifyLivenessChanged();
}

void WorkerRegistry::notifyLivenessChanged()
{
    ChangeCallback cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cb = on_change_;
    }
    if (cb)
        cb();
}

void WorkerRegistry::setChangeCallback(ChangeCallback cb)
{
    std::lock_guard<std::mutex> lock(mutex_);
    on_change_ = std::move(cb);
}

} // namespace app
