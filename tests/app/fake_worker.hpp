#pragma once

#include "app/WorkerRegistry.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace test_utils {

class FakeWorker : public app::IWorker {
public:
    explicit FakeWorker(std::string name, bool running = true)
        : name_(std::move(name)), running_(running) {}

    const std::string& name() const override { return name_; }
    bool keepRunning() const override { return running_.load(); }
    void requestStop() override { running_ = false; }

    std::string handleCommand(const std::string& command) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.push_back(command);
        return "<" + name_ + "> done: " + command;
    }

    std::string statusLine() const override { return running_ ? "running" : "stopped"; }

    void setRunning(bool running) { running_ = running; }

    std::vector<std::string> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    std::string name_;
    std::atomic<bool> running_;
    mutable std::mutex mutex_;
    std::vector<std::string> received_;
};

}  // namespace test_utils
