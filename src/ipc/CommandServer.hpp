#pragma once

#include "ICommandHandler.hpp"

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace ipc
{
    // Loopback TCP listener. Every accepted connection carries exactly one command
    // and is served on its own thread, so dispatches run independently of each other.
    class CommandServer
    {
    public:
        using StateCallback = std::function<void(bool listening)>;

        CommandServer(std::string host, int port, ICommandHandler& handler, int ioTimeoutMs = 30000);
        ~CommandServer();

        CommandServer(const CommandServer&) = delete;
        CommandServer& operator=(const CommandServer&) = delete;

        bool start();

        // Safe to call repeatedly and before start()
        void stop();

        bool isListening() const { return listening_.load(); }

        // Actual port, useful when constructed with port 0
        int port() const { return bound_port_; }

        // Invoked on every listening state change
        void setStateCallback(StateCallback cb);

        const char* lastError() const { return last_error_.c_str(); }

    private:
        struct Connection
        {
            int sock = -1;
            std::thread thread;
            std::atomic<bool> done{ false };
        };

        void acceptLoop();
        void serve(Connection& conn);
        void reapFinished(bool all);
        void notifyState(bool listening);

        std::string host_;
        int port_;
        int bound_port_ = 0;
        int io_timeout_ms_;
        ICommandHandler& handler_;

        std::string last_error_;
        int listen_sock_ = -1;
        std::atomic<bool> running_{ false };
        std::atomic<bool> listening_{ false };
        std::thread accept_thread_;

        std::mutex conn_mutex_;
        std::list<std::unique_ptr<Connection>> connections_;

        std::mutex state_mutex_;
        StateCallback state_cb_;
        std::mutex lifecycle_mutex_;
    };
}
