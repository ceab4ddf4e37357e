#include "CommandServer.hpp"
#include "SocketUtils.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace ipc;

CommandServer::CommandServer(std::string host, int port, ICommandHandler& handler, int ioTimeoutMs)
    : host_(std::move(host))
    , port_(port)
    , io_timeout_ms_(ioTimeoutMs)
    , handler_(handler)
{
}

CommandServer::~CommandServer() { stop(); }

void CommandServer::setStateCallback(StateCallback cb)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_cb_ = std::move(cb);
}

void CommandServer::notifyState(bool listening)
{
    listening_.store(listening);
    StateCallback cb;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        cb = state_cb_;
    }
    if (cb) cb(listening);
}

bool CommandServer::start()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_.load()) return true;

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port_));
    if (::inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1)
    {
        last_error_ = "invalid listen address: " + host_;
        return false;
    }

    listen_sock_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_sock_ < 0)
    {
        last_error_ = std::string("socket failed: ") + std::strerror(errno);
        return false;
    }

    int yes = 1;
    if (::setsockopt(listen_sock_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) != 0)
    {
        PLOG_WARNING << "SO_REUSEADDR failed: " << std::strerror(errno);
    }

    if (::bind(listen_sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_sock_, 16) != 0)
    {
        last_error_ = "cannot listen on " + host_ + ":" + std::to_string(port_) + ": " + std::strerror(errno);
        closeSocket(listen_sock_);
        return false;
    }

    sockaddr_in bound{};
    socklen_t len = sizeof(bound);
    if (::getsockname(listen_sock_, reinterpret_cast<sockaddr*>(&bound), &len) == 0)
        bound_port_ = ntohs(bound.sin_port);
    else
        bound_port_ = port_;

    running_.store(true);
    accept_thread_ = std::thread(&CommandServer::acceptLoop, this);
    PLOG_INFO << "Command server listening on " << host_ << ":" << bound_port_;
    notifyState(true);
    return true;
}

void CommandServer::stop()
{
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (!running_.exchange(false))
        return;

    if (accept_thread_.joinable()) accept_thread_.join();
    closeSocket(listen_sock_);

    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (auto& conn : connections_)
        {
            if (!conn->done.load()) ::shutdown(conn->sock, SHUT_RDWR);
        }
    }
    reapFinished(true);

    PLOG_INFO << "Command server stopped";
    notifyState(false);
}

void CommandServer::acceptLoop()
{
    while (running_.load())
    {
        pollfd pfd{};
        pfd.fd = listen_sock_;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, 200);
        if (rc < 0 && errno != EINTR)
        {
            PLOG_ERROR << "Command server poll failed: " << std::strerror(errno);
            break;
        }
        reapFinished(false);
        if (rc <= 0 || !(pfd.revents & POLLIN)) continue;

        int s = ::accept4(listen_sock_, nullptr, nullptr, SOCK_CLOEXEC);
        if (s < 0)
        {
            if (errno != EINTR && errno != EAGAIN && errno != ECONNABORTED)
                PLOG_WARNING << "accept failed: " << std::strerror(errno);
            continue;
        }

        auto conn = std::make_unique<Connection>();
        conn->sock = s;
        Connection* raw = conn.get();
        std::lock_guard<std::mutex> lock(conn_mutex_);
        connections_.push_back(std::move(conn));
        raw->thread = std::thread(&CommandServer::serve, this, std::ref(*raw));
    }
}

void CommandServer::serve(Connection& conn)
{
    if (!setRecvTimeout(conn.sock, io_timeout_ms_))
        PLOG_WARNING << "Could not set receive timeout on command connection";

    std::string line;
    if (!recvLine(conn.sock, line, kMaxLineBytes))
    {
        PLOG_WARNING << "Command connection closed before a full request";
    }
    else
    {
        std::string command;
        std::string error;
        CommandResult result;
        if (!decodeRequest(line, command, error))
        {
            PLOG_WARNING << "Rejected command request: " << error;
            result.text = "Invalid request: " + error;
        }
        else
        {
            PLOG_INFO << "IPC command: " << command;
            try
            {
                result = handler_.handle(command);
            }
            catch (const std::exception& e)
            {
                PLOG_ERROR << "Command '" << command << "' failed: " << e.what();
                result.ok = false;
                result.text = std::string("Command failed: ") + e.what();
            }
        }

        if (!sendAll(conn.sock, encodeResponse(result)))
            PLOG_WARNING << "Could not send command response";
    }

    ::shutdown(conn.sock, SHUT_RDWR);
    conn.done.store(true);
}

void CommandServer::reapFinished(bool all)
{
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        for (auto it = connections_.begin(); it != connections_.end();)
        {
            if (all || (*it)->done.load())
            {
                finished.push_back(std::move(*it));
                it = connections_.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& conn : finished)
    {
        if (conn->thread.joinable()) conn->thread.join();
        closeSocket(conn->sock);
    }
}
