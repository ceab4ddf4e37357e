#include "CommandClient.hpp"
#include "SocketUtils.hpp"

#include <plog/Log.h>

#include <cstdio>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

using namespace ipc;

CommandClient::CommandClient(std::string host, int port, int timeoutMs)
    : host_(std::move(host))
    , port_(port)
    , timeout_ms_(timeoutMs)
{
}

CommandResult CommandClient::fail(ChannelError code, std::string message)
{
    last_code_ = code;
    last_error_ = std::move(message);
    CommandResult result;
    result.ok = false;
    result.text = last_error_;
    return result;
}

int CommandClient::connectSocket()
{
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    char service[32];
    std::snprintf(service, sizeof(service), "%d", port_);
    struct addrinfo* res = nullptr;
    int rc = getaddrinfo(host_.c_str(), service, &hints, &res);
    if (rc != 0)
    {
        last_error_ = std::string("getaddrinfo failed: ") + gai_strerror(rc);
        return -1;
    }

    int s = -1;
    for (auto p = res; p != nullptr; p = p->ai_next)
    {
        s = ::socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol);
        if (s < 0) continue;
        if (::connect(s, p->ai_addr, p->ai_addrlen) == 0) break;
        closeSocket(s);
    }
    freeaddrinfo(res);
    if (s < 0) last_error_ = "connect failed";
    return s;
}

CommandResult CommandClient::handle(const std::string& command)
{
    last_code_ = ChannelError::None;
    last_error_.clear();

    int sock = connectSocket();
    if (sock < 0)
    {
        return fail(ChannelError::Unreachable,
                    "Could not reach a running instance at " + host_ + ":" + std::to_string(port_) + " (" +
                        last_error_ + ")");
    }

    if (!setRecvTimeout(sock, timeout_ms_))
        PLOG_WARNING << "Could not set receive timeout on command connection";

    if (!sendAll(sock, encodeRequest(command)))
    {
        closeSocket(sock);
        return fail(ChannelError::Send, "Failed to send command '" + command + "'");
    }
    ::shutdown(sock, SHUT_WR);

    std::string line;
    bool received = recvLine(sock, line, kMaxLineBytes);
    closeSocket(sock);
    if (!received)
    {
        return fail(ChannelError::Receive, "No response for command '" + command + "'");
    }

    CommandResult result;
    std::string error;
    if (!decodeResponse(line, result, error))
    {
        return fail(ChannelError::Protocol, "Malformed response: " + error);
    }
    return result;
}
