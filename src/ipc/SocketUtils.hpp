#pragma once

#include <string>

namespace ipc
{
    bool sendAll(int sock, const std::string& data);

    // Reads until '\n' (dropped) or EOF. Returns false on error, timeout or oversize line.
    bool recvLine(int sock, std::string& out, std::size_t maxBytes);

    bool setRecvTimeout(int sock, int timeoutMs);

    void closeSocket(int& sock);
}
