#include "SocketUtils.hpp"
#include "CommandProtocol.hpp"

#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace ipc
{
    bool sendAll(int sock, const std::string& data)
    {
        const char* p = data.data();
        size_t left = data.size();
        while (left > 0)
        {
            ssize_t n = ::send(sock, p, left, MSG_NOSIGNAL);
            if (n < 0 && errno == EINTR) continue;
            if (n <= 0) return false;
            p += n;
            left -= static_cast<size_t>(n);
        }
        return true;
    }

    bool recvLine(int sock, std::string& out, std::size_t maxBytes)
    {
        out.clear();
        char buf[512];
        while (true)
        {
            ssize_t n = ::recv(sock, buf, sizeof(buf), 0);
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) return false;
            if (n == 0) return !out.empty();
            for (ssize_t i = 0; i < n; ++i)
            {
                char c = buf[i];
                if (c == '\n') return true;
                if (c == '\r') continue;
                out.push_back(c);
                if (out.size() > maxBytes) return false;
            }
        }
    }

    bool setRecvTimeout(int sock, int timeoutMs)
    {
        timeval tv{};
        tv.tv_sec = timeoutMs / 1000;
        tv.tv_usec = (timeoutMs % 1000) * 1000;
        return ::setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0;
    }

    void closeSocket(int& sock)
    {
        if (sock >= 0)
        {
            ::close(sock);
            sock = -1;
        }
    }
}
