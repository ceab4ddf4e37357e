#pragma once

#include "ICommandHandler.hpp"

#include <string>

namespace ipc
{
    // Forwards a command to a running server instance. No retry, no reconnect.
    class CommandClient : public ICommandHandler
    {
    public:
        CommandClient(std::string host, int port, int timeoutMs = 30000);

        // ok=false means the channel failed; lastError() tells how
        CommandResult handle(const std::string& command) override;

        ChannelError lastErrorCode() const { return last_code_; }
        const char* lastError() const { return last_error_.c_str(); }

    private:
        int connectSocket();
        CommandResult fail(ChannelError code, std::string message);

        std::string host_;
        int port_;
        int timeout_ms_;

        ChannelError last_code_ = ChannelError::None;
        std::string last_error_;
    };
}
