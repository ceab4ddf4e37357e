#pragma once

#include <cstddef>
#include <string>

namespace ipc
{
    // One request per connection, one JSON object per line:
    //   -> {"type":"command","text":"status"}
    //   <- {"type":"response","ok":true,"text":"..."}
    constexpr const char* kDefaultHost = "127.0.0.1";
    constexpr int kDefaultPort = 1242;
    constexpr std::size_t kMaxLineBytes = 64 * 1024;

    enum class ChannelError
    {
        None,
        Unreachable, // No server accepted the connection
        Send,
        Receive,     // Connection closed or timed out before a full response line
        Protocol     // Peer sent something that is not a valid message
    };

    const char* toString(ChannelError error);

    struct CommandResult
    {
        bool ok = false;
        std::string text;
    };

    std::string encodeRequest(const std::string& command);
    bool decodeRequest(const std::string& line, std::string& outCommand, std::string& outError);

    std::string encodeResponse(const CommandResult& result);
    bool decodeResponse(const std::string& line, CommandResult& outResult, std::string& outError);
}
