#include "CommandProtocol.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace ipc
{
    const char* toString(ChannelError error)
    {
        switch (error)
        {
        case ChannelError::None: return "none";
        case ChannelError::Unreachable: return "unreachable";
        case ChannelError::Send: return "send failed";
        case ChannelError::Receive: return "receive failed";
        case ChannelError::Protocol: return "protocol error";
        }
        return "unknown";
    }

    std::string encodeRequest(const std::string& command)
    {
        json j = { { "type", "command" }, { "text", command } };
        return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    }

    bool decodeRequest(const std::string& line, std::string& outCommand, std::string& outError)
    {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object())
        {
            outError = "request is not a JSON object";
            return false;
        }
        if (j.value("type", std::string()) != "command")
        {
            outError = "unexpected message type";
            return false;
        }
        auto it = j.find("text");
        if (it == j.end() || !it->is_string())
        {
            outError = "request has no text";
            return false;
        }
        outCommand = it->get<std::string>();
        return true;
    }

    std::string encodeResponse(const CommandResult& result)
    {
        json j = { { "type", "response" }, { "ok", result.ok }, { "text", result.text } };
        return j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    }

    bool decodeResponse(const std::string& line, CommandResult& outResult, std::string& outError)
    {
        json j = json::parse(line, nullptr, false);
        if (j.is_discarded() || !j.is_object() || j.value("type", std::string()) != "response")
        {
            outError = "response is not a valid message";
            return false;
        }
        auto text = j.find("text");
        if (text == j.end() || !text->is_string())
        {
            outError = "response has no text";
            return false;
        }
        outResult.ok = j.value("ok", false);
        outResult.text = text->get<std::string>();
        return true;
    }
}
