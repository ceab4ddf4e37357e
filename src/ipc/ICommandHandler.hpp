#pragma once

#include "CommandProtocol.hpp"

#include <string>

namespace ipc
{
    // Handles one command and produces one response.
    // Implemented locally by the dispatcher and remotely by the forwarding client.
    class ICommandHandler
    {
    public:
        virtual ~ICommandHandler() = default;

        virtual CommandResult handle(const std::string& command) = 0;
    };
}
