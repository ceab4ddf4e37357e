#include "ModeSelector.hpp"

#include <plog/Log.h>

#include <string_view>

namespace app
{

namespace
{

constexpr std::string_view kFlagMarker = "--";

std::string_view stripMarker(std::string_view token)
{
    if (token.substr(0, kFlagMarker.size()) == kFlagMarker)
        token.remove_prefix(kFlagMarker.size());
    return token;
}

} // namespace

const char* toString(OperatingMode mode)
{
    switch (mode)
    {
    case OperatingMode::Normal:
        return "normal";
    case OperatingMode::ClientOnly:
        return "client";
    case OperatingMode::ServerEnabled:
        return "server";
    }
    return "unknown";
}

ModeSelector::ModeSelector(ServerRequestedHook onServerRequested)
    : on_server_requested_(std::move(onServerRequested))
{
}

std::vector<std::string> ModeSelector::ArgsFrom(int argc, char** argv)
{
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i)
    {
        if (argv[i])
            args.emplace_back(argv[i]);
    }
    return args;
}

StartupOptions ModeSelector::parse(const std::vector<std::string>& tokens)
{
    StartupOptions options;

    for (const auto& token : tokens)
    {
        std::string_view name = stripMarker(token);

        if (name == "client-mode")
        {
            if (options.mode == OperatingMode::ServerEnabled)
            {
                PLOG_WARNING << "Ignoring " << token << " because the command server is already running";
                continue;
            }
            options.mode = OperatingMode::ClientOnly;
        }
        else if (name == "enable-log")
        {
            options.fileLogging = true;
        }
        else if (name == "disable-log")
        {
            options.fileLogging = false;
        }
        else if (name == "server-mode")
        {
            if (options.mode == OperatingMode::ClientOnly)
            {
                PLOG_WARNING << "Ignoring " << token << " because --client-mode was specified";
                continue;
            }
            if (options.mode == OperatingMode::ServerEnabled)
                continue;

            options.mode = OperatingMode::ServerEnabled;
            if (on_server_requested_)
                on_server_requested_();
        }
        else if (token.size() != name.size())
        {
            PLOG_WARNING << "Unrecognized parameter: " << token;
            options.unknownFlags.push_back(token);
        }
        else if (options.mode != OperatingMode::ClientOnly)
        {
            PLOG_WARNING << "Ignoring command because --client-mode wasn't specified: " << token;
            options.ignoredCommands.push_back(token);
        }
        else
        {
            options.commands.push_back(token);
        }
    }

    return options;
}

} // namespace app
