#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace app
{

enum class OperatingMode
{
    Normal,
    ClientOnly, // Forward commands to a running instance and exit
    ServerEnabled // Normal operation plus the command server
};

const char* toString(OperatingMode mode);

struct StartupOptions
{
    OperatingMode mode = OperatingMode::Normal;
    std::optional<bool> fileLogging; // Unset: decided by the mode
    std::vector<std::string> commands; // Forwarded in client mode, in order
    std::vector<std::string> unknownFlags;
    std::vector<std::string> ignoredCommands;

    bool fileLoggingEnabled() const { return fileLogging.value_or(mode != OperatingMode::ClientOnly); }
};

// Parses start-up tokens once, left to right.
//
// Flags may be written with the "--" marker or bare: client-mode, enable-log,
// disable-log, server-mode. Any other "--" token is an unknown flag. Any other token is a
// command, queued when client mode is already on and ignored otherwise.
class ModeSelector
{
public:
    // Called the moment server-mode is parsed, before the rest of start-up
    using ServerRequestedHook = std::function<void()>;

    explicit ModeSelector(ServerRequestedHook onServerRequested = {});

    StartupOptions parse(const std::vector<std::string>& tokens);

    static std::vector<std::string> ArgsFrom(int argc, char** argv);

private:
    ServerRequestedHook on_server_requested_;
};

} // namespace app
