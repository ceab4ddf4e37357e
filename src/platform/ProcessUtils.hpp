#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace utils
{

// POSIX utilities for process management
class ProcessUtils
{
public:
    // Get the absolute path to the current executable
    static std::filesystem::path GetExecutablePath();

    // Launch a process with optional arguments
    // Returns true only once the child has successfully replaced its image (execv succeeded)
    // If detached=true, the child starts its own session and outlives the parent
    static bool LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                              bool detached = true, std::string* outError = nullptr);

    // Current process id
    static long GetCurrentProcessId();
};

} // namespace utils
