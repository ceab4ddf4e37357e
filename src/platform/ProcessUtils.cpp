#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace utils
{

namespace
{

void setError(std::string* outError, const std::string& message)
{
    if (outError)
    {
        *outError = message;
    }
}

} // namespace

std::filesystem::path ProcessUtils::GetExecutablePath()
{
    std::error_code ec;
    auto exePath = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec)
    {
        PLOG_ERROR << "Failed to read /proc/self/exe: " << ec.message();
        return {};
    }
    return exePath;
}

bool ProcessUtils::LaunchProcess(const std::filesystem::path& exePath, const std::vector<std::string>& args,
                                 bool detached, std::string* outError)
{
    if (exePath.empty() || !std::filesystem::exists(exePath))
    {
        setError(outError, "Invalid executable path: " + exePath.string());
        PLOG_ERROR << "Invalid executable path: " << exePath.string();
        return false;
    }

    // The write end is close-on-exec: EOF on the read end means execv succeeded,
    // an errno value means it failed
    int statusPipe[2];
    if (pipe2(statusPipe, O_CLOEXEC) == -1)
    {
        setError(outError, std::string("pipe2() failed: ") + strerror(errno));
        PLOG_ERROR << "pipe2() failed: " << strerror(errno);
        return false;
    }

    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(exePath.c_str()));
    for (const auto& arg : args)
    {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
    {
        int err = errno;
        close(statusPipe[0]);
        close(statusPipe[1]);
        setError(outError, std::string("fork() failed: ") + strerror(err));
        PLOG_ERROR << "fork() failed: " << strerror(err);
        return false;
    }

    if (pid == 0)
    {
        close(statusPipe[0]);

        if (detached && setsid() < 0)
        {
            int err = errno;
            (void)!write(statusPipe[1], &err, sizeof(err));
            _exit(127);
        }

        execv(exePath.c_str(), argv.data());

        int err = errno;
        (void)!write(statusPipe[1], &err, sizeof(err));
        _exit(127);
    }

    close(statusPipe[1]);

    int childErrno = 0;
    ssize_t n;
    do
    {
        n = read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    close(statusPipe[0]);

    if (n > 0)
    {
        int status = 0;
        waitpid(pid, &status, 0);
        setError(outError, std::string("execv() failed: ") + strerror(childErrno));
        PLOG_ERROR << "execv() failed for " << exePath.string() << ": " << strerror(childErrno);
        return false;
    }

    if (!detached)
    {
        int status = 0;
        waitpid(pid, &status, 0);
    }

    PLOG_INFO << "Launched process: " << exePath.string() << " (pid " << pid << ")";
    return true;
}

long ProcessUtils::GetCurrentProcessId() { return static_cast<long>(getpid()); }

} // namespace utils
