#pragma once

#include "UpdateTypes.hpp"

#include <filesystem>
#include <functional>
#include <system_error>

namespace updater
{

// File-system primitives used by the swap; tests replace them to inject failures
struct FileOps
{
    std::function<void(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec)>
        rename;
    std::function<bool(const std::filesystem::path& path, std::error_code& ec)> remove;

    static FileOps Default();
};

// Paths derived from the canonical executable path
struct ExecutablePaths
{
    std::filesystem::path current;
    std::filesystem::path old; // current + ".old"
    std::filesystem::path staged; // current + ".new"

    static ExecutablePaths From(const std::filesystem::path& executable);
};

/**
 * Activates a staged binary with two renames:
 *   (1) current -> old
 *   (2) new     -> current
 *
 * Failure of (1) leaves current untouched and deletes new.
 * Failure of (2) renames old back to current; if that fails too the error is
 * RollbackFailed and nothing else is touched.
 */
class BinarySwapper
{
public:
    explicit BinarySwapper(ExecutablePaths paths, FileOps ops = FileOps::Default());

    // Deletes a leftover <exe>.old from a previous update. Absent file is success.
    bool cleanupStaleBackup(UpdateError& outError);

    bool swap(UpdateError& outError);

    // Best-effort removal of <exe>.new
    void discardStaged();

    const ExecutablePaths& paths() const { return paths_; }

private:
    ExecutablePaths paths_;
    FileOps ops_;
};

} // namespace updater
