#include "BinarySwapper.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace fs = std::filesystem;

namespace updater
{

FileOps FileOps::Default()
{
    FileOps ops;
    ops.rename = [](const fs::path& from, const fs::path& to, std::error_code& ec) { fs::rename(from, to, ec); };
    ops.remove = [](const fs::path& path, std::error_code& ec) { return fs::remove(path, ec); };
    return ops;
}

ExecutablePaths ExecutablePaths::From(const fs::path& executable)
{
    ExecutablePaths paths;
    paths.current = executable;
    paths.old = executable;
    paths.old += ".old";
    paths.staged = executable;
    paths.staged += ".new";
    return paths;
}

BinarySwapper::BinarySwapper(ExecutablePaths paths, FileOps ops)
    : paths_(std::move(paths))
    , ops_(std::move(ops))
{
}

bool BinarySwapper::cleanupStaleBackup(UpdateError& outError)
{
    std::error_code ec;
    bool removed = ops_.remove(paths_.old, ec);
    if (ec)
    {
        outError = UpdateError(UpdateErrorCode::StaleBackup, "Could not remove the previous binary backup",
                               paths_.old.string() + ": " + ec.message());
        return false;
    }
    if (removed)
    {
        PLOG_INFO << "Removed previous binary backup " << paths_.old.string();
    }
    return true;
}

void BinarySwapper::discardStaged()
{
    std::error_code ec;
    ops_.remove(paths_.staged, ec);
    if (ec)
    {
        PLOG_WARNING << "Could not remove " << paths_.staged.string() << ": " << ec.message();
    }
}

bool BinarySwapper::swap(UpdateError& outError)
{
    std::error_code ec;

    ops_.rename(paths_.current, paths_.old, ec);
    if (ec)
    {
        outError = UpdateError(UpdateErrorCode::Swap, "Could not back up the running binary",
                               paths_.current.string() + " -> " + paths_.old.string() + ": " + ec.message());
        discardStaged();
        return false;
    }

    ops_.rename(paths_.staged, paths_.current, ec);
    if (!ec)
    {
        PLOG_INFO << "Activated " << paths_.current.string();
        return true;
    }

    std::string activateError = ec.message();
    PLOG_WARNING << "Could not activate the new binary (" << activateError << "), rolling back";

    std::error_code rollbackEc;
    ops_.rename(paths_.old, paths_.current, rollbackEc);
    if (rollbackEc)
    {
        outError = UpdateError(UpdateErrorCode::RollbackFailed,
                               "Update failed and the previous binary could not be restored",
                               "activate: " + activateError + "; restore " + paths_.old.string() + " -> " +
                                   paths_.current.string() + ": " + rollbackEc.message());
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Update, outError.message + ", manual recovery needed",
                                          outError.technicalInfo);
        return false;
    }

    discardStaged();
    outError = UpdateError(UpdateErrorCode::Swap, "Could not activate the new binary, previous binary restored",
                           paths_.staged.string() + " -> " + paths_.current.string() + ": " + activateError);
    return false;
}

} // namespace updater
