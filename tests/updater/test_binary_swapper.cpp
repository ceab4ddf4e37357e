#include <catch2/catch_test_macros.hpp>
#include "updater/BinarySwapper.hpp"
#include "utils/ErrorReporter.hpp"
#include "../utils/temp_dir.hpp"

#include <filesystem>

using namespace updater;
using test_utils::TempDir;
namespace fs = std::filesystem;

namespace {

// Default ops, except renames whose target matches `failTarget`
FileOps failingRenameTo(const fs::path& failTarget) {
    FileOps ops = FileOps::Default();
    auto real = ops.rename;
    ops.rename = [real, failTarget](const fs::path& from, const fs::path& to, std::error_code& ec) {
        if (to == failTarget) {
            ec = std::make_error_code(std::errc::permission_denied);
            return;
        }
        real(from, to, ec);
    };
    return ops;
}

}  // namespace

TEST_CASE("BinarySwapper - derived paths", "[updater][swap]") {
    auto paths = ExecutablePaths::From("/opt/steward/steward");
    REQUIRE(paths.current == fs::path("/opt/steward/steward"));
    REQUIRE(paths.old == fs::path("/opt/steward/steward.old"));
    REQUIRE(paths.staged == fs::path("/opt/steward/steward.new"));
}

TEST_CASE("BinarySwapper - swap", "[updater][swap]") {
    TempDir dir;
    auto paths = ExecutablePaths::From(dir.file("steward"));
    dir.write("steward", "old-binary");
    dir.write("steward.new", "new-binary");

    SECTION("Both renames succeed") {
        BinarySwapper swapper(paths);
        UpdateError error;
        REQUIRE(swapper.swap(error));
        REQUIRE(TempDir::read(paths.current) == "new-binary");
        REQUIRE(TempDir::read(paths.old) == "old-binary");
        REQUIRE_FALSE(fs::exists(paths.staged));
    }

    SECTION("Backup failure leaves current untouched and drops new") {
        BinarySwapper swapper(paths, failingRenameTo(paths.old));
        UpdateError error;
        REQUIRE_FALSE(swapper.swap(error));
        REQUIRE(error.code == UpdateErrorCode::Swap);
        REQUIRE(TempDir::read(paths.current) == "old-binary");
        REQUIRE_FALSE(fs::exists(paths.old));
        REQUIRE_FALSE(fs::exists(paths.staged));
    }

    SECTION("Activation failure rolls back to the previous state") {
        // Only new -> current fails; the rollback rename old -> current goes through
        FileOps ops = FileOps::Default();
        int activationAttempts = 0;
        auto real = ops.rename;
        ops.rename = [&](const fs::path& from, const fs::path& to, std::error_code& ec) {
            if (from == paths.staged && to == paths.current) {
                ++activationAttempts;
                ec = std::make_error_code(std::errc::io_error);
                return;
            }
            real(from, to, ec);
        };
        BinarySwapper rollbackSwapper(paths, ops);

        UpdateError error;
        REQUIRE_FALSE(rollbackSwapper.swap(error));
        REQUIRE(error.code == UpdateErrorCode::Swap);
        REQUIRE(activationAttempts == 1);
        REQUIRE(TempDir::read(paths.current) == "old-binary");
        REQUIRE_FALSE(fs::exists(paths.old));
        REQUIRE_FALSE(fs::exists(paths.staged));
    }

    SECTION("Failed rollback is fatal and touches nothing else") {
        utils::ErrorReporter::ClearErrors();
        BinarySwapper swapper(paths, failingRenameTo(paths.current));
        UpdateError error;
        REQUIRE_FALSE(swapper.swap(error));
        REQUIRE(error.code == UpdateErrorCode::RollbackFailed);
        REQUIRE(fs::exists(paths.old));
        REQUIRE(fs::exists(paths.staged));
        REQUIRE_FALSE(fs::exists(paths.current));

        auto last = utils::ErrorReporter::GetLastError();
        REQUIRE(last.severity == utils::ErrorSeverity::Fatal);
        REQUIRE(last.category == utils::ErrorCategory::Update);
        utils::ErrorReporter::ClearErrors();
    }
}

TEST_CASE("BinarySwapper - stale backup cleanup", "[updater][swap]") {
    TempDir dir;
    auto paths = ExecutablePaths::From(dir.file("steward"));
    dir.write("steward", "binary");

    SECTION("Missing backup is fine") {
        BinarySwapper swapper(paths);
        UpdateError error;
        REQUIRE(swapper.cleanupStaleBackup(error));
    }

    SECTION("Leftover backup is removed") {
        dir.write("steward.old", "previous");
        BinarySwapper swapper(paths);
        UpdateError error;
        REQUIRE(swapper.cleanupStaleBackup(error));
        REQUIRE_FALSE(fs::exists(paths.old));
    }

    SECTION("Removal failure is reported") {
        dir.write("steward.old", "previous");
        FileOps ops = FileOps::Default();
        ops.remove = [](const fs::path&, std::error_code& ec) {
            ec = std::make_error_code(std::errc::permission_denied);
            return false;
        };
        BinarySwapper swapper(paths, ops);
        UpdateError error;
        REQUIRE_FALSE(swapper.cleanupStaleBackup(error));
        REQUIRE(error.code == UpdateErrorCode::StaleBackup);
        REQUIRE(fs::exists(paths.old));
    }
}
