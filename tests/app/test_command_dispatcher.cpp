#include <catch2/catch_test_macros.hpp>
#include "app/CommandDispatcher.hpp"
#include "app/ProcessController.hpp"
#include "app/WorkerRegistry.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/Scheduler.hpp"
#include "utils/ShutdownSignal.hpp"
#include "fake_worker.hpp"

#include <atomic>
#include <chrono>

using namespace app;
using namespace std::chrono_literals;
using test_utils::FakeWorker;

namespace {

struct DispatcherFixture {
    utils::ShutdownSignal signal;
    std::atomic<int> launches{ 0 };
    ProcessController process{ "/opt/steward/steward", {}, signal,
                               [this](const std::filesystem::path&, const std::vector<std::string>&, std::string&) {
                                   ++launches;
                                   return true;
                               },
                               [](int) {} };
    WorkerRegistry workers;
    utils::Scheduler scheduler;
    CommandDispatcher dispatcher{ workers, process, scheduler, "1.2.3.4", 1ms };

    std::shared_ptr<FakeWorker> alice = std::make_shared<FakeWorker>("alice");
    std::shared_ptr<FakeWorker> bob = std::make_shared<FakeWorker>("bob", false);

    DispatcherFixture() {
        workers.add(alice);
        workers.add(bob);
        utils::ErrorReporter::ClearErrors();
    }
};

}  // namespace

TEST_CASE("CommandDispatcher - built-in commands", "[app][dispatcher]") {
    DispatcherFixture f;

    SECTION("version") {
        auto result = f.dispatcher.handle("version");
        REQUIRE(result.ok);
        REQUIRE(result.text == "steward version 1.2.3.4");
    }

    SECTION("status lists every worker and the warning count") {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Update, "Could not check latest version");
        auto result = f.dispatcher.handle("  status ");
        REQUIRE(result.text == "<alice> running\n<bob> stopped\nPending warnings: 1");
        utils::ErrorReporter::ClearErrors();
    }

    SECTION("unknown command") {
        auto result = f.dispatcher.handle("dance");
        REQUIRE(result.ok);
        REQUIRE(result.text == "Unknown command: dance");
    }

    SECTION("update without an updater is refused") {
        REQUIRE(f.dispatcher.handle("update").text == "Updates are disabled");
    }
}

TEST_CASE("CommandDispatcher - worker commands", "[app][dispatcher]") {
    DispatcherFixture f;

    SECTION("Forwarded to the named worker") {
        auto result = f.dispatcher.handle("pause alice");
        REQUIRE(result.text == "<alice> done: pause");
        REQUIRE(f.alice->received() == std::vector<std::string>{ "pause" });
        REQUIRE(f.bob->received().empty());
    }

    SECTION("Unknown worker") {
        auto result = f.dispatcher.handle("pause carol");
        REQUIRE(result.text == "Couldn't find any worker named carol!");
    }
}

TEST_CASE("CommandDispatcher - deferred lifecycle commands", "[app][dispatcher]") {
    DispatcherFixture f;

    SECTION("exit replies first, then stops workers and raises shutdown") {
        auto result = f.dispatcher.handle("exit");
        REQUIRE(result.text == "Shutting down...");
        REQUIRE(f.signal.waitFor(2000ms));
        REQUIRE_FALSE(f.alice->keepRunning());
        REQUIRE(f.process.exitCode() == kExitClean);
    }

    SECTION("restart spawns a new image") {
        auto result = f.dispatcher.handle("restart");
        REQUIRE(result.text == "Restarting...");
        auto deadline = std::chrono::steady_clock::now() + 2s;
        while (f.launches == 0 && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(1ms);
        }
        REQUIRE(f.launches == 1);
    }

    SECTION("pending actions can be dropped") {
        CommandDispatcher slow{ f.workers, f.process, f.scheduler, "1.2.3.4", 1h };
        slow.handle("exit");
        slow.cancelPending();
        REQUIRE_FALSE(f.signal.isRaised());
    }
}
