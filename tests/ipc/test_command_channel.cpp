#include <catch2/catch_test_macros.hpp>
#include "ipc/CommandClient.hpp"
#include "ipc/CommandProtocol.hpp"
#include "ipc/CommandServer.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <thread>
#include <vector>

using namespace ipc;
using namespace std::chrono_literals;

namespace {

class LambdaHandler : public ICommandHandler {
public:
    explicit LambdaHandler(std::function<CommandResult(const std::string&)> fn) : fn_(std::move(fn)) {}
    CommandResult handle(const std::string& command) override { return fn_(command); }

private:
    std::function<CommandResult(const std::string&)> fn_;
};

}  // namespace

TEST_CASE("CommandProtocol - messages", "[ipc][protocol]") {
    SECTION("Request line") {
        std::string line = encodeRequest("pause \"alice\"");
        REQUIRE(line.back() == '\n');
        line.pop_back();

        std::string command;
        std::string error;
        REQUIRE(decodeRequest(line, command, error));
        REQUIRE(command == "pause \"alice\"");
    }

    SECTION("Response line") {
        std::string line = encodeResponse({ true, "line1\nline2" });
        line.pop_back();

        CommandResult result;
        std::string error;
        REQUIRE(decodeResponse(line, result, error));
        REQUIRE(result.ok);
        REQUIRE(result.text == "line1\nline2");
    }

    SECTION("Garbage is rejected") {
        std::string command;
        std::string error;
        REQUIRE_FALSE(decodeRequest("not json", command, error));
        REQUIRE_FALSE(decodeRequest(R"({"type":"ack","text":"x"})", command, error));
        REQUIRE_FALSE(decodeRequest(R"({"type":"command"})", command, error));

        CommandResult result;
        REQUIRE_FALSE(decodeResponse(R"({"type":"command","text":"x"})", result, error));
    }
}

TEST_CASE("CommandChannel - round trip", "[ipc][channel]") {
    std::atomic<int> calls{ 0 };
    LambdaHandler handler([&](const std::string& command) {
        ++calls;
        return CommandResult{ true, "echo: " + command };
    });

    CommandServer server("127.0.0.1", 0, handler, 2000);
    std::vector<bool> states;
    server.setStateCallback([&](bool listening) { states.push_back(listening); });

    REQUIRE(server.start());
    REQUIRE(server.isListening());
    REQUIRE(server.port() > 0);

    CommandClient client("127.0.0.1", server.port(), 2000);

    SECTION("One command, one response") {
        auto result = client.handle("status");
        REQUIRE(client.lastErrorCode() == ChannelError::None);
        REQUIRE(result.ok);
        REQUIRE(result.text == "echo: status");
        REQUIRE(calls == 1);
    }

    SECTION("Sequential commands each use their own connection") {
        REQUIRE(client.handle("a").text == "echo: a");
        REQUIRE(client.handle("b").text == "echo: b");
        REQUIRE(calls == 2);
    }

    server.stop();
    REQUIRE_FALSE(server.isListening());
    REQUIRE(states == std::vector<bool>{ true, false });
}

TEST_CASE("CommandChannel - concurrent dispatches run independently", "[ipc][channel]") {
    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> inFlight{ 0 };

    LambdaHandler handler([&](const std::string& command) {
        if (command == "slow") {
            ++inFlight;
            gate.wait();
        }
        return CommandResult{ true, command };
    });

    CommandServer server("127.0.0.1", 0, handler, 5000);
    REQUIRE(server.start());

    auto slow = std::async(std::launch::async, [&] {
        CommandClient client("127.0.0.1", server.port(), 5000);
        return client.handle("slow");
    });

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (inFlight == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    REQUIRE(inFlight == 1);

    CommandClient fast("127.0.0.1", server.port(), 2000);
    REQUIRE(fast.handle("fast").text == "fast");

    release.set_value();
    REQUIRE(slow.get().text == "slow");
    server.stop();
}

TEST_CASE("CommandChannel - handler exceptions become error responses", "[ipc][channel]") {
    LambdaHandler handler([](const std::string&) -> CommandResult { throw std::runtime_error("boom"); });
    CommandServer server("127.0.0.1", 0, handler, 2000);
    REQUIRE(server.start());

    CommandClient client("127.0.0.1", server.port(), 2000);
    auto result = client.handle("status");
    REQUIRE(client.lastErrorCode() == ChannelError::None);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.text == "Command failed: boom");
}

TEST_CASE("CommandChannel - unreachable server", "[ipc][channel]") {
    LambdaHandler handler([](const std::string& c) { return CommandResult{ true, c }; });
    CommandServer server("127.0.0.1", 0, handler);
    REQUIRE(server.start());
    int port = server.port();
    server.stop();

    CommandClient client("127.0.0.1", port, 500);
    auto result = client.handle("status");
    REQUIRE_FALSE(result.ok);
    REQUIRE(client.lastErrorCode() == ChannelError::Unreachable);
}

TEST_CASE("CommandServer - stop is idempotent", "[ipc][channel]") {
    LambdaHandler handler([](const std::string& c) { return CommandResult{ true, c }; });

    SECTION("Never started") {
        CommandServer server("127.0.0.1", 0, handler);
        server.stop();
        server.stop();
        REQUIRE_FALSE(server.isListening());
    }

    SECTION("Started then stopped twice") {
        CommandServer server("127.0.0.1", 0, handler);
        REQUIRE(server.start());
        REQUIRE(server.start());
        server.stop();
        server.stop();
        REQUIRE_FALSE(server.isListening());
    }

    SECTION("Invalid address fails to start") {
        CommandServer server("not-an-address", 0, handler);
        REQUIRE_FALSE(server.start());
        REQUIRE_FALSE(server.isListening());
        server.stop();
    }
}
