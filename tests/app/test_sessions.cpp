#include <catch2/catch_test_macros.hpp>
#include "app/ProcessController.hpp"
#include "app/RuntimeContext.hpp"
#include "app/Sessions.hpp"
#include "ipc/CommandClient.hpp"
#include "ipc/CommandServer.hpp"
#include "utils/temp_dir.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace app;
using namespace std::chrono_literals;

namespace {

class EchoHandler : public ipc::ICommandHandler {
public:
    ipc::CommandResult handle(const std::string& command) override {
        ++calls;
        return { true, "echo: " + command };
    }

    std::atomic<int> calls{ 0 };
};

// Loopback listener that never accepts; the kernel completes connections into its backlog
class SilentListener {
public:
    SilentListener() {
        sock_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(sock_, 8);
        socklen_t len = sizeof(addr);
        ::getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        ::fcntl(sock_, F_SETFL, O_NONBLOCK);
    }

    ~SilentListener() {
        for (int fd : accepted_) {
            ::close(fd);
        }
        ::close(sock_);
    }

    int port() const { return port_; }

    int drainPending() {
        int count = 0;
        int fd;
        while ((fd = ::accept(sock_, nullptr, nullptr)) >= 0) {
            accepted_.push_back(fd);
            ++count;
        }
        return count;
    }

private:
    int sock_ = -1;
    int port_ = 0;
    std::vector<int> accepted_;
};

// Minimal HTTP endpoint serving one release document and counting requests
class FakeReleaseFeed {
public:
    explicit FakeReleaseFeed(std::string body) : body_(std::move(body)) {
        sock_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        int yes = 1;
        ::setsockopt(sock_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        ::bind(sock_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::listen(sock_, 8);
        socklen_t len = sizeof(addr);
        ::getsockname(sock_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        thread_ = std::thread([this] { serve(); });
    }

    ~FakeReleaseFeed() {
        running_ = false;
        thread_.join();
        ::close(sock_);
    }

    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/releases"; }
    int requests() const { return requests_.load(); }

private:
    void serve() {
        while (running_) {
            pollfd pfd{ sock_, POLLIN, 0 };
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            int client = ::accept(sock_, nullptr, nullptr);
            if (client < 0) {
                continue;
            }
            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                ssize_t n = ::recv(client, buf, sizeof(buf), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buf, static_cast<size_t>(n));
            }
            ++requests_;
            std::string response = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
                                   std::to_string(body_.size()) + "\r\nConnection: close\r\n\r\n" + body_;
            ::send(client, response.data(), response.size(), MSG_NOSIGNAL);
            ::close(client);
        }
    }

    std::string body_;
    int sock_ = -1;
    int port_ = 0;
    std::atomic<bool> running_{ true };
    std::atomic<int> requests_{ 0 };
    std::thread thread_;
};

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

}  // namespace

TEST_CASE("ClientSession - forwarding", "[app][session]") {
    RuntimeContext context;
    context.config.ipcHost = "127.0.0.1";
    context.config.ipcResponseTimeoutMs = 300;
    std::ostringstream out;

    SECTION("Each command is sent once and its text is the only output") {
        EchoHandler handler;
        ipc::CommandServer server("127.0.0.1", 0, handler, 2000);
        REQUIRE(server.start());
        context.config.ipcPort = server.port();

        ClientSession session(context, { "status" });
        REQUIRE(session.run(out) == kExitClean);
        REQUIRE(out.str() == "echo: status\n");
        REQUIRE(handler.calls == 1);
    }

    SECTION("Commands are forwarded in order") {
        EchoHandler handler;
        ipc::CommandServer server("127.0.0.1", 0, handler, 2000);
        REQUIRE(server.start());
        context.config.ipcPort = server.port();

        ClientSession session(context, { "pause alice", "resume alice" });
        REQUIRE(session.run(out) == kExitClean);
        REQUIRE(out.str() == "echo: pause alice\necho: resume alice\n");
    }

    SECTION("No running instance exits with the channel error code") {
        EchoHandler handler;
        ipc::CommandServer server("127.0.0.1", 0, handler);
        REQUIRE(server.start());
        context.config.ipcPort = server.port();
        server.stop();

        ClientSession session(context, { "status" });
        REQUIRE(session.run(out) == kExitChannelUnreachable);
        REQUIRE(session.client().lastErrorCode() == ipc::ChannelError::Unreachable);
        REQUIRE(out.str().empty());
    }

    SECTION("The first failed command stops forwarding") {
        SilentListener listener;
        context.config.ipcPort = listener.port();

        ClientSession session(context, { "first", "second" });
        REQUIRE(session.run(out) == kExitChannelUnreachable);
        REQUIRE(session.client().lastErrorCode() == ipc::ChannelError::Receive);
        REQUIRE(out.str().empty());
        REQUIRE(listener.drainPending() == 1);
    }
}

TEST_CASE("ServerSession - lifecycle over the command channel", "[app][session]") {
    test_utils::TempDir dir;
    dir.write("steward", "binary");
    FakeReleaseFeed feed(R"({"tag_name":"1.0.0.0","assets":[]})");

    RuntimeContext context;
    context.config.ipcHost = "127.0.0.1";
    context.config.ipcPort = 0;
    context.config.releaseFeedUrl = feed.url();
    context.config.maxFetchRetries = 1;
    context.config.shutdownGraceSeconds = 0;

    ServerSession session(context, dir.file("steward"), {}, "1.0.0.0");
    REQUIRE(session.startCommandServer());
    REQUIRE(session.startCommandServer());

    auto exitCode = std::async(std::launch::async, [&] { return session.run(); });

    // Start-up check has run and found nothing newer
    REQUIRE(eventually([&] { return session.updater().isInitialized() && feed.requests() == 1; }));
    REQUIRE(eventually([&] { return session.updater().isTimerArmed(); }));
    REQUIRE_FALSE(context.shutdown.isRaised());

    ipc::CommandClient client("127.0.0.1", session.server().port(), 2000);

    SECTION("update runs one more cycle after replying") {
        auto reply = client.handle("update");
        REQUIRE(reply.ok);
        REQUIRE(reply.text == "Checking for updates...");
        REQUIRE(eventually([&] { return feed.requests() == 2; }));

        REQUIRE(client.handle("exit").text == "Shutting down...");
    }

    SECTION("exit ends the session cleanly") {
        REQUIRE(client.handle("version").text == "steward version 1.0.0.0");
        REQUIRE(client.handle("exit").text == "Shutting down...");
    }

    REQUIRE(exitCode.wait_for(10s) == std::future_status::ready);
    REQUIRE(exitCode.get() == kExitClean);
    REQUIRE_FALSE(session.server().isListening());
    REQUIRE_FALSE(session.updater().isTimerArmed());
}

TEST_CASE("ServerSession - command server state drives shutdown", "[app][session]") {
    test_utils::TempDir dir;
    dir.write("steward", "binary");

    RuntimeContext context;
    context.config.ipcHost = "127.0.0.1";
    context.config.ipcPort = 0;
    context.config.updateChannel = updater::UpdateChannel::Unknown;
    context.config.shutdownGraceSeconds = 0;

    ServerSession session(context, dir.file("steward"), {}, "1.0.0.0");

    SECTION("Listening server keeps the process alive until it stops") {
        REQUIRE(session.startCommandServer());
        auto exitCode = std::async(std::launch::async, [&] { return session.run(); });

        REQUIRE_FALSE(context.shutdown.waitFor(100ms));

        session.server().stop();
        REQUIRE(context.shutdown.waitFor(5s));
        REQUIRE(exitCode.wait_for(5s) == std::future_status::ready);
        REQUIRE(exitCode.get() == kExitClean);
    }

    SECTION("Nothing running exits straight away") {
        REQUIRE(session.run() == kExitClean);
        REQUIRE(context.shutdown.isRaised());
    }
}
