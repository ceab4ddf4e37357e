#pragma once

#include "app/Sessions.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <variant>
#include <vector>

class ConfigManager;

namespace app
{
struct RuntimeContext;
struct StartupOptions;
} // namespace app

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool initializeLogging();
    void enableFileLogging();
    bool initializeConfig();
    void applyLogLevel();

    app::ServerSession& serverSession();
    void startCommandServerEarly();

    int runClient(const app::StartupOptions& options);
    int runServer();
    int failStartup(const std::string& message, const std::string& details);

    std::vector<std::string> args_;
    std::filesystem::path executable_;

    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<app::RuntimeContext> context_;

    // Chosen once, never both
    std::variant<std::monostate, app::ClientSession, app::ServerSession> session_;
};
