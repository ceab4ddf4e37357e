#pragma once

#include <filesystem>
#include <functional>
#include <string_view>
#include <string>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "config/steward.toml");
    ~ConfigManager();

    // First of `start` and up to `maxParents` of its ancestors that holds a config/ directory.
    // Returns `start` when none does.
    static std::filesystem::path LocateConfigRoot(const std::filesystem::path& start, int maxParents = 4);

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Parses the file and feeds every registered section to its callback.
    // Returns false when the file is missing or malformed.
    bool load();

    // Same as load() but from an in-memory document
    bool loadFromString(std::string_view document);

    bool exists() const;
    const std::string& path() const { return config_path_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(const toml::table& parsed);
    static const toml::table* resolveTablePath(const toml::table& root, const std::string& path);

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
};
