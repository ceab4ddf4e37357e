#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

fs::path ConfigManager::LocateConfigRoot(const fs::path& start, int maxParents)
{
    std::error_code ec;
    fs::path candidate = start;
    for (int level = 0; level <= maxParents; ++level)
    {
        if (fs::is_directory(candidate / "config", ec))
            return candidate;
        if (!candidate.has_parent_path() || candidate.parent_path() == candidate)
            break;
        candidate = candidate.parent_path();
    }
    return start;
}

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            for (const auto& key : ownedKeys)
            {
                for (const auto& existingKey : handler.ownedKeys)
                {
                    if (key == existingKey)
                    {
                        last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                        PLOG_ERROR << last_error_;
                        return false;
                    }
                }
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        last_error_ = "config file not found: " + config_path_;
        return false;
    }

    try
    {
        return apply(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details =
                "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                          error_details + "\nFile: " + config_path_);
        return false;
    }
}

bool ConfigManager::loadFromString(std::string_view document)
{
    last_error_.clear();
    try
    {
        return apply(toml::parse(document));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Configuration has errors",
                                          std::string(pe.description()));
        return false;
    }
}

bool ConfigManager::apply(const toml::table& parsed)
{
    static const toml::table empty;
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(parsed, handler.path);
        handler.callbacks.load(section ? *section : empty);
    }

    PLOG_DEBUG << "Config loaded from " << config_path_ << " (" << handlers_.size() << " sections)";
    return true;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    const toml::table* current = &root;
    std::stringstream ss(path);
    std::string segment;
    while (std::getline(ss, segment, '.'))
    {
        const toml::node* node = current->get(segment);
        if (!node || !node->is_table())
            return nullptr;
        current = node->as_table();
    }
    return current;
}
