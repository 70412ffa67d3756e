#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

namespace fs = std::filesystem;

namespace
{

bool owns(const std::vector<std::string>& keys, const std::string& key)
{
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // namespace

ConfigManager::ConfigManager(std::string configPath)
    : config_path_(std::move(configPath))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    for (const auto& handler : handlers_)
    {
        if (handler.path != path)
            continue;

        for (const auto& key : ownedKeys)
        {
            if (owns(handler.ownedKeys, key))
            {
                last_error_ = "Duplicate ownership: key '" + key + "' at path '" + path + "' already registered";
                PLOG_ERROR << last_error_;
                return false;
            }
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(ownedKeys) });
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string details = std::string(pe.description());
        if (pe.source().begin.line > 0)
            details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + details;

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            details + "\nFile: " + config_path_);
        return false;
    }

    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(*root_, handler.path);
        static const toml::table empty;
        handler.callbacks.load(section ? *section : empty);
    }

    PLOG_DEBUG << "Loaded config from " << config_path_;
    return true;
}

bool ConfigManager::save()
{
    last_error_.clear();

    toml::table output = root_ ? *root_ : toml::table{};
    for (const auto& handler : handlers_)
    {
        toml::table produced = handler.callbacks.save();

        toml::table* target = resolveTablePath(output, handler.path);
        if (!target)
            target = &output;

        for (const auto& [key, value] : produced)
        {
            if (!owns(handler.ownedKeys, std::string(key.str())))
            {
                PLOG_WARNING << "Handler at path '" << handler.path << "' returned unexpected key '" << key.str()
                             << "' (not in ownedKeys); stripping it";
            }
        }

        for (const auto& key : handler.ownedKeys)
        {
            if (const toml::node* node = produced.get(key))
                target->insert_or_assign(key, *node);
            else
                target->erase(key);
        }
    }

    fs::path path(config_path_);
    if (path.has_parent_path())
    {
        std::error_code dir_ec;
        fs::create_directories(path.parent_path(), dir_ec);
    }

    std::string tmp = config_path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            last_error_ = "Failed to open temp file for writing";
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                              "Could not create temporary file for writing: " + tmp);
            return false;
        }
        ofs << output << '\n';
    }

    std::error_code ec;
    fs::rename(tmp, config_path_, ec);
    if (ec)
    {
        last_error_ = std::string("Failed to rename: ") + ec.message();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                          "Could not rename temporary file: " + ec.message());
        return false;
    }

    root_ = std::make_unique<toml::table>(std::move(output));
    PLOG_INFO << "Saved config to " << config_path_;
    return true;
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

toml::table* ConfigManager::resolveTablePath(toml::table& root, const std::string& path)
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        toml::node* node = current->get(segment);
        if (!node)
        {
            auto [it, inserted] = current->insert(segment, toml::table{});
            if (!inserted)
                return nullptr;
            node = &it->second;
        }

        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }

    return current;
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
            return nullptr;

        const toml::node* node = current->get(segment);
        if (!node)
            return nullptr;

        current = node->as_table();
        if (!current)
        {
            PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
    }

    return current;
}
