#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns config.toml. Sections are handled by registered callbacks; each handler
// owns a set of keys in its table and no two handlers may own the same key.
class ConfigManager
{
public:
    explicit ConfigManager(std::string configPath = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool save();
    const toml::table& root() const;

    const std::string& configPath() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
