#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <toml++/toml.h>

class ConfigManager;

// Typed view of config.toml. Missing keys keep their defaults.
class AppSettings
{
public:
    struct Transfer
    {
        std::string download_dir = "downloads";
        std::uint64_t min_package_bytes = 1000;
        int connect_timeout_ms = 10000;
        int low_speed_timeout_s = 30;
        std::uint64_t progress_byte_bucket = 100 * 1024;
        std::string storage_bucket;
        std::string user_agent = "sideload";
    };

    struct Upload
    {
        std::string endpoint;
        int max_parallel = 2;
    };

    struct Install
    {
        bool use_session = true;
        std::string installer = "adb";
        std::vector<std::string> installer_args{ "install", "-r" };
    };

    struct Platform
    {
        int os_version = 0; // 0 asks the device
        std::string adb = "adb";
        std::string serial;
    };

    struct Storage
    {
        std::string state_file = "state.json";
    };

    struct Logging
    {
        bool append = true;
        int level = 4;
    };

    AppSettings() { applyDefaults(); }

    void applyDefaults();

    void registerConfigHandler(ConfigManager& config);

    void deserialize(const toml::table& root);
    toml::table serialize() const;

    Transfer transfer;
    Upload upload;
    Install install;
    Platform platform;
    Storage storage;
    Logging logging;
};
