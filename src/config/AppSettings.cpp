#include "AppSettings.hpp"
#include "ConfigManager.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace
{

std::uint64_t readBytes(const toml::table& t, const char* key, std::uint64_t fallback)
{
    auto v = t[key].value<int64_t>();
    if (!v)
        return fallback;
    if (*v < 0)
    {
        PLOG_WARNING << "Ignoring negative value for '" << key << "'";
        return fallback;
    }
    return static_cast<std::uint64_t>(*v);
}

} // namespace

void AppSettings::applyDefaults()
{
    transfer = Transfer{};
    upload = Upload{};
    install = Install{};
    platform = Platform{};
    storage = Storage{};
    logging = Logging{};
}

void AppSettings::registerConfigHandler(ConfigManager& config)
{
    TableCallbacks cb;
    cb.load = [this](const toml::table& section) {
        deserialize(section);
    };
    cb.save = [this]() -> toml::table {
        return serialize();
    };

    config.registerTable("", std::move(cb), { "transfer", "upload", "install", "platform", "storage", "logging" });
}

void AppSettings::deserialize(const toml::table& root)
{
    applyDefaults();

    if (auto* t = root["transfer"].as_table())
    {
        transfer.download_dir = (*t)["download_dir"].value_or(transfer.download_dir);
        transfer.min_package_bytes = readBytes(*t, "min_package_bytes", transfer.min_package_bytes);
        transfer.connect_timeout_ms = std::max(0, (*t)["connect_timeout_ms"].value_or(transfer.connect_timeout_ms));
        transfer.low_speed_timeout_s = std::max(0, (*t)["low_speed_timeout_s"].value_or(transfer.low_speed_timeout_s));
        transfer.progress_byte_bucket = readBytes(*t, "progress_byte_bucket", transfer.progress_byte_bucket);
        transfer.storage_bucket = (*t)["storage_bucket"].value_or(transfer.storage_bucket);
        transfer.user_agent = (*t)["user_agent"].value_or(transfer.user_agent);
    }

    if (auto* t = root["upload"].as_table())
    {
        upload.endpoint = (*t)["endpoint"].value_or(upload.endpoint);
        upload.max_parallel = std::clamp((*t)["max_parallel"].value_or(upload.max_parallel), 1, 16);
    }

    if (auto* t = root["install"].as_table())
    {
        install.use_session = (*t)["use_session"].value_or(install.use_session);
        install.installer = (*t)["installer"].value_or(install.installer);
        if (auto* args = (*t)["installer_args"].as_array())
        {
            install.installer_args.clear();
            for (const auto& node : *args)
            {
                if (auto s = node.value<std::string>())
                    install.installer_args.push_back(*s);
            }
        }
    }

    if (auto* t = root["platform"].as_table())
    {
        platform.os_version = std::max(0, (*t)["os_version"].value_or(platform.os_version));
        platform.adb = (*t)["adb"].value_or(platform.adb);
        platform.serial = (*t)["serial"].value_or(platform.serial);
    }

    if (auto* t = root["storage"].as_table())
    {
        storage.state_file = (*t)["state_file"].value_or(storage.state_file);
    }

    if (auto* t = root["logging"].as_table())
    {
        logging.append = (*t)["append"].value_or(logging.append);
        logging.level = std::clamp((*t)["level"].value_or(logging.level), 0, 6);
    }
}

toml::table AppSettings::serialize() const
{
    toml::array args;
    for (const auto& a : install.installer_args)
        args.push_back(a);

    return toml::table{
        { "transfer",
          toml::table{ { "download_dir", transfer.download_dir },
                       { "min_package_bytes", static_cast<int64_t>(transfer.min_package_bytes) },
                       { "connect_timeout_ms", transfer.connect_timeout_ms },
                       { "low_speed_timeout_s", transfer.low_speed_timeout_s },
                       { "progress_byte_bucket", static_cast<int64_t>(transfer.progress_byte_bucket) },
                       { "storage_bucket", transfer.storage_bucket },
                       { "user_agent", transfer.user_agent } } },
        { "upload", toml::table{ { "endpoint", upload.endpoint }, { "max_parallel", upload.max_parallel } } },
        { "install", toml::table{ { "use_session", install.use_session },
                                  { "installer", install.installer },
                                  { "installer_args", std::move(args) } } },
        { "platform", toml::table{ { "os_version", platform.os_version },
                                   { "adb", platform.adb },
                                   { "serial", platform.serial } } },
        { "storage", toml::table{ { "state_file", storage.state_file } } },
        { "logging", toml::table{ { "append", logging.append }, { "level", logging.level } } },
    };
}
