#include "JsonFileStore.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <utility>

using json = nlohmann::json;
namespace fs = std::filesystem;

JsonFileStore::JsonFileStore(std::string path)
    : path_(std::move(path))
{
}

std::optional<std::string> JsonFileStore::get(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    auto it = values_.find(key);
    if (it == values_.end())
        return std::nullopt;
    return it->second;
}

void JsonFileStore::set(const std::string& key, const std::string& value)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    auto previous = values_;
    values_[key] = value;
    try
    {
        flush();
    }
    catch (const sideload::StoreError&)
    {
        values_ = std::move(previous);
        throw;
    }
}

void JsonFileStore::remove(const std::string& key)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ensureLoaded();

    auto it = values_.find(key);
    if (it == values_.end())
        return;

    std::string previous = it->second;
    values_.erase(it);
    try
    {
        flush();
    }
    catch (const sideload::StoreError&)
    {
        values_[key] = std::move(previous);
        throw;
    }
}

void JsonFileStore::ensureLoaded()
{
    if (loaded_)
        return;

    std::error_code ec;
    if (!fs::exists(path_, ec))
    {
        loaded_ = true;
        return;
    }

    std::ifstream ifs(path_, std::ios::binary);
    if (!ifs)
        throw sideload::StoreError("cannot open " + path_);

    std::stringstream buffer;
    buffer << ifs.rdbuf();

    json doc = json::parse(buffer.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Storage, "State file is unreadable, starting empty",
                                            "File: " + path_);
        loaded_ = true;
        return;
    }

    for (const auto& [key, value] : doc.items())
    {
        if (value.is_string())
            values_[key] = value.get<std::string>();
        else
            PLOG_WARNING << "Skipping non-string state entry '" << key << "'";
    }

    PLOG_DEBUG << "Loaded " << values_.size() << " state entries from " << path_;
    loaded_ = true;
}

void JsonFileStore::flush()
{
    json doc = json::object();
    for (const auto& [key, value] : values_)
        doc[key] = value;

    fs::path path(path_);
    if (path.has_parent_path())
    {
        std::error_code dir_ec;
        fs::create_directories(path.parent_path(), dir_ec);
    }

    std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
            throw sideload::StoreError("cannot write " + tmp);
        ofs << doc.dump(2) << '\n';
        if (!ofs)
            throw sideload::StoreError("short write to " + tmp);
    }

    std::error_code ec;
    fs::rename(tmp, path_, ec);
    if (ec)
    {
        fs::remove(tmp, ec);
        throw sideload::StoreError("cannot replace " + path_);
    }
}
