#include "PendingInstallStore.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <utility>

using json = nlohmann::json;

namespace sideload
{

PendingInstallStore::PendingInstallStore(std::shared_ptr<IKeyValueStore> store)
    : store_(std::move(store))
{
}

std::optional<PendingInstallation> PendingInstallStore::load() const
{
    std::optional<std::string> raw;
    try
    {
        raw = store_->get(kKey);
    }
    catch (const StoreError& e)
    {
        PLOG_ERROR << "Failed to read pending installation: " << e.what();
        return std::nullopt;
    }

    if (!raw || raw->empty())
        return std::nullopt;

    PendingInstallation record;
    json value = json::parse(*raw, nullptr, false);
    if (value.is_discarded())
    {
        // Older records hold the bare path
        record.filePath = *raw;
        PLOG_DEBUG << "Read legacy pending installation record: " << record.filePath;
    }
    else if (value.is_object() && value.contains("file_path") && value["file_path"].is_string())
    {
        record.filePath = value["file_path"].get<std::string>();
        if (value.contains("created_at") && value["created_at"].is_number_integer())
            record.createdAt = value["created_at"].get<std::int64_t>();
    }
    else
    {
        PLOG_WARNING << "Ignoring malformed pending installation record";
        return std::nullopt;
    }

    if (record.filePath.empty())
        return std::nullopt;
    return record;
}

bool PendingInstallStore::save(const PendingInstallation& record, std::string& outError)
{
    json value = { { "file_path", record.filePath }, { "created_at", record.createdAt } };
    try
    {
        store_->set(kKey, value.dump());
        PLOG_INFO << "Saved pending installation: " << record.filePath;
        return true;
    }
    catch (const StoreError& e)
    {
        outError = std::string("Failed to save pending installation: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

bool PendingInstallStore::clear(std::string& outError)
{
    try
    {
        store_->remove(kKey);
        PLOG_INFO << "Cleared pending installation";
        return true;
    }
    catch (const StoreError& e)
    {
        outError = std::string("Failed to clear pending installation: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

std::int64_t PendingInstallStore::nowMillis()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace sideload
