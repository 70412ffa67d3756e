#include "HostServices.hpp"

#include <plog/Log.h>

#include <utility>

void LogNotificationSink::notify(int id, const std::string& title, const std::string& body, int percent)
{
    PLOG_DEBUG << "[notification " << id << "] " << title << ": " << body << " (" << percent << "%)";
}

StoreUsageCounter::StoreUsageCounter(std::shared_ptr<sideload::IKeyValueStore> store)
    : store_(std::move(store))
{
}

long long StoreUsageCounter::count()
{
    auto raw = store_->get(kKey);
    if (!raw)
        return 0;

    try
    {
        return std::stoll(*raw);
    }
    catch (const std::exception& ex)
    {
        PLOG_WARNING << "Resetting unreadable download counter '" << *raw << "': " << ex.what();
        return 0;
    }
}

void StoreUsageCounter::recordDownload(const std::string& url, const std::string& displayName)
{
    long long next = count() + 1;
    store_->set(kKey, std::to_string(next));
    PLOG_INFO << "Download #" << next << " recorded: " << displayName << " <" << url << ">";
}
