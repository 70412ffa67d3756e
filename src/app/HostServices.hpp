#pragma once

#include "sideload/api/Collaborators.hpp"

#include <memory>
#include <string>

// Notifications end up in the log; the terminal shows its own progress line.
class LogNotificationSink : public sideload::INotificationSink
{
public:
    void notify(int id, const std::string& title, const std::string& body, int percent) override;
};

// Counts successful downloads in the state file under "usage.downloads".
class StoreUsageCounter : public sideload::IUsageCounter
{
public:
    static constexpr const char* kKey = "usage.downloads";

    explicit StoreUsageCounter(std::shared_ptr<sideload::IKeyValueStore> store);

    void recordDownload(const std::string& url, const std::string& displayName) override;

    long long count();

private:
    std::shared_ptr<sideload::IKeyValueStore> store_;
};
