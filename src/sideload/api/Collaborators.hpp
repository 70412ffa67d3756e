#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace sideload
{

// Raised by key-value stores when the backing medium cannot be read or written.
class StoreError : public std::runtime_error
{
public:
    explicit StoreError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

// Durable string store. Implementations throw StoreError on I/O failure.
class IKeyValueStore
{
public:
    virtual ~IKeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

// Observational sink for user-visible notifications. Never consulted for control flow.
class INotificationSink
{
public:
    virtual ~INotificationSink() = default;

    virtual void notify(int id, const std::string& title, const std::string& body, int percent) = 0;
};

// External usage counter, told about every successful download.
class IUsageCounter
{
public:
    virtual ~IUsageCounter() = default;

    virtual void recordDownload(const std::string& url, const std::string& displayName) = 0;
};

} // namespace sideload
