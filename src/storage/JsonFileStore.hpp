#pragma once

#include "sideload/api/Collaborators.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

// Flat string map persisted as one JSON object. Every write replaces the file
// atomically (temp file + rename). A corrupt file is reported and read as empty.
class JsonFileStore : public sideload::IKeyValueStore
{
public:
    explicit JsonFileStore(std::string path);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    const std::string& path() const { return path_; }

private:
    void ensureLoaded();
    void flush();

    std::string path_;
    std::map<std::string, std::string> values_;
    bool loaded_ = false;
    std::mutex mutex_;
};
