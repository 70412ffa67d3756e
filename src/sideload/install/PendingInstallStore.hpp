#pragma once

#include "../api/Collaborators.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sideload
{

// A downloaded package waiting for installer consent or installation.
struct PendingInstallation
{
    std::string filePath;
    std::int64_t createdAt = 0; // Unix milliseconds, 0 when unknown

    bool operator==(const PendingInstallation& other) const = default;
};

// Single-slot durable record, last writer wins.
class PendingInstallStore
{
public:
    static constexpr const char* kKey = "pending_installation";

    explicit PendingInstallStore(std::shared_ptr<IKeyValueStore> store);

    // Empty when no record exists or the stored value cannot be read
    std::optional<PendingInstallation> load() const;

    bool save(const PendingInstallation& record, std::string& outError);
    bool clear(std::string& outError);

    static std::int64_t nowMillis();

private:
    std::shared_ptr<IKeyValueStore> store_;
};

} // namespace sideload
