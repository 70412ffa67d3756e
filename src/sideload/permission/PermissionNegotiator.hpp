#pragma once

#include "PermissionTier.hpp"
#include "../platform/IPlatformBridge.hpp"

#include <memory>

namespace sideload
{

enum class AccessResult
{
    Granted,
    Denied,
    NeedsSettings // User has to act in a system settings page, re-check later
};

// Interactive calls may prompt or open settings; passive calls only look.
enum class Interaction
{
    Interactive,
    Passive
};

const char* toString(AccessResult result);

// Drives the user through the grants the current platform tier requires.
//
// Refusals are ordinary results. Platform channel failures are logged and
// reported as Denied. Concurrent callers asking for the same capability share
// one in-flight request instead of prompting twice.
class PermissionNegotiator
{
public:
    explicit PermissionNegotiator(std::shared_ptr<IPlatformBridge> platform);
    ~PermissionNegotiator();

    PermissionNegotiator(const PermissionNegotiator&) = delete;
    PermissionNegotiator& operator=(const PermissionNegotiator&) = delete;

    static PermissionTier classify(int osVersion) { return classifyTier(osVersion); }

    // Tier of the running platform. Queried once and cached for the process lifetime.
    // Returns false when the OS version cannot be read.
    bool currentTier(PermissionTier& outTier);

    AccessResult ensureStorageAccess(PermissionTier tier);

    // Resolves the tier first; an unreadable OS version is Denied.
    AccessResult ensureStorageAccess();

    AccessResult ensureInstallAccess(Interaction interaction = Interaction::Interactive);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sideload
