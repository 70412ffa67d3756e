#pragma once

#include "../platform/IPlatformBridge.hpp"

#include <vector>

namespace sideload
{

// Platform capability class. A pure function of the OS version.
enum class PermissionTier
{
    Legacy, // Single broad storage grant
    ScopedStorage, // Broad "manage all files" grant, settings page as fallback
    Granular // Narrow per-media grants
};

// First API level of each tier
constexpr int kScopedStorageMinVersion = 30;
constexpr int kGranularMinVersion = 33;

struct TierRequirements
{
    std::vector<Grant> grants;
    bool anyOf = false; // One granted grant is enough
    bool settingsFallback = false; // Refusal opens a settings page instead of failing
    SettingsPage settingsPage = SettingsPage::AllFilesAccess;
};

PermissionTier classifyTier(int osVersion);

const TierRequirements& requirementsFor(PermissionTier tier);

const char* toString(PermissionTier tier);

} // namespace sideload
