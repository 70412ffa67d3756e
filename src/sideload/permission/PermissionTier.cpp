#include "PermissionTier.hpp"

namespace sideload
{

PermissionTier classifyTier(int osVersion)
{
    if (osVersion >= kGranularMinVersion)
        return PermissionTier::Granular;
    if (osVersion >= kScopedStorageMinVersion)
        return PermissionTier::ScopedStorage;
    return PermissionTier::Legacy;
}

const TierRequirements& requirementsFor(PermissionTier tier)
{
    static const TierRequirements legacy{ { Grant::Storage }, false, false, SettingsPage::AllFilesAccess };
    static const TierRequirements scoped{ { Grant::ManageAllFiles }, false, true, SettingsPage::AllFilesAccess };
    static const TierRequirements granular{ { Grant::MediaImages, Grant::MediaVideo }, true, false,
                                            SettingsPage::AllFilesAccess };

    switch (tier)
    {
    case PermissionTier::ScopedStorage:
        return scoped;
    case PermissionTier::Granular:
        return granular;
    case PermissionTier::Legacy:
    default:
        return legacy;
    }
}

const char* toString(PermissionTier tier)
{
    switch (tier)
    {
    case PermissionTier::Legacy:
        return "Legacy";
    case PermissionTier::ScopedStorage:
        return "ScopedStorage";
    case PermissionTier::Granular:
        return "Granular";
    default:
        return "Unknown";
    }
}

} // namespace sideload
