#include "IPlatformBridge.hpp"

namespace sideload
{

const char* toString(Grant grant)
{
    switch (grant)
    {
    case Grant::Storage:
        return "storage";
    case Grant::ManageAllFiles:
        return "manage-all-files";
    case Grant::MediaImages:
        return "media-images";
    case Grant::MediaVideo:
        return "media-video";
    default:
        return "unknown";
    }
}

const char* toString(SettingsPage page)
{
    switch (page)
    {
    case SettingsPage::AllFilesAccess:
        return "all-files-access";
    case SettingsPage::UnknownAppSources:
        return "unknown-app-sources";
    default:
        return "unknown";
    }
}

const char* toString(InstallMode mode)
{
    switch (mode)
    {
    case InstallMode::Session:
        return "session";
    case InstallMode::Intent:
        return "intent";
    default:
        return "unknown";
    }
}

} // namespace sideload
