#pragma once

#include <stdexcept>
#include <string>

namespace sideload
{

// OS-level access grants the negotiator can ask for.
enum class Grant
{
    Storage, // Broad read/write storage grant (older platforms)
    ManageAllFiles, // "All files access", settings-only on scoped-storage platforms
    MediaImages,
    MediaVideo
};

enum class SettingsPage
{
    AllFilesAccess,
    UnknownAppSources
};

enum class InstallMode
{
    Session, // Platform-managed installation session
    Intent // One-shot installer hand-off
};

const char* toString(Grant grant);
const char* toString(SettingsPage page);
const char* toString(InstallMode mode);

// Raised when the platform channel itself fails, as opposed to a user refusal.
class PlatformError : public std::runtime_error
{
public:
    explicit PlatformError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

class IPlatformBridge
{
public:
    virtual ~IPlatformBridge() = default;

    // API level of the device, used for tier classification
    virtual int osVersion() = 0;

    // Non-interactive check
    virtual bool checkGrant(Grant grant) = 0;

    // Interactive request, returns true when the grant is held afterwards
    virtual bool requestGrant(Grant grant) = 0;

    virtual void openSettings(SettingsPage page) = 0;

    virtual bool hasInstallPermission() = 0;

    // Starts the settings flow for installer consent, does not wait for the user
    virtual void requestInstallPermission() = 0;

    // Returns true when the platform reports the package as installed
    virtual bool install(const std::string& path, InstallMode mode) = 0;
};

} // namespace sideload
