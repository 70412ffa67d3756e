#pragma once

#include "../api/Collaborators.hpp"
#include "../permission/PermissionNegotiator.hpp"
#include "../platform/IPlatformBridge.hpp"
#include "PendingInstallStore.hpp"

#include <memory>
#include <string>

namespace sideload
{

enum class InstallState
{
    Idle,
    PermissionCheck,
    Installing,
    AwaitingPermission,
    Installed,
    Failed
};

enum class InstallStatus
{
    Installed,
    Deferred, // Waiting on installer consent, record persisted
    Rejected, // Platform refused or failed
    Busy, // Another installer invocation is in flight
    NothingToResume, // Resume only: no record, or the file is gone
    StillWaiting // Resume only: consent still missing, nothing prompted
};

const char* toString(InstallState state);
const char* toString(InstallStatus status);

struct InstallResult
{
    InstallStatus status = InstallStatus::Rejected;
    std::string filePath;
    std::string reason;
};

// Hands a local package to the platform installer.
//
// The pending record is written before the consent check so the package survives
// a trip to the settings page or a process restart. It is cleared only after the
// platform confirms the installation, or when it points at a file that is gone.
// One installer invocation runs at a time; a concurrent call gets Busy.
class InstallOrchestrator
{
public:
    static constexpr int kNotificationIdBase = 1000;

    InstallOrchestrator(std::shared_ptr<IPlatformBridge> platform, PermissionNegotiator& permissions,
                        PendingInstallStore& pending, InstallMode mode,
                        std::shared_ptr<INotificationSink> notifications = nullptr);
    ~InstallOrchestrator();

    InstallOrchestrator(const InstallOrchestrator&) = delete;
    InstallOrchestrator& operator=(const InstallOrchestrator&) = delete;

    InstallResult install(const std::string& filePath);

    // Called on every start/foreground. Never prompts.
    InstallResult resume();

    InstallState state() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sideload
