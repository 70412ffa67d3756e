#include "InstallOrchestrator.hpp"

#include <plog/Log.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <utility>

namespace fs = std::filesystem;

namespace sideload
{

const char* toString(InstallState state)
{
    switch (state)
    {
    case InstallState::Idle:
        return "Idle";
    case InstallState::PermissionCheck:
        return "PermissionCheck";
    case InstallState::Installing:
        return "Installing";
    case InstallState::AwaitingPermission:
        return "AwaitingPermission";
    case InstallState::Installed:
        return "Installed";
    case InstallState::Failed:
        return "Failed";
    default:
        return "Unknown";
    }
}

const char* toString(InstallStatus status)
{
    switch (status)
    {
    case InstallStatus::Installed:
        return "Installed";
    case InstallStatus::Deferred:
        return "Deferred";
    case InstallStatus::Rejected:
        return "Rejected";
    case InstallStatus::Busy:
        return "Busy";
    case InstallStatus::NothingToResume:
        return "NothingToResume";
    case InstallStatus::StillWaiting:
        return "StillWaiting";
    default:
        return "Unknown";
    }
}

struct InstallOrchestrator::Impl
{
    std::shared_ptr<IPlatformBridge> platform;
    PermissionNegotiator& permissions;
    PendingInstallStore& pending;
    InstallMode mode;
    std::shared_ptr<INotificationSink> notifications;

    std::mutex installerSlot;
    std::atomic<InstallState> state{ InstallState::Idle };
    std::atomic<int> nextNotificationId{ 0 };

    Impl(std::shared_ptr<IPlatformBridge> p, PermissionNegotiator& perms, PendingInstallStore& store, InstallMode m,
         std::shared_ptr<INotificationSink> sink)
        : platform(std::move(p))
        , permissions(perms)
        , pending(store)
        , mode(m)
        , notifications(std::move(sink))
    {
    }

    void transition(InstallState next)
    {
        InstallState previous = state.exchange(next);
        if (previous != next)
            PLOG_DEBUG << "Install state " << toString(previous) << " -> " << toString(next);
    }

    int notificationId() { return kNotificationIdBase + (nextNotificationId++ % 1000); }

    void notify(int id, const std::string& title, const std::string& body)
    {
        if (!notifications)
            return;
        try
        {
            notifications->notify(id, title, body, 0);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Notification sink failed: " << ex.what();
        }
    }

    // Replaces the pending record. A previous record for a different file that
    // still exists would be orphaned by the overwrite, so that file is removed.
    void persistPending(const std::string& filePath)
    {
        if (auto previous = pending.load())
        {
            std::error_code ec;
            if (previous->filePath != filePath && fs::exists(previous->filePath, ec))
            {
                PLOG_WARNING << "Replacing unresolved pending installation " << previous->filePath
                             << ", removing its package";
                fs::remove(previous->filePath, ec);
                if (ec)
                    PLOG_WARNING << "Failed to remove " << previous->filePath << ": " << ec.message();
            }
        }

        std::string error;
        if (!pending.save({ filePath, PendingInstallStore::nowMillis() }, error))
            PLOG_ERROR << "Installation will not survive a restart: " << error;
    }

    void clearPending()
    {
        std::string error;
        if (!pending.clear(error))
            PLOG_ERROR << error;
    }

    InstallResult runInstaller(const std::string& filePath, InstallMode installMode, int notifyId)
    {
        transition(InstallState::Installing);
        notify(notifyId, "Installation Started", "Installing " + fs::path(filePath).filename().string());

        bool installed = false;
        std::string reason;
        try
        {
            installed = platform->install(filePath, installMode);
            if (!installed)
                reason = "Installer reported failure";
        }
        catch (const std::exception& ex)
        {
            reason = std::string("Installer error: ") + ex.what();
            PLOG_ERROR << reason;
        }

        if (!installed)
        {
            transition(InstallState::Failed);
            notify(notifyId, "Installation Failed", reason);
            PLOG_ERROR << "Installation of " << filePath << " rejected: " << reason;
            return { InstallStatus::Rejected, filePath, reason };
        }

        clearPending();
        transition(InstallState::Installed);
        PLOG_INFO << "Installed " << filePath << " (" << toString(installMode) << ")";
        return { InstallStatus::Installed, filePath, {} };
    }
};

InstallOrchestrator::InstallOrchestrator(std::shared_ptr<IPlatformBridge> platform, PermissionNegotiator& permissions,
                                         PendingInstallStore& pending, InstallMode mode,
                                         std::shared_ptr<INotificationSink> notifications)
    : impl_(std::make_unique<Impl>(std::move(platform), permissions, pending, mode, std::move(notifications)))
{
}

InstallOrchestrator::~InstallOrchestrator() = default;

InstallState InstallOrchestrator::state() const { return impl_->state.load(); }

InstallResult InstallOrchestrator::install(const std::string& filePath)
{
    std::unique_lock<std::mutex> slot(impl_->installerSlot, std::try_to_lock);
    if (!slot.owns_lock())
    {
        PLOG_WARNING << "Installer busy, rejecting install of " << filePath;
        return { InstallStatus::Busy, filePath, "Another installation is in progress" };
    }

    std::error_code ec;
    if (!fs::is_regular_file(filePath, ec))
    {
        impl_->transition(InstallState::Failed);
        return { InstallStatus::Rejected, filePath, "Package file not found: " + filePath };
    }

    int notifyId = impl_->notificationId();
    impl_->transition(InstallState::PermissionCheck);
    impl_->notify(notifyId, "Preparing Installation", "Checking installation permissions");
    impl_->persistPending(filePath);

    AccessResult access = impl_->permissions.ensureInstallAccess(Interaction::Interactive);
    if (access == AccessResult::NeedsSettings)
    {
        impl_->transition(InstallState::AwaitingPermission);
        impl_->notify(notifyId, "Permission Required", "Allow installs from this source, installation will resume");
        PLOG_INFO << "Installation of " << filePath << " deferred until installer consent is granted";
        return { InstallStatus::Deferred, filePath, "Installer consent required" };
    }
    if (access == AccessResult::Denied)
    {
        impl_->transition(InstallState::Failed);
        impl_->notify(notifyId, "Installation Failed", "Could not check installation permissions");
        return { InstallStatus::Rejected, filePath, "Installer consent check failed" };
    }

    return impl_->runInstaller(filePath, impl_->mode, notifyId);
}

InstallResult InstallOrchestrator::resume()
{
    std::unique_lock<std::mutex> slot(impl_->installerSlot, std::try_to_lock);
    if (!slot.owns_lock())
        return { InstallStatus::Busy, {}, "Another installation is in progress" };

    auto record = impl_->pending.load();
    if (!record)
    {
        PLOG_DEBUG << "No pending installation";
        return { InstallStatus::NothingToResume, {}, "No pending installation" };
    }

    std::error_code ec;
    if (!fs::is_regular_file(record->filePath, ec))
    {
        PLOG_WARNING << "Pending installation file is gone, discarding record: " << record->filePath;
        impl_->clearPending();
        impl_->transition(InstallState::Idle);
        return { InstallStatus::NothingToResume, record->filePath, "Pending package no longer exists" };
    }

    impl_->transition(InstallState::PermissionCheck);
    AccessResult access = impl_->permissions.ensureInstallAccess(Interaction::Passive);
    if (access != AccessResult::Granted)
    {
        impl_->transition(InstallState::AwaitingPermission);
        PLOG_INFO << "Pending installation still waiting for installer consent: " << record->filePath;
        return { InstallStatus::StillWaiting, record->filePath, "Installer consent still missing" };
    }

    PLOG_INFO << "Resuming installation of " << record->filePath;
    return impl_->runInstaller(record->filePath, InstallMode::Session, impl_->notificationId());
}

} // namespace sideload
