#include "PermissionNegotiator.hpp"

#include <plog/Log.h>

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sideload
{

const char* toString(AccessResult result)
{
    switch (result)
    {
    case AccessResult::Granted:
        return "Granted";
    case AccessResult::Denied:
        return "Denied";
    case AccessResult::NeedsSettings:
        return "NeedsSettings";
    default:
        return "Unknown";
    }
}

struct PermissionNegotiator::Impl
{
    std::shared_ptr<IPlatformBridge> platform;

    std::mutex mutex;
    std::map<std::string, std::shared_future<AccessResult>> inflight;
    std::optional<PermissionTier> tier;

    // Runs request unless one for the same capability is already running, in which
    // case the caller waits for that one's result.
    AccessResult runExclusive(const std::string& capability, const std::function<AccessResult()>& request)
    {
        std::promise<AccessResult> promise;
        std::shared_future<AccessResult> pending;
        bool owner = false;
        {
            std::lock_guard<std::mutex> lock(mutex);
            auto it = inflight.find(capability);
            if (it != inflight.end())
            {
                pending = it->second;
            }
            else
            {
                pending = promise.get_future().share();
                inflight.emplace(capability, pending);
                owner = true;
            }
        }

        if (!owner)
        {
            PLOG_DEBUG << "Joining in-flight permission request: " << capability;
            return pending.get();
        }

        AccessResult result = AccessResult::Denied;
        try
        {
            result = request();
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Platform error while negotiating " << capability << ": " << ex.what();
            result = AccessResult::Denied;
        }
        catch (...)
        {
            PLOG_ERROR << "Unknown platform failure while negotiating " << capability;
            result = AccessResult::Denied;
        }

        {
            std::lock_guard<std::mutex> lock(mutex);
            inflight.erase(capability);
        }
        promise.set_value(result);
        return result;
    }

    bool holds(const TierRequirements& req)
    {
        bool any = false;
        bool all = true;
        for (Grant grant : req.grants)
        {
            if (platform->checkGrant(grant))
                any = true;
            else
                all = false;
        }
        return req.anyOf ? any : all;
    }

    AccessResult negotiateStorage(PermissionTier tier)
    {
        // All-files access covers every tier
        if (platform->checkGrant(Grant::ManageAllFiles))
            return AccessResult::Granted;

        const TierRequirements& req = requirementsFor(tier);
        if (holds(req))
            return AccessResult::Granted;

        bool any = false;
        bool all = true;
        for (Grant grant : req.grants)
        {
            bool granted = platform->checkGrant(grant) || platform->requestGrant(grant);
            PLOG_INFO << "Storage grant " << toString(grant) << (granted ? " granted" : " refused");
            if (granted)
                any = true;
            else
                all = false;
        }

        if (req.anyOf ? any : all)
            return AccessResult::Granted;

        if (req.settingsFallback)
        {
            PLOG_INFO << "Opening settings page " << toString(req.settingsPage) << " for tier " << toString(tier);
            platform->openSettings(req.settingsPage);
            return AccessResult::NeedsSettings;
        }

        return AccessResult::Denied;
    }
};

PermissionNegotiator::PermissionNegotiator(std::shared_ptr<IPlatformBridge> platform)
    : impl_(std::make_unique<Impl>())
{
    impl_->platform = std::move(platform);
}

PermissionNegotiator::~PermissionNegotiator() = default;

bool PermissionNegotiator::currentTier(PermissionTier& outTier)
{
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (impl_->tier)
        {
            outTier = *impl_->tier;
            return true;
        }
    }

    try
    {
        int version = impl_->platform->osVersion();
        PermissionTier tier = classifyTier(version);
        PLOG_INFO << "Platform version " << version << " classified as " << toString(tier);

        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->tier = tier;
        outTier = tier;
        return true;
    }
    catch (const std::exception& ex)
    {
        PLOG_ERROR << "Unable to read platform version: " << ex.what();
        return false;
    }
}

AccessResult PermissionNegotiator::ensureStorageAccess(PermissionTier tier)
{
    std::string capability = std::string("storage:") + toString(tier);
    AccessResult result = impl_->runExclusive(capability, [this, tier]() { return impl_->negotiateStorage(tier); });
    PLOG_DEBUG << "Storage access for " << toString(tier) << ": " << toString(result);
    return result;
}

AccessResult PermissionNegotiator::ensureStorageAccess()
{
    PermissionTier tier = PermissionTier::Legacy;
    if (!currentTier(tier))
        return AccessResult::Denied;
    return ensureStorageAccess(tier);
}

AccessResult PermissionNegotiator::ensureInstallAccess(Interaction interaction)
{
    if (interaction == Interaction::Passive)
    {
        try
        {
            return impl_->platform->hasInstallPermission() ? AccessResult::Granted : AccessResult::NeedsSettings;
        }
        catch (const std::exception& ex)
        {
            PLOG_ERROR << "Platform error while checking installer consent: " << ex.what();
            return AccessResult::Denied;
        }
    }

    return impl_->runExclusive("install",
                               [this]()
                               {
                                   if (impl_->platform->hasInstallPermission())
                                       return AccessResult::Granted;

                                   PLOG_INFO << "Installer consent missing, starting settings flow";
                                   impl_->platform->requestInstallPermission();
                                   return AccessResult::NeedsSettings;
                               });
}

} // namespace sideload
