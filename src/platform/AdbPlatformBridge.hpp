#pragma once

#include "sideload/api/Collaborators.hpp"
#include "sideload/platform/IPlatformBridge.hpp"

#include <iosfwd>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// Platform bridge for a device reached through adb.
//
// Runtime grants and installer consent are recorded by the user on the command
// line and kept in the durable store, so a settings trip is a `sideload grant`
// invocation followed by `sideload resume`.
class AdbPlatformBridge : public sideload::IPlatformBridge
{
public:
    struct Settings
    {
        std::string adb = "adb";
        std::string serial;
        int osVersionOverride = 0; // > 0 skips the device query
        std::string installer = "adb";
        std::vector<std::string> installerArgs{ "install", "-r" };
    };

    AdbPlatformBridge(Settings settings, std::shared_ptr<sideload::IKeyValueStore> store, std::istream& in,
                      std::ostream& out);

    int osVersion() override;
    bool checkGrant(sideload::Grant grant) override;
    bool requestGrant(sideload::Grant grant) override;
    void openSettings(sideload::SettingsPage page) override;
    bool hasInstallPermission() override;
    void requestInstallPermission() override;
    bool install(const std::string& path, sideload::InstallMode mode) override;

    // Command-line consent management
    bool setGrant(sideload::Grant grant, bool granted, std::string& outError);
    bool setInstallConsent(bool granted, std::string& outError);

    static bool ParseGrantName(const std::string& name, sideload::Grant& outGrant);
    static std::string ConsentKey(sideload::Grant grant);
    static constexpr const char* kInstallConsentKey = "consent.install";

    // Arguments passed to the installer for one package
    std::vector<std::string> buildInstallArgs(const std::string& path, sideload::InstallMode mode) const;

private:
    bool readConsent(const std::string& key);
    bool writeConsent(const std::string& key, bool granted, std::string& outError);
    bool promptYesNo(const std::string& question);

    Settings settings_;
    std::shared_ptr<sideload::IKeyValueStore> store_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex io_mutex_;
};
