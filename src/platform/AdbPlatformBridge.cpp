#include "AdbPlatformBridge.hpp"
#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <utility>

using sideload::Grant;
using sideload::InstallMode;
using sideload::PlatformError;
using sideload::SettingsPage;

namespace
{

constexpr const char* kGranted = "granted";

std::string trim(const std::string& s)
{
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

AdbPlatformBridge::AdbPlatformBridge(Settings settings, std::shared_ptr<sideload::IKeyValueStore> store,
                                     std::istream& in, std::ostream& out)
    : settings_(std::move(settings))
    , store_(std::move(store))
    , in_(in)
    , out_(out)
{
}

int AdbPlatformBridge::osVersion()
{
    if (settings_.osVersionOverride > 0)
        return settings_.osVersionOverride;

    std::vector<std::string> args;
    if (!settings_.serial.empty())
    {
        args.push_back("-s");
        args.push_back(settings_.serial);
    }
    args.insert(args.end(), { "shell", "getprop", "ro.build.version.sdk" });

    std::string output;
    int exitCode = -1;
    if (!utils::ProcessUtils::RunProcess(settings_.adb, args, output, exitCode))
        throw PlatformError("could not run " + settings_.adb);
    if (exitCode != 0)
        throw PlatformError("device query failed: " + trim(output));

    std::string value = trim(output);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }))
        throw PlatformError("unexpected SDK version '" + value + "'");

    int version = std::stoi(value);
    PLOG_INFO << "Device reports SDK " << version;
    return version;
}

bool AdbPlatformBridge::checkGrant(Grant grant)
{
    return readConsent(ConsentKey(grant));
}

bool AdbPlatformBridge::requestGrant(Grant grant)
{
    if (checkGrant(grant))
        return true;

    // Only reachable from a settings page
    if (grant == Grant::ManageAllFiles)
        return false;

    if (!promptYesNo(std::string("Allow sideload to use ") + sideload::toString(grant) + " access?"))
    {
        PLOG_INFO << "User refused " << sideload::toString(grant);
        return false;
    }

    std::string error;
    if (!writeConsent(ConsentKey(grant), true, error))
    {
        PLOG_ERROR << "Could not record grant: " << error;
        return false;
    }
    return true;
}

void AdbPlatformBridge::openSettings(SettingsPage page)
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    switch (page)
    {
    case SettingsPage::AllFilesAccess:
        out_ << "All files access is required. Run 'sideload grant manage-all-files', then retry.\n";
        break;
    case SettingsPage::UnknownAppSources:
        out_ << "Installing from this source is not allowed yet. Run 'sideload grant install', "
                "then 'sideload resume'.\n";
        break;
    }
    out_.flush();
}

bool AdbPlatformBridge::hasInstallPermission()
{
    return readConsent(kInstallConsentKey);
}

void AdbPlatformBridge::requestInstallPermission()
{
    openSettings(SettingsPage::UnknownAppSources);
}

std::vector<std::string> AdbPlatformBridge::buildInstallArgs(const std::string& path, InstallMode mode) const
{
    std::vector<std::string> args;
    if (!settings_.serial.empty() && settings_.installer == settings_.adb)
    {
        args.push_back("-s");
        args.push_back(settings_.serial);
    }
    args.insert(args.end(), settings_.installerArgs.begin(), settings_.installerArgs.end());
    args.push_back(mode == InstallMode::Session ? "--streaming" : "--no-streaming");
    args.push_back(path);
    return args;
}

bool AdbPlatformBridge::install(const std::string& path, InstallMode mode)
{
    auto args = buildInstallArgs(path, mode);

    std::string output;
    int exitCode = -1;
    if (!utils::ProcessUtils::RunProcess(settings_.installer, args, output, exitCode))
        throw PlatformError("could not run installer " + settings_.installer);

    bool ok = exitCode == 0 && output.find("Success") != std::string::npos;
    if (ok)
        PLOG_INFO << "Installer accepted " << path << " (" << sideload::toString(mode) << ")";
    else
        PLOG_WARNING << "Installer refused " << path << " exit=" << exitCode << ": " << trim(output);
    return ok;
}

bool AdbPlatformBridge::setGrant(Grant grant, bool granted, std::string& outError)
{
    return writeConsent(ConsentKey(grant), granted, outError);
}

bool AdbPlatformBridge::setInstallConsent(bool granted, std::string& outError)
{
    return writeConsent(kInstallConsentKey, granted, outError);
}

bool AdbPlatformBridge::ParseGrantName(const std::string& name, Grant& outGrant)
{
    for (Grant g : { Grant::Storage, Grant::ManageAllFiles, Grant::MediaImages, Grant::MediaVideo })
    {
        if (name == sideload::toString(g))
        {
            outGrant = g;
            return true;
        }
    }
    return false;
}

std::string AdbPlatformBridge::ConsentKey(Grant grant)
{
    return std::string("consent.") + sideload::toString(grant);
}

bool AdbPlatformBridge::readConsent(const std::string& key)
{
    auto value = store_->get(key);
    return value && *value == kGranted;
}

bool AdbPlatformBridge::writeConsent(const std::string& key, bool granted, std::string& outError)
{
    try
    {
        if (granted)
            store_->set(key, kGranted);
        else
            store_->remove(key);
        return true;
    }
    catch (const sideload::StoreError& ex)
    {
        outError = ex.what();
        return false;
    }
}

bool AdbPlatformBridge::promptYesNo(const std::string& question)
{
    std::lock_guard<std::mutex> lock(io_mutex_);
    out_ << question << " [y/N] ";
    out_.flush();

    std::string answer;
    if (!std::getline(in_, answer))
        return false;

    answer = trim(answer);
    return answer == "y" || answer == "Y" || answer == "yes";
}
