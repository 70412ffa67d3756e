#include "TransferController.hpp"

#include <plog/Log.h>

#include <atomic>
#include <cctype>
#include <filesystem>
#include <map>
#include <mutex>
#include <utility>

namespace fs = std::filesystem;

namespace sideload
{

namespace
{

std::string formatBytes(std::uint64_t bytes)
{
    if (bytes < 1024)
        return std::to_string(bytes) + " B";
    if (bytes < 1024 * 1024)
        return std::to_string(bytes / 1024) + " KB";
    return std::to_string(bytes / (1024 * 1024)) + " MB";
}

bool isPackageExtension(const std::string& ext)
{
    return ext == "apk" || ext == "apks" || ext == "xapk" || ext == "aab" || ext == "zip";
}

} // namespace

struct TransferController::Impl
{
    ControllerDependencies deps;
    PermissionNegotiator permissions;
    PendingInstallStore pending;
    DownloadEngine downloads;
    InstallOrchestrator installer;

    std::mutex activeMutex;
    std::map<std::uint64_t, CancellationTokenPtr> activeTokens;
    std::uint64_t nextTransferId = 1;
    std::atomic<int> nextNotificationId{ 0 };

    explicit Impl(ControllerDependencies d)
        : deps(std::move(d))
        , permissions(deps.platform)
        , pending(deps.store)
        , downloads(deps.http, deps.download)
        , installer(deps.platform, permissions, pending, deps.installMode, deps.notifications)
    {
    }

    std::uint64_t track(CancellationTokenPtr token)
    {
        std::lock_guard<std::mutex> lock(activeMutex);
        std::uint64_t id = nextTransferId++;
        activeTokens.emplace(id, std::move(token));
        return id;
    }

    void untrack(std::uint64_t id)
    {
        std::lock_guard<std::mutex> lock(activeMutex);
        activeTokens.erase(id);
    }

    void notify(int id, const std::string& title, const std::string& body, int percent)
    {
        if (!deps.notifications)
            return;
        try
        {
            deps.notifications->notify(id, title, body, percent);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Notification sink failed: " << ex.what();
        }
    }

    void recordUsage(const std::string& url, const std::string& displayName)
    {
        if (!deps.usageCounter)
            return;
        try
        {
            deps.usageCounter->recordDownload(url, displayName);
        }
        catch (const std::exception& ex)
        {
            PLOG_WARNING << "Usage counter update failed: " << ex.what();
        }
    }

    static TransferOutcome fromInstall(const InstallResult& result)
    {
        TransferOutcome outcome;
        switch (result.status)
        {
        case InstallStatus::Installed:
            outcome = TransferOutcome(OutcomeKind::Success, TransferError::None);
            break;
        case InstallStatus::Deferred:
        case InstallStatus::StillWaiting:
            outcome = TransferOutcome(OutcomeKind::InstallDeferred, TransferError::InstallDeferred, result.reason);
            outcome.needsSettings = true;
            break;
        case InstallStatus::NothingToResume:
            outcome = TransferOutcome(OutcomeKind::NothingToResume, TransferError::None, result.reason);
            break;
        case InstallStatus::Busy:
        case InstallStatus::Rejected:
        default:
            outcome = TransferOutcome(OutcomeKind::InstallFailed, TransferError::InstallRejected, result.reason);
            break;
        }
        outcome.filePath = result.filePath;
        return outcome;
    }
};

TransferController::TransferController(ControllerDependencies deps)
    : impl_(std::make_unique<Impl>(std::move(deps)))
{
}

TransferController::~TransferController() { cancelActiveTransfer(); }

PermissionNegotiator& TransferController::permissions() { return impl_->permissions; }

std::optional<PendingInstallation> TransferController::pendingInstallation() const { return impl_->pending.load(); }

TransferOutcome TransferController::fetchAndInstall(const std::string& url, const std::string& displayName,
                                                    ProgressCallback onProgress)
{
    return fetchAndInstall(FetchRequest{ url, displayName, {} }, std::move(onProgress));
}

TransferOutcome TransferController::fetchAndInstall(const FetchRequest& request, ProgressCallback onProgress)
{
    PLOG_INFO << "Fetch and install '" << request.displayName << "' from " << request.url;

    AccessResult storage = impl_->permissions.ensureStorageAccess();
    if (storage != AccessResult::Granted)
    {
        TransferOutcome outcome(OutcomeKind::PermissionDenied, TransferError::PermissionDenied,
                                storage == AccessResult::NeedsSettings ? "Storage access must be granted in settings"
                                                                       : "Storage permission denied");
        outcome.needsSettings = storage == AccessResult::NeedsSettings;
        PLOG_WARNING << outcome.reason;
        return outcome;
    }

    // Each fetch owns its token; concurrent fetches never cancel each other
    auto token = std::make_shared<CancellationToken>();
    std::uint64_t transferId = impl_->track(token);

    int notifyId = kDownloadNotificationBase + (impl_->nextNotificationId++ % 1000);
    std::string title = request.displayName.empty() ? "Package" : request.displayName;
    impl_->notify(notifyId, "Downloading " + title, "Starting download", 0);

    int lastStep = -1;
    auto relay = [&](const TransferProgress& progress)
    {
        if (onProgress)
            onProgress(progress);

        if (progress.sizeKnown())
        {
            int step = progress.percent / 10;
            if (step == lastStep)
                return;
            lastStep = step;
            impl_->notify(notifyId, "Downloading " + title, std::to_string(progress.percent) + "% complete",
                          progress.percent);
        }
        else
        {
            impl_->notify(notifyId, "Downloading " + title, formatBytes(progress.transferredBytes) + " downloaded", 0);
        }
    };

    std::string fileName = makeDestinationFileName(request.displayName, request.url, PendingInstallStore::nowMillis());
    DownloadResult download = impl_->downloads.download(request.url, fileName, relay, token, request.expectedSha256);

    impl_->untrack(transferId);

    if (download.cancelled())
    {
        impl_->notify(notifyId, "Download Cancelled", title, 0);
        return TransferOutcome(OutcomeKind::Cancelled, TransferError::Cancelled);
    }
    if (!download.ok())
    {
        impl_->notify(notifyId, "Download Failed", download.message, 0);
        return TransferOutcome(OutcomeKind::DownloadFailed, download.error, download.message);
    }

    impl_->notify(notifyId, "Download Complete", title + " downloaded", 100);
    impl_->recordUsage(request.url, request.displayName);

    return Impl::fromInstall(impl_->installer.install(download.filePath));
}

TransferOutcome TransferController::resumePendingInstallation()
{
    TransferOutcome outcome = Impl::fromInstall(impl_->installer.resume());
    PLOG_INFO << "Resume pending installation: " << toString(outcome.kind);
    return outcome;
}

void TransferController::cancelActiveTransfer()
{
    std::lock_guard<std::mutex> lock(impl_->activeMutex);
    if (impl_->activeTokens.empty())
        return;
    PLOG_INFO << "Cancelling " << impl_->activeTokens.size() << " active transfer(s)";
    for (auto& [id, token] : impl_->activeTokens)
        token->cancel();
}

UserMessage TransferController::describe(const TransferOutcome& outcome)
{
    switch (outcome.kind)
    {
    case OutcomeKind::Success:
        return { MessageClass::Success, "Package installed successfully", false };
    case OutcomeKind::Cancelled:
        return { MessageClass::Info, "Download cancelled", false };
    case OutcomeKind::PermissionDenied:
        if (outcome.needsSettings)
            return { MessageClass::PermissionSettings, "Storage access is required. Grant it in system settings.",
                     true };
        return { MessageClass::PermissionSettings, "Storage permission was denied. Allow it and try again.", false };
    case OutcomeKind::DownloadFailed:
        if (outcome.error == TransferError::InvalidUrl)
            return { MessageClass::Retryable, "The download link is invalid: " + outcome.reason, false };
        if (outcome.error == TransferError::CorruptDownload)
            return { MessageClass::Retryable, "The downloaded file is damaged: " + outcome.reason, false };
        return { MessageClass::Retryable, "Download failed: " + outcome.reason, false };
    case OutcomeKind::InstallDeferred:
        return { MessageClass::PermissionSettings,
                 "Allow installs from this source in system settings. Installation resumes when you return.", true };
    case OutcomeKind::InstallFailed:
        return { MessageClass::Retryable, "Installation failed: " + outcome.reason, false };
    case OutcomeKind::NothingToResume:
    default:
        return { MessageClass::Info, "No pending installation", false };
    }
}

UserMessage TransferController::describe(const UploadBatchResult& result)
{
    std::size_t total = result.files.size();
    std::string counts = std::to_string(result.uploadedCount()) + " of " + std::to_string(total);

    if (result.error == TransferError::UploadFailed)
        return { MessageClass::Retryable, "Upload failed, " + counts + " file(s) uploaded", false };
    if (result.cancelled)
        return { MessageClass::Info, "Upload cancelled, " + counts + " file(s) uploaded", false };
    return { MessageClass::Success, "Uploaded " + counts + " file(s)", false };
}

std::string TransferController::makeDestinationFileName(const std::string& displayName, const std::string& url,
                                                        std::int64_t millis)
{
    fs::path display(displayName);
    std::string ext = UrlNormalizer::pathExtension(displayName);
    std::string stem = displayName;
    if (isPackageExtension(ext))
    {
        stem = display.stem().string();
    }
    else
    {
        ext = UrlNormalizer::pathExtension(url);
        if (!isPackageExtension(ext))
            ext = "apk";
    }

    std::string safe;
    for (unsigned char c : stem)
    {
        if (std::isalnum(c) || c == '-')
            safe.push_back(static_cast<char>(c));
        else if (!safe.empty() && safe.back() != '_')
            safe.push_back('_');
    }
    while (!safe.empty() && safe.back() == '_')
        safe.pop_back();
    if (safe.empty())
        safe = "file";

    return safe + "_" + std::to_string(millis) + "." + ext;
}

} // namespace sideload
