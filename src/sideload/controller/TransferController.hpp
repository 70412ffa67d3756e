#pragma once

#include "../api/Collaborators.hpp"
#include "../api/TransferTypes.hpp"
#include "../http/IHttpClient.hpp"
#include "../install/InstallOrchestrator.hpp"
#include "../install/PendingInstallStore.hpp"
#include "../permission/PermissionNegotiator.hpp"
#include "../platform/IPlatformBridge.hpp"
#include "../transfer/DownloadEngine.hpp"
#include "../upload/UploadEngine.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace sideload
{

struct FetchRequest
{
    std::string url;
    std::string displayName;
    std::string expectedSha256; // Optional, hex
};

// Everything the controller needs from its host. Only platform, http and store are required.
struct ControllerDependencies
{
    std::shared_ptr<IPlatformBridge> platform;
    std::shared_ptr<IHttpClient> http;
    std::shared_ptr<IKeyValueStore> store;
    std::shared_ptr<INotificationSink> notifications;
    std::shared_ptr<IUsageCounter> usageCounter;
    DownloadSettings download;
    InstallMode installMode = InstallMode::Session;
};

// Entry point for the host: storage access, download, install, and the mapping
// of every branch onto one TransferOutcome.
class TransferController
{
public:
    static constexpr int kDownloadNotificationBase = 0;

    explicit TransferController(ControllerDependencies deps);
    ~TransferController();

    TransferController(const TransferController&) = delete;
    TransferController& operator=(const TransferController&) = delete;

    TransferOutcome fetchAndInstall(const std::string& url, const std::string& displayName,
                                    ProgressCallback onProgress);
    TransferOutcome fetchAndInstall(const FetchRequest& request, ProgressCallback onProgress);

    // Call on every start and foreground event
    TransferOutcome resumePendingInstallation();

    // Cancels every running fetch. Safe from any thread.
    void cancelActiveTransfer();

    PermissionNegotiator& permissions();
    std::optional<PendingInstallation> pendingInstallation() const;

    // The single place outcomes become user-facing messages
    static UserMessage describe(const TransferOutcome& outcome);
    static UserMessage describe(const UploadBatchResult& result);

    // "<name>_<millis>.<ext>" with the name reduced to safe characters
    static std::string makeDestinationFileName(const std::string& displayName, const std::string& url,
                                               std::int64_t millis);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sideload
