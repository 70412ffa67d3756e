#include <catch2/catch_test_macros.hpp>
#include "sideload/controller/TransferController.hpp"
#include "utils/mock_http.hpp"
#include "utils/mock_platform.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>

using namespace sideload;
using namespace test_utils;

namespace {

const std::string kUrl = "https://example.com/builds/app.apk";

struct ControllerHarness {
    TempDir dir;
    std::shared_ptr<FakePlatformBridge> platform;
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::shared_ptr<MemoryKeyValueStore> store = std::make_shared<MemoryKeyValueStore>();
    std::shared_ptr<RecordingNotificationSink> sink = std::make_shared<RecordingNotificationSink>();
    std::shared_ptr<RecordingUsageCounter> usage = std::make_shared<RecordingUsageCounter>();

    explicit ControllerHarness(int os_version = 28)
        : platform(std::make_shared<FakePlatformBridge>(os_version)) {
        http->setResponse(kUrl, MockResponses::package(8 * 1024));
    }

    ControllerDependencies deps() const {
        ControllerDependencies d;
        d.platform = platform;
        d.http = http;
        d.store = store;
        d.notifications = sink;
        d.usageCounter = usage;
        d.download.directory = dir.path().string();
        d.download.progressByteBucket = 1024;
        d.installMode = InstallMode::Intent;
        return d;
    }

    int countTitle(const std::string& title) const {
        int count = 0;
        for (const auto& n : sink->all()) {
            if (n.title == title) {
                ++count;
            }
        }
        return count;
    }
};

}  // namespace

TEST_CASE("TransferController - full pipeline", "[controller]") {
    ControllerHarness h;
    h.platform->allowRequest(Grant::Storage);
    h.platform->setInstallPermission(true);

    TransferController controller(h.deps());
    int progress_events = 0;
    auto outcome = controller.fetchAndInstall(kUrl, "Demo App", [&](const TransferProgress&) { ++progress_events; });

    REQUIRE(outcome.kind == OutcomeKind::Success);
    REQUIRE(outcome.succeeded());
    REQUIRE(progress_events > 0);
    REQUIRE(h.usage->calls == 1);
    REQUIRE(h.sink->hasTitle("Download Complete"));
    REQUIRE(h.platform->install_calls == 1);
    REQUIRE(h.platform->installModes().front() == InstallMode::Intent);
    REQUIRE_FALSE(controller.pendingInstallation().has_value());

    auto installed = h.platform->installedPaths().front();
    REQUIRE(std::filesystem::path(installed).parent_path() == h.dir.path());
    REQUIRE(std::filesystem::path(installed).filename().string().rfind("Demo_App_", 0) == 0);
}

TEST_CASE("TransferController - storage prompt is idempotent across runs", "[controller][permission]") {
    ControllerHarness h;
    h.platform->allowRequest(Grant::Storage);
    h.platform->setInstallPermission(true);

    {
        TransferController first(h.deps());
        REQUIRE(first.fetchAndInstall(kUrl, "app", nullptr).succeeded());
    }
    {
        TransferController second(h.deps());
        REQUIRE(second.fetchAndInstall(kUrl, "app", nullptr).succeeded());
    }
    REQUIRE(h.platform->request_grant_calls == 1);
}

TEST_CASE("TransferController - outcome mapping", "[controller]") {
    SECTION("Settings-only storage access") {
        ControllerHarness h(31);
        TransferController controller(h.deps());
        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::PermissionDenied);
        REQUIRE(outcome.needsSettings);
        REQUIRE(h.http->getUrls().empty());
    }

    SECTION("Refused storage access") {
        ControllerHarness h(28);
        TransferController controller(h.deps());
        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::PermissionDenied);
        REQUIRE_FALSE(outcome.needsSettings);
    }

    SECTION("Download failure skips installation") {
        ControllerHarness h;
        h.platform->hold(Grant::Storage);
        h.http->setResponse(kUrl, MockResponses::network_error());
        TransferController controller(h.deps());

        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::DownloadFailed);
        REQUIRE(outcome.error == TransferError::DownloadFailed);
        REQUIRE(h.platform->install_calls == 0);
        REQUIRE(h.usage->calls == 0);
        REQUIRE(h.sink->hasTitle("Download Failed"));
    }

    SECTION("Corrupt download keeps its cause") {
        ControllerHarness h;
        h.platform->hold(Grant::Storage);
        h.http->setResponse(kUrl, MockResponses::package(200));
        TransferController controller(h.deps());

        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::DownloadFailed);
        REQUIRE(outcome.error == TransferError::CorruptDownload);
    }

    SECTION("Installer rejection") {
        ControllerHarness h;
        h.platform->hold(Grant::Storage);
        h.platform->setInstallPermission(true);
        h.platform->setInstallSucceeds(false);
        TransferController controller(h.deps());

        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::InstallFailed);
        REQUIRE(outcome.error == TransferError::InstallRejected);
        REQUIRE(controller.pendingInstallation().has_value());
    }
}

TEST_CASE("TransferController - deferred install resumes", "[controller][install]") {
    ControllerHarness h;
    h.platform->hold(Grant::Storage);

    {
        TransferController controller(h.deps());
        auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
        REQUIRE(outcome.kind == OutcomeKind::InstallDeferred);
        REQUIRE(outcome.needsSettings);
        REQUIRE(controller.pendingInstallation().has_value());

        // Consent still missing on the next foreground
        REQUIRE(controller.resumePendingInstallation().kind == OutcomeKind::InstallDeferred);
    }

    h.platform->setInstallPermission(true);
    TransferController restarted(h.deps());
    auto outcome = restarted.resumePendingInstallation();
    REQUIRE(outcome.kind == OutcomeKind::Success);
    REQUIRE(h.platform->installModes() == std::vector<InstallMode>{InstallMode::Session});
    REQUIRE(restarted.resumePendingInstallation().kind == OutcomeKind::NothingToResume);
}

TEST_CASE("TransferController - cancellation", "[controller][cancel]") {
    ControllerHarness h;
    h.platform->hold(Grant::Storage);
    TransferController controller(h.deps());

    h.http->onChunk([&](std::size_t index) {
        if (index == 2) {
            controller.cancelActiveTransfer();
        }
    });

    auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
    REQUIRE(outcome.kind == OutcomeKind::Cancelled);
    REQUIRE(h.sink->hasTitle("Download Cancelled"));
    REQUIRE(h.platform->install_calls == 0);
    REQUIRE(std::filesystem::is_empty(h.dir.path()));

    // Cancelling with nothing running is harmless
    controller.cancelActiveTransfer();
}

TEST_CASE("TransferController - concurrent fetches are cancelled independently", "[controller][cancel]") {
    ControllerHarness h;
    h.platform->hold(Grant::Storage);
    const std::string other = "https://example.com/builds/other.apk";
    h.http->setResponse(other, MockResponses::package(8 * 1024));

    TransferController controller(h.deps());

    // Holds both downloads at their second chunk until both are streaming
    std::mutex mutex;
    std::condition_variable arrived;
    int streaming = 0;
    bool cancel_when_both = false;
    h.http->onChunk([&](std::size_t index) {
        if (index != 1) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex);
        ++streaming;
        arrived.notify_all();
        arrived.wait_for(lock, std::chrono::seconds(5), [&]() { return streaming >= 2; });
        if (cancel_when_both && streaming == 2) {
            ++streaming;
            lock.unlock();
            controller.cancelActiveTransfer();
        }
    });

    SECTION("Starting a second fetch leaves the first running") {
        auto first = std::async(std::launch::async, [&]() { return controller.fetchAndInstall(kUrl, "First", nullptr); });
        auto second =
            std::async(std::launch::async, [&]() { return controller.fetchAndInstall(other, "Second", nullptr); });

        auto a = first.get();
        auto b = second.get();
        REQUIRE(a.kind != OutcomeKind::Cancelled);
        REQUIRE(b.kind != OutcomeKind::Cancelled);
        REQUIRE(a.kind != OutcomeKind::DownloadFailed);
        REQUIRE(b.kind != OutcomeKind::DownloadFailed);
        REQUIRE(h.countTitle("Download Complete") == 2);
        REQUIRE_FALSE(h.sink->hasTitle("Download Cancelled"));
    }

    SECTION("cancelActiveTransfer reaches every running fetch") {
        cancel_when_both = true;
        auto first = std::async(std::launch::async, [&]() { return controller.fetchAndInstall(kUrl, "First", nullptr); });
        auto second =
            std::async(std::launch::async, [&]() { return controller.fetchAndInstall(other, "Second", nullptr); });

        REQUIRE(first.get().kind == OutcomeKind::Cancelled);
        REQUIRE(second.get().kind == OutcomeKind::Cancelled);
        REQUIRE(h.platform->install_calls == 0);
        REQUIRE(std::filesystem::is_empty(h.dir.path()));
    }
}

TEST_CASE("TransferController - collaborator failures do not change the outcome", "[controller]") {
    ControllerHarness h;
    h.platform->hold(Grant::Storage);
    h.platform->setInstallPermission(true);
    h.usage->fail = true;

    TransferController controller(h.deps());
    auto outcome = controller.fetchAndInstall(kUrl, "app", nullptr);
    REQUIRE(outcome.succeeded());
    REQUIRE(h.usage->calls == 1);
}

TEST_CASE("TransferController - download notifications", "[controller]") {
    ControllerHarness h;
    h.platform->hold(Grant::Storage);
    h.platform->setInstallPermission(true);
    h.http->setResponse(kUrl, MockResponses::package(100 * 1024));

    TransferController controller(h.deps());
    REQUIRE(controller.fetchAndInstall(kUrl, "Demo", nullptr).succeeded());

    // Start plus at most one update per 10 % step
    int updates = h.countTitle("Downloading Demo");
    REQUIRE(updates >= 2);
    REQUIRE(updates <= 12);

    int last_percent = -1;
    for (const auto& n : h.sink->all()) {
        if (n.title == "Downloading Demo") {
            REQUIRE(n.percent >= last_percent);
            last_percent = n.percent;
        }
    }
    REQUIRE(last_percent == 100);
}

TEST_CASE("TransferController - user messages", "[controller][messages]") {
    SECTION("Transfer outcomes") {
        REQUIRE(TransferController::describe(TransferOutcome(OutcomeKind::Success, TransferError::None)).messageClass ==
                MessageClass::Success);
        REQUIRE(TransferController::describe(TransferOutcome(OutcomeKind::Cancelled, TransferError::Cancelled))
                    .messageClass == MessageClass::Info);

        TransferOutcome denied(OutcomeKind::PermissionDenied, TransferError::PermissionDenied);
        denied.needsSettings = true;
        auto message = TransferController::describe(denied);
        REQUIRE(message.messageClass == MessageClass::PermissionSettings);
        REQUIRE(message.offerSettings);

        auto failed = TransferController::describe(
            TransferOutcome(OutcomeKind::DownloadFailed, TransferError::DownloadFailed, "timeout"));
        REQUIRE(failed.messageClass == MessageClass::Retryable);
        REQUIRE(failed.text == "Download failed: timeout");

        auto invalid = TransferController::describe(
            TransferOutcome(OutcomeKind::DownloadFailed, TransferError::InvalidUrl, "bad scheme"));
        REQUIRE(invalid.text.find("link is invalid") != std::string::npos);

        auto deferred = TransferController::describe(
            TransferOutcome(OutcomeKind::InstallDeferred, TransferError::InstallDeferred));
        REQUIRE(deferred.messageClass == MessageClass::PermissionSettings);
        REQUIRE(deferred.offerSettings);

        REQUIRE(TransferController::describe(TransferOutcome(OutcomeKind::NothingToResume, TransferError::None)).text ==
                "No pending installation");
    }

    SECTION("Upload batches") {
        UploadBatchResult result;
        result.files.resize(3);
        result.files[0].status = FileUploadStatus::Uploaded;
        result.cancelled = true;
        result.error = TransferError::Cancelled;
        auto cancelled = TransferController::describe(result);
        REQUIRE(cancelled.messageClass == MessageClass::Info);
        REQUIRE(cancelled.text == "Upload cancelled, 1 of 3 file(s) uploaded");

        result.files[1].status = FileUploadStatus::Failed;
        result.error = TransferError::UploadFailed;
        REQUIRE(TransferController::describe(result).messageClass == MessageClass::Retryable);

        result.files[1].status = FileUploadStatus::Uploaded;
        result.files[2].status = FileUploadStatus::Uploaded;
        result.cancelled = false;
        result.error = TransferError::None;
        REQUIRE(TransferController::describe(result).text == "Uploaded 3 of 3 file(s)");
    }
}

TEST_CASE("TransferController - destination file names", "[controller][download]") {
    REQUIRE(TransferController::makeDestinationFileName("My App!", "https://x.com/y/app.xapk", 42) ==
            "My_App_42.xapk");
    REQUIRE(TransferController::makeDestinationFileName("game.APKS", kUrl, 42) == "game_42.apks");
    REQUIRE(TransferController::makeDestinationFileName("", "https://x.com/download", 42) == "file_42.apk");
    REQUIRE(TransferController::makeDestinationFileName("../../etc/passwd", kUrl, 7) == "etc_passwd_7.apk");
    REQUIRE(TransferController::makeDestinationFileName("notes.txt", "https://x.com/a.zip", 1) == "notes_txt_1.zip");
}
