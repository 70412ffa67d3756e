#include <catch2/catch_test_macros.hpp>
#include "sideload/upload/UploadEngine.hpp"
#include "utils/mock_http.hpp"
#include "utils/mock_platform.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sideload;
using test_utils::MockHttpClient;
using test_utils::MockResponse;
using test_utils::MockResponses;
using test_utils::TempDir;

namespace {

const std::string kEndpoint = "https://upload.example.com/o/";

struct UploadFixture {
    TempDir dir;
    std::shared_ptr<MockHttpClient> http = std::make_shared<MockHttpClient>();
    std::vector<UploadItem> items;

    explicit UploadFixture(int count) {
        for (int i = 1; i <= count; ++i) {
            std::string name = "file" + std::to_string(i) + ".apk";
            std::string path = dir.write(name, test_utils::packageBytes(3000));
            items.push_back({path, "builds/" + name});
        }
    }

    std::string target(int i) const {
        return "https://upload.example.com/o/builds%2Ffile" + std::to_string(i) + ".apk";
    }

    void acceptAll() {
        for (int i = 1; i <= static_cast<int>(items.size()); ++i) {
            http->setResponse(target(i), MockResponses::upload_ok("https://cdn.example.com/file" + std::to_string(i)));
        }
    }
};

}  // namespace

TEST_CASE("UploadEngine - target URLs", "[upload]") {
    auto http = std::make_shared<MockHttpClient>();
    UploadEngine engine(http, UploadSettings{kEndpoint, 1});
    REQUIRE(engine.targetUrl("apps/app v2.apk") == "https://upload.example.com/o/apps%2Fapp%20v2.apk");

    UploadEngine bare(http, UploadSettings{"https://upload.example.com/o", 1});
    REQUIRE(bare.targetUrl("a.apk") == "https://upload.example.com/o/a.apk");
}

TEST_CASE("UploadEngine - batch upload", "[upload]") {
    UploadFixture fixture(3);
    fixture.acceptAll();
    UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 3});

    std::mutex mutex;
    std::vector<int> aggregate;
    auto result = engine.uploadBatch(
        fixture.items,
        [&](int percent) {
            std::lock_guard<std::mutex> lock(mutex);
            aggregate.push_back(percent);
        },
        std::make_shared<CancellationToken>());

    REQUIRE(result.ok());
    REQUIRE(result.uploadedCount() == 3);
    REQUIRE(result.remoteUrls() == std::vector<std::string>{"https://cdn.example.com/file1",
                                                            "https://cdn.example.com/file2",
                                                            "https://cdn.example.com/file3"});
    REQUIRE(engine.activeUploadCount() == 0);

    SECTION("Aggregate progress rises to 100") {
        REQUIRE_FALSE(aggregate.empty());
        for (std::size_t i = 1; i < aggregate.size(); ++i) {
            REQUIRE(aggregate[i] > aggregate[i - 1]);
        }
        REQUIRE(aggregate.back() == 100);
    }

    SECTION("Packages are sent with the package content type") {
        for (const auto& type : fixture.http->putContentTypes()) {
            REQUIRE(type == "application/vnd.android.package-archive");
        }
    }
}

TEST_CASE("UploadEngine - remote URL fallbacks", "[upload]") {
    UploadFixture fixture(1);
    UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 1});

    SECTION("Token list builds a download URL") {
        MockResponse response;
        response.body = R"({"name":"builds/file1.apk","downloadTokens":"tok1,tok2"})";
        fixture.http->setResponse(fixture.target(1), response);
        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr);
        REQUIRE(result.files[0].remoteUrl == fixture.target(1) + "?alt=media&token=tok1");
    }

    SECTION("Non-JSON reply falls back to the target") {
        MockResponse response;
        response.body = "OK";
        fixture.http->setResponse(fixture.target(1), response);
        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr);
        REQUIRE(result.files[0].status == FileUploadStatus::Uploaded);
        REQUIRE(result.files[0].remoteUrl == fixture.target(1));
    }
}

TEST_CASE("UploadEngine - cancellation", "[upload][cancel]") {
    UploadFixture fixture(3);
    fixture.acceptAll();
    UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 1});
    auto token = std::make_shared<CancellationToken>();

    SECTION("Cancel after the first file keeps it and skips the rest") {
        auto result = engine.uploadBatch(fixture.items, nullptr, token,
                                         [&](std::size_t index, const TransferProgress& progress) {
                                             if (index == 0 && progress.percent == 100) {
                                                 token->cancel();
                                             }
                                         });

        REQUIRE(result.cancelled);
        REQUIRE(result.error == TransferError::Cancelled);
        REQUIRE(result.files[0].status == FileUploadStatus::Uploaded);
        REQUIRE(result.files[1].status == FileUploadStatus::NotStarted);
        REQUIRE(result.files[2].status == FileUploadStatus::NotStarted);
        REQUIRE(result.remoteUrls() == std::vector<std::string>{"https://cdn.example.com/file1"});
        REQUIRE(fixture.http->putUrls().size() == 1);
    }

    SECTION("Cancel during an upload aborts it") {
        fixture.http->onPut([&](const std::string& url) {
            if (url == fixture.target(2)) {
                token->cancel();
            }
        });

        auto result = engine.uploadBatch(fixture.items, nullptr, token);
        REQUIRE(result.cancelled);
        REQUIRE(result.files[0].status == FileUploadStatus::Uploaded);
        REQUIRE(result.files[1].status == FileUploadStatus::Cancelled);
        REQUIRE(result.files[2].status == FileUploadStatus::NotStarted);
    }

    SECTION("cancelAllUploads reaches batches it did not start") {
        std::size_t active_during_put = 0;
        fixture.http->onPut([&](const std::string& url) {
            if (url == fixture.target(1)) {
                active_during_put = engine.activeUploadCount();
                engine.cancelAllUploads();
            }
        });

        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr);
        REQUIRE(active_during_put == 1);
        REQUIRE(result.cancelled);
        REQUIRE(result.files[0].status == FileUploadStatus::Cancelled);
        REQUIRE(result.uploadedCount() == 0);
        REQUIRE(engine.activeUploadCount() == 0);
    }
}

TEST_CASE("UploadEngine - failures", "[upload]") {
    UploadFixture fixture(3);
    fixture.acceptAll();
    UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 1});

    SECTION("Server error marks one file and the batch continues") {
        MockResponse rejected;
        rejected.status_code = 500;
        rejected.body = "Internal Server Error";
        fixture.http->setResponse(fixture.target(2), rejected);

        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr);
        REQUIRE(result.error == TransferError::UploadFailed);
        REQUIRE_FALSE(result.cancelled);
        REQUIRE(result.files[1].status == FileUploadStatus::Failed);
        REQUIRE(result.files[1].error == "HTTP error 500");
        REQUIRE(result.uploadedCount() == 2);
    }

    SECTION("Missing local file fails without a request") {
        fixture.items[0].localPath = fixture.dir.file("missing.apk");
        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr);
        REQUIRE(result.files[0].status == FileUploadStatus::Failed);
        REQUIRE(fixture.http->putUrls().size() == 2);
    }

    SECTION("Empty batch is a no-op") {
        auto result = engine.uploadBatch({}, nullptr, nullptr);
        REQUIRE(result.ok());
        REQUIRE(result.files.empty());
    }
}

TEST_CASE("UploadEngine - file progress from parallel workers", "[upload]") {
    UploadFixture fixture(4);
    fixture.acceptAll();
    fixture.http->setPutSteps(5);
    UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 4});

    std::atomic<int> inside{0};
    std::atomic<int> overlap{0};
    std::vector<int> calls(4, 0);
    auto result = engine.uploadBatch(fixture.items, nullptr, nullptr,
                                     [&](std::size_t index, const TransferProgress&) {
                                         if (inside.fetch_add(1) != 0) {
                                             overlap++;
                                         }
                                         calls[index]++;
                                         std::this_thread::sleep_for(std::chrono::milliseconds(2));
                                         inside.fetch_sub(1);
                                     });

    REQUIRE(result.ok());
    REQUIRE(overlap.load() == 0);
    for (int count : calls) {
        REQUIRE(count == 6);  // five send ticks and the confirmed completion
    }
}

TEST_CASE("UploadEngine - throwing observers", "[upload]") {
    UploadFixture fixture(2);
    fixture.acceptAll();

    SECTION("A file observer failing mid-send fails that file only") {
        UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 2});
        auto result = engine.uploadBatch(fixture.items, nullptr, nullptr,
                                         [](std::size_t index, const TransferProgress&) {
                                             if (index == 1) {
                                                 throw std::runtime_error("observer gone");
                                             }
                                         });

        REQUIRE(result.files[0].status == FileUploadStatus::Uploaded);
        REQUIRE(result.files[1].status == FileUploadStatus::Failed);
        REQUIRE(result.error == TransferError::UploadFailed);
        REQUIRE(engine.activeBatchCount() == 0);
        REQUIRE(engine.activeUploadCount() == 0);
    }

    SECTION("A batch observer failing after completion keeps the upload") {
        UploadEngine engine(fixture.http, UploadSettings{kEndpoint, 1});
        auto result = engine.uploadBatch(
            fixture.items,
            [](int percent) {
                if (percent == 100) {
                    throw std::runtime_error("observer gone");
                }
            },
            nullptr);

        REQUIRE(result.files[0].status == FileUploadStatus::Uploaded);
        REQUIRE(result.files[1].status == FileUploadStatus::Uploaded);
        REQUIRE(engine.activeBatchCount() == 0);
    }
}
