#include "UploadEngine.hpp"
#include "UploadRegistry.hpp"
#include "../transfer/UrlNormalizer.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace sideload
{

const char* toString(FileUploadStatus status)
{
    switch (status)
    {
    case FileUploadStatus::NotStarted:
        return "NotStarted";
    case FileUploadStatus::Uploaded:
        return "Uploaded";
    case FileUploadStatus::Failed:
        return "Failed";
    case FileUploadStatus::Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}

std::vector<std::string> UploadBatchResult::remoteUrls() const
{
    std::vector<std::string> urls;
    for (const auto& file : files)
    {
        if (file.status == FileUploadStatus::Uploaded)
            urls.push_back(file.remoteUrl);
    }
    return urls;
}

std::size_t UploadBatchResult::uploadedCount() const
{
    return static_cast<std::size_t>(std::count_if(files.begin(), files.end(), [](const FileUploadResult& f)
                                                  { return f.status == FileUploadStatus::Uploaded; }));
}

namespace
{

std::string contentTypeFor(const std::string& path)
{
    std::string ext = UrlNormalizer::pathExtension(path);
    if (ext == "apk")
        return "application/vnd.android.package-archive";
    if (ext == "png")
        return "image/png";
    if (ext == "jpg" || ext == "jpeg")
        return "image/jpeg";
    return "application/octet-stream";
}

// Download URL reported by the storage service, falling back to the upload target.
std::string remoteUrlFrom(const std::string& responseBody, const std::string& target)
{
    try
    {
        json body = json::parse(responseBody);
        if (body.is_object())
        {
            if (body.contains("downloadUrl") && body["downloadUrl"].is_string())
                return body["downloadUrl"].get<std::string>();
            if (body.contains("url") && body["url"].is_string())
                return body["url"].get<std::string>();
            if (body.contains("downloadTokens") && body["downloadTokens"].is_string())
            {
                std::string tokens = body["downloadTokens"].get<std::string>();
                std::string first = tokens.substr(0, tokens.find(','));
                if (!first.empty())
                    return target + "?alt=media&token=" + first;
            }
        }
    }
    catch (const json::exception& e)
    {
        PLOG_DEBUG << "Upload response is not JSON (" << e.what() << "), using target URL";
    }
    return target;
}

class BatchRegistration
{
public:
    BatchRegistration(UploadRegistry& registry, CancellationTokenPtr token)
        : registry_(registry)
        , id_(registry.addBatch(std::move(token)))
    {
    }
    ~BatchRegistration() { registry_.removeBatch(id_); }

    BatchRegistration(const BatchRegistration&) = delete;
    BatchRegistration& operator=(const BatchRegistration&) = delete;

    const std::string& id() const { return id_; }

private:
    UploadRegistry& registry_;
    std::string id_;
};

void markUnexpectedFailure(FileUploadResult& result, const std::string& what)
{
    // A confirmed upload stays uploaded even if a progress observer failed afterwards
    if (result.status == FileUploadStatus::Uploaded)
    {
        PLOG_WARNING << "Progress observer failed after upload of " << result.localPath << ": " << what;
        return;
    }
    result.status = FileUploadStatus::Failed;
    result.error = "Unexpected upload error: " + what;
    PLOG_ERROR << "Upload of " << result.localPath << " failed: " << what;
}

} // namespace

struct UploadEngine::Impl
{
    std::shared_ptr<IHttpClient> http;
    UploadSettings settings;
    UploadRegistry registry;

    void uploadOne(std::size_t index, const UploadItem& item, const std::string& target, FileUploadResult& result,
                   CancellationToken& token, BatchProgress& batch, const FileProgressCallback& onFileProgress)
    {
        std::error_code ec;
        std::uint64_t size = fs::file_size(item.localPath, ec);
        if (ec)
        {
            result.status = FileUploadStatus::Failed;
            result.error = "Cannot read " + item.localPath + ": " + ec.message();
            PLOG_ERROR << result.error;
            return;
        }

        std::ifstream body(item.localPath, std::ios::binary);
        if (!body.is_open())
        {
            result.status = FileUploadStatus::Failed;
            result.error = "Cannot open " + item.localPath;
            PLOG_ERROR << result.error;
            return;
        }

        ScopedUploadHandle handle(registry, item.remoteKey);
        PLOG_INFO << "Uploading " << item.localPath << " -> " << target << " as " << handle->id();

        TransferProgress progress;
        progress.totalBytes = size;
        auto onSend = [&](std::uint64_t sent, std::uint64_t total) -> bool
        {
            if (token.isCancelled() || handle->isAborted())
                return false;

            std::uint64_t expected = total > 0 ? total : size;
            progress.transferredBytes = std::max(progress.transferredBytes, sent);
            if (expected > 0)
            {
                double fraction = static_cast<double>(progress.transferredBytes) / static_cast<double>(expected);
                progress.percent = std::max(progress.percent, std::min(99, static_cast<int>(fraction * 100.0)));
                // Completion is only reported once the server confirms
                batch.update(index, std::min(fraction, 0.99));
            }
            if (onFileProgress)
                onFileProgress(index, progress);
            return true;
        };

        HttpResponse response;
        try
        {
            response = http->streamPut(target, body, size, contentTypeFor(item.localPath), onSend);
        }
        catch (const std::exception& ex)
        {
            response.error = std::string("Unexpected upload error: ") + ex.what();
        }

        // A confirmed upload stands even when cancellation arrived meanwhile
        if (!response.ok() && (token.isCancelled() || handle->isAborted() || response.aborted))
        {
            result.status = FileUploadStatus::Cancelled;
            result.error = "Upload cancelled";
            PLOG_INFO << "Upload " << handle->id() << " cancelled";
            return;
        }

        if (!response.ok())
        {
            result.status = FileUploadStatus::Failed;
            result.error = response.error.empty() ? "HTTP error " + std::to_string(response.status_code)
                                                  : response.error;
            PLOG_ERROR << "Upload of " << item.localPath << " failed: " << result.error;
            return;
        }

        result.status = FileUploadStatus::Uploaded;
        result.remoteUrl = remoteUrlFrom(response.text, target);
        batch.markComplete(index);
        if (onFileProgress)
        {
            progress.transferredBytes = size;
            progress.percent = 100;
            onFileProgress(index, progress);
        }
        PLOG_INFO << "Uploaded " << item.localPath << " -> " << result.remoteUrl;
    }
};

UploadEngine::UploadEngine(std::shared_ptr<IHttpClient> http, UploadSettings settings)
    : impl_(std::make_unique<Impl>())
{
    impl_->http = std::move(http);
    impl_->settings = std::move(settings);
}

UploadEngine::~UploadEngine() { cancelAllUploads(); }

std::string UploadEngine::targetUrl(const std::string& remoteKey) const
{
    std::string base = impl_->settings.endpoint;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/" + UrlNormalizer::encodeComponent(remoteKey);
}

UploadBatchResult UploadEngine::uploadBatch(const std::vector<UploadItem>& files,
                                            BatchProgressCallback onBatchProgress, CancellationTokenPtr cancelToken,
                                            FileProgressCallback onFileProgress)
{
    if (!cancelToken)
        cancelToken = std::make_shared<CancellationToken>();

    BatchRegistration registration(impl_->registry, cancelToken);
    UploadBatchResult result;
    result.batchId = registration.id();
    result.files.resize(files.size());
    for (std::size_t i = 0; i < files.size(); ++i)
    {
        result.files[i].localPath = files[i].localPath;
        result.files[i].remoteKey = files[i].remoteKey;
    }

    if (files.empty())
        return result;

    PLOG_INFO << "Starting upload " << result.batchId << " with " << files.size() << " file(s)";

    BatchProgress batch(files.size(), std::move(onBatchProgress));
    std::atomic<std::size_t> next{ 0 };

    // Workers report file progress one at a time
    std::mutex fileProgressMutex;
    FileProgressCallback fileProgress;
    if (onFileProgress)
    {
        fileProgress = [&](std::size_t index, const TransferProgress& progress)
        {
            std::lock_guard<std::mutex> lock(fileProgressMutex);
            onFileProgress(index, progress);
        };
    }

    auto worker = [&]()
    {
        for (;;)
        {
            if (cancelToken->isCancelled())
                return;
            std::size_t index = next++;
            if (index >= files.size())
                return;
            try
            {
                impl_->uploadOne(index, files[index], targetUrl(files[index].remoteKey), result.files[index],
                                 *cancelToken, batch, fileProgress);
            }
            catch (const std::exception& ex)
            {
                markUnexpectedFailure(result.files[index], ex.what());
            }
            catch (...)
            {
                markUnexpectedFailure(result.files[index], "unknown exception");
            }
        }
    };

    std::size_t workers = std::clamp<std::size_t>(impl_->settings.maxParallel, 1, files.size());
    if (workers == 1)
    {
        worker();
    }
    else
    {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
            threads.emplace_back(worker);
        for (auto& t : threads)
            t.join();
    }

    result.cancelled = cancelToken->isCancelled();
    bool anyFailed = std::any_of(result.files.begin(), result.files.end(), [](const FileUploadResult& f)
                                 { return f.status == FileUploadStatus::Failed; });
    if (anyFailed)
        result.error = TransferError::UploadFailed;
    else if (result.cancelled)
        result.error = TransferError::Cancelled;

    PLOG_INFO << "Upload " << result.batchId << " finished: " << result.uploadedCount() << "/" << files.size()
              << " uploaded" << (result.cancelled ? " (cancelled)" : "");
    return result;
}

void UploadEngine::cancelAllUploads()
{
    std::size_t aborted = impl_->registry.abortAll();
    if (aborted > 0)
        PLOG_INFO << "Cancelled " << aborted << " in-flight upload(s)";
}

std::size_t UploadEngine::activeUploadCount() const { return impl_->registry.openCount(); }

std::size_t UploadEngine::activeBatchCount() const { return impl_->registry.batchCount(); }

} // namespace sideload
