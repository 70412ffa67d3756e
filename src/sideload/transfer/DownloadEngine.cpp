#include "DownloadEngine.hpp"
#include "ProgressReporter.hpp"

#include <plog/Log.h>

#include <picosha2.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace sideload
{

struct DownloadEngine::Impl
{
    std::shared_ptr<IHttpClient> http;
    DownloadSettings settings;
    UrlNormalizer normalizer;
    std::atomic<unsigned> nextTaskId{ 1 };

    Impl(std::shared_ptr<IHttpClient> client, DownloadSettings s)
        : http(std::move(client))
        , settings(std::move(s))
        , normalizer(settings.storageBucket)
    {
    }

    static void removePartial(const std::string& path)
    {
        std::error_code ec;
        if (fs::remove(path, ec))
        {
            PLOG_DEBUG << "Removed partial file: " << path;
        }
        else if (ec)
        {
            PLOG_WARNING << "Failed to remove partial file " << path << ": " << ec.message();
        }
    }

    // Only the partial file is ever removed; an existing file at the destination is left alone
    static DownloadResult fail(TransferTask& task, TransferError error, const std::string& message,
                               const std::string& partialPath = {})
    {
        task.advance(error == TransferError::Cancelled ? TransferStatus::Cancelled : TransferStatus::Failed);
        if (!partialPath.empty())
            removePartial(partialPath);

        if (error == TransferError::Cancelled)
            PLOG_INFO << "Download " << task.id << " cancelled";
        else
            PLOG_ERROR << "Download " << task.id << " failed (" << toString(error) << "): " << message;

        DownloadResult result;
        result.error = error;
        result.message = message;
        result.progress.transferredBytes = task.transferredBytes;
        result.progress.totalBytes = task.totalBytes;
        return result;
    }
};

DownloadEngine::DownloadEngine(std::shared_ptr<IHttpClient> http, DownloadSettings settings)
    : impl_(std::make_unique<Impl>(std::move(http), std::move(settings)))
{
}

DownloadEngine::~DownloadEngine() = default;

const DownloadSettings& DownloadEngine::settings() const { return impl_->settings; }

DownloadResult DownloadEngine::download(const std::string& url, const std::string& destinationFileName,
                                        ProgressCallback onProgress, CancellationTokenPtr cancelToken,
                                        const std::string& expectedSha256)
{
    if (!cancelToken)
        cancelToken = std::make_shared<CancellationToken>();

    TransferTask task;
    task.id = "download-" + std::to_string(impl_->nextTaskId++);
    task.sourceUrl = url;

    std::string error;
    std::string finalUrl;
    if (!impl_->normalizer.normalize(url, finalUrl, error))
        return Impl::fail(task, TransferError::InvalidUrl, error);
    task.sourceUrl = finalUrl;

    fs::path fileName(destinationFileName);
    if (destinationFileName.empty() || fileName.has_parent_path() || fileName.filename() != fileName ||
        destinationFileName == "." || destinationFileName == "..")
    {
        return Impl::fail(task, TransferError::DownloadFailed, "Invalid destination file name: " + destinationFileName);
    }

    std::error_code ec;
    fs::create_directories(impl_->settings.directory, ec);
    if (ec)
    {
        return Impl::fail(task, TransferError::DownloadFailed,
                          "Cannot create download directory " + impl_->settings.directory + ": " + ec.message());
    }

    if (cancelToken->isCancelled())
        return Impl::fail(task, TransferError::Cancelled, "Cancelled before start");

    PLOG_INFO << "Starting download " << task.id << ": " << finalUrl;

    ProgressReporter reporter(std::move(onProgress), impl_->settings.progressByteBucket);
    task.destinationPath = (fs::path(impl_->settings.directory) / fileName).string();
    const std::string partialPath = task.destinationPath + ".part";

    try
    {
        task.advance(TransferStatus::Probing);
        HeadResponse sizeReply = impl_->http->head(finalUrl);
        if (sizeReply.ok() && sizeReply.content_length && *sizeReply.content_length > 0)
        {
            task.totalBytes = sizeReply.content_length;
            PLOG_INFO << "Expected size: " << *task.totalBytes << " bytes";
        }
        else
        {
            PLOG_DEBUG << "Size probe gave no length (status " << sizeReply.status_code
                       << (sizeReply.error.empty() ? "" : ", " + sizeReply.error) << "), reporting bytes only";
        }
        reporter.setTotal(task.totalBytes);

        std::ofstream out(partialPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
            return Impl::fail(task, TransferError::DownloadFailed, "Failed to create output file: " + partialPath,
                              partialPath);

        task.advance(TransferStatus::Streaming);
        bool writeFailed = false;
        HttpResponse response = impl_->http->streamGet(finalUrl,
                                                       [&](const char* data, std::size_t size) -> bool
                                                       {
                                                           if (cancelToken->isCancelled())
                                                               return false;
                                                           out.write(data, static_cast<std::streamsize>(size));
                                                           if (!out)
                                                           {
                                                               writeFailed = true;
                                                               return false;
                                                           }
                                                           task.transferredBytes += size;
                                                           reporter.advance(task.transferredBytes);
                                                           return true;
                                                       });
        out.close();

        if (cancelToken->isCancelled())
            return Impl::fail(task, TransferError::Cancelled, "Cancelled by caller", partialPath);

        if (writeFailed || out.fail())
            return Impl::fail(task, TransferError::DownloadFailed, "Write error on " + partialPath, partialPath);

        if (!response.error.empty())
            return Impl::fail(task, TransferError::DownloadFailed, response.error, partialPath);

        if (response.aborted || response.status_code < 200 || response.status_code >= 300)
        {
            return Impl::fail(task, TransferError::DownloadFailed,
                              "HTTP error " + std::to_string(response.status_code), partialPath);
        }

        task.advance(TransferStatus::Verifying);
        if (task.transferredBytes < impl_->settings.minimumBytes)
        {
            return Impl::fail(task, TransferError::CorruptDownload,
                              "Downloaded file is too small (" + std::to_string(task.transferredBytes) +
                                  " bytes), likely not a valid package", partialPath);
        }

        if (!expectedSha256.empty())
        {
            std::string checksumError;
            if (!verifyChecksum(partialPath, expectedSha256, checksumError))
                return Impl::fail(task, TransferError::CorruptDownload, checksumError, partialPath);
            PLOG_INFO << "Checksum verified for " << partialPath;
        }

        fs::rename(partialPath, task.destinationPath, ec);
        if (ec)
        {
            return Impl::fail(task, TransferError::DownloadFailed,
                              "Cannot move download into place at " + task.destinationPath + ": " + ec.message(),
                              partialPath);
        }
    }
    catch (const std::exception& ex)
    {
        return Impl::fail(task, TransferError::DownloadFailed, std::string("Unexpected transfer error: ") + ex.what(),
                          partialPath);
    }

    task.advance(TransferStatus::Completed);
    reporter.complete();
    PLOG_INFO << "Download " << task.id << " completed: " << task.destinationPath << " (" << task.transferredBytes
              << " bytes)";

    DownloadResult result;
    result.filePath = task.destinationPath;
    result.progress = reporter.current();
    return result;
}

bool DownloadEngine::verifyChecksum(const std::string& filePath, const std::string& expectedSha256,
                                    std::string& outError)
{
    try
    {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open())
        {
            outError = "Failed to open file for checksum verification";
            return false;
        }

        std::vector<unsigned char> hash(picosha2::k_digest_size);
        picosha2::hash256(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>(), hash.begin(),
                          hash.end());

        std::string actualSha256 = picosha2::bytes_to_hex_string(hash.begin(), hash.end());
        std::string expected = expectedSha256;
        std::transform(expected.begin(), expected.end(), expected.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (actualSha256 != expected)
        {
            outError = "Checksum mismatch: expected " + expected + ", got " + actualSha256;
            return false;
        }

        return true;
    }
    catch (const std::exception& e)
    {
        outError = std::string("Checksum verification error: ") + e.what();
        return false;
    }
}

} // namespace sideload
