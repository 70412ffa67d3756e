#pragma once

#include "../api/TransferTypes.hpp"
#include "../http/IHttpClient.hpp"
#include "UrlNormalizer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sideload
{

struct DownloadSettings
{
    std::string directory = "downloads";
    std::uint64_t minimumBytes = 1000; // Anything smaller is treated as an error page, not a package
    std::uint64_t progressByteBucket = 100 * 1024;
    std::string storageBucket; // Default bucket for bare storage paths
};

struct DownloadResult
{
    TransferError error = TransferError::None;
    std::string filePath; // Set on success only
    std::string message; // Human-readable cause on failure
    TransferProgress progress; // Last known counters

    bool ok() const { return error == TransferError::None; }
    bool cancelled() const { return error == TransferError::Cancelled; }
};

// Streams a URL into a file below the download directory.
//
// Every non-success return leaves no file behind: integrity failures, transport
// errors and cancellation all remove what was written.
class DownloadEngine
{
public:
    DownloadEngine(std::shared_ptr<IHttpClient> http, DownloadSettings settings);
    ~DownloadEngine();

    DownloadEngine(const DownloadEngine&) = delete;
    DownloadEngine& operator=(const DownloadEngine&) = delete;

    DownloadResult download(const std::string& url, const std::string& destinationFileName,
                            ProgressCallback onProgress, CancellationTokenPtr cancelToken,
                            const std::string& expectedSha256 = {});

    const DownloadSettings& settings() const;

    static bool verifyChecksum(const std::string& filePath, const std::string& expectedSha256, std::string& outError);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sideload
