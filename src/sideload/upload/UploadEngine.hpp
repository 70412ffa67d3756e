#pragma once

#include "../api/TransferTypes.hpp"
#include "../http/IHttpClient.hpp"
#include "BatchProgress.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sideload
{

struct UploadItem
{
    std::string localPath;
    std::string remoteKey; // Object name below the upload endpoint
};

enum class FileUploadStatus
{
    NotStarted,
    Uploaded,
    Failed,
    Cancelled
};

const char* toString(FileUploadStatus status);

struct FileUploadResult
{
    std::string localPath;
    std::string remoteKey;
    std::string remoteUrl; // Set for uploaded files only
    FileUploadStatus status = FileUploadStatus::NotStarted;
    std::string error;
};

struct UploadBatchResult
{
    std::string batchId;
    std::vector<FileUploadResult> files; // Same order as the request
    bool cancelled = false;
    TransferError error = TransferError::None; // UploadFailed when any file failed

    // Remote URLs of uploaded files, in request order. Completed uploads are never rolled back.
    std::vector<std::string> remoteUrls() const;
    std::size_t uploadedCount() const;
    bool ok() const { return !cancelled && error == TransferError::None; }
};

struct UploadSettings
{
    std::string endpoint; // Remote keys are appended URL-encoded
    std::size_t maxParallel = 1;
};

using FileProgressCallback = std::function<void(std::size_t index, const TransferProgress& progress)>;

// Streams local files to remote storage with per-file and aggregate progress.
//
// Cancellation is cooperative and batch-wide: no new file starts once the token
// is set, and the in-flight upload is aborted at its next progress tick.
class UploadEngine
{
public:
    UploadEngine(std::shared_ptr<IHttpClient> http, UploadSettings settings);
    ~UploadEngine();

    UploadEngine(const UploadEngine&) = delete;
    UploadEngine& operator=(const UploadEngine&) = delete;

    UploadBatchResult uploadBatch(const std::vector<UploadItem>& files, BatchProgressCallback onBatchProgress,
                                  CancellationTokenPtr cancelToken, FileProgressCallback onFileProgress = nullptr);

    // Aborts every in-flight upload of every batch
    void cancelAllUploads();

    std::size_t activeUploadCount() const;
    std::size_t activeBatchCount() const;

    std::string targetUrl(const std::string& remoteKey) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace sideload
