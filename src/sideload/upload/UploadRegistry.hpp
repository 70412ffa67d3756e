#pragma once

#include "../api/TransferTypes.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace sideload
{

// Abort switch for one in-flight file upload.
class UploadHandle
{
public:
    UploadHandle(std::string id, std::string remoteKey)
        : id_(std::move(id))
        , remote_key_(std::move(remoteKey))
    {
    }

    const std::string& id() const { return id_; }
    const std::string& remoteKey() const { return remote_key_; }

    void abort() { aborted_.store(true); }
    bool isAborted() const { return aborted_.load(); }

private:
    std::string id_;
    std::string remote_key_;
    std::atomic<bool> aborted_{ false };
};

// Live set of upload handles and batch tokens, keyed by synthetic ids, so that
// everything can be aborted without the caller holding any of them.
class UploadRegistry
{
public:
    std::shared_ptr<UploadHandle> open(const std::string& remoteKey);
    void close(const std::string& handleId);

    std::string addBatch(CancellationTokenPtr token);
    void removeBatch(const std::string& batchId);

    // Aborts every open handle and cancels every batch token. Returns the handle count.
    std::size_t abortAll();

    std::size_t openCount() const;
    std::size_t batchCount() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<UploadHandle>> handles_;
    std::map<std::string, CancellationTokenPtr> batches_;
    unsigned long next_handle_ = 1;
    unsigned long next_batch_ = 1;
};

// Closes a registry handle when the upload it guards ends.
class ScopedUploadHandle
{
public:
    ScopedUploadHandle(UploadRegistry& registry, const std::string& remoteKey)
        : registry_(registry)
        , handle_(registry.open(remoteKey))
    {
    }

    ~ScopedUploadHandle() { registry_.close(handle_->id()); }

    ScopedUploadHandle(const ScopedUploadHandle&) = delete;
    ScopedUploadHandle& operator=(const ScopedUploadHandle&) = delete;

    UploadHandle& operator*() const { return *handle_; }
    UploadHandle* operator->() const { return handle_.get(); }

private:
    UploadRegistry& registry_;
    std::shared_ptr<UploadHandle> handle_;
};

} // namespace sideload
