#include "UploadRegistry.hpp"

#include <plog/Log.h>

namespace sideload
{

std::shared_ptr<UploadHandle> UploadRegistry::open(const std::string& remoteKey)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto handle = std::make_shared<UploadHandle>("upload-" + std::to_string(next_handle_++), remoteKey);
    handles_.emplace(handle->id(), handle);
    return handle;
}

void UploadRegistry::close(const std::string& handleId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    handles_.erase(handleId);
}

std::string UploadRegistry::addBatch(CancellationTokenPtr token)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = "batch-" + std::to_string(next_batch_++);
    batches_.emplace(id, std::move(token));
    return id;
}

void UploadRegistry::removeBatch(const std::string& batchId)
{
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.erase(batchId);
}

std::size_t UploadRegistry::abortAll()
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, token] : batches_)
    {
        if (token)
            token->cancel();
    }
    for (auto& [id, handle] : handles_)
    {
        PLOG_INFO << "Aborting upload " << id << " (" << handle->remoteKey() << ")";
        handle->abort();
    }
    return handles_.size();
}

std::size_t UploadRegistry::batchCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return batches_.size();
}

std::size_t UploadRegistry::openCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return handles_.size();
}

} // namespace sideload
