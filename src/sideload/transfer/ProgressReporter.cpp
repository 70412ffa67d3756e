#include "ProgressReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace sideload
{

ProgressReporter::ProgressReporter(ProgressCallback callback, std::uint64_t byteBucket)
    : callback_(std::move(callback))
    , byte_bucket_(byteBucket == 0 ? kDefaultByteBucket : byteBucket)
{
}

void ProgressReporter::setTotal(std::optional<std::uint64_t> totalBytes)
{
    if (totalBytes && *totalBytes == 0)
        totalBytes.reset();
    current_.totalBytes = totalBytes;
}

int ProgressReporter::percentOf(std::uint64_t transferred, std::uint64_t total)
{
    if (total == 0)
        return 0;
    double ratio = static_cast<double>(transferred) / static_cast<double>(total);
    return std::clamp(static_cast<int>(std::floor(ratio * 100.0)), 0, 100);
}

bool ProgressReporter::advance(std::uint64_t transferredBytes)
{
    current_.transferredBytes = std::max(current_.transferredBytes, transferredBytes);

    if (current_.sizeKnown())
    {
        // 100 is reserved for complete(), after the size and checksum checks
        int percent = std::max(current_.percent,
                               std::min(99, percentOf(current_.transferredBytes, *current_.totalBytes)));
        current_.percent = percent;
        if (last_emitted_ && last_emitted_->percent >= percent)
            return false;
    }
    else
    {
        std::uint64_t bucket = current_.transferredBytes / byte_bucket_;
        if (bucket == 0 || (last_emitted_ && last_emitted_->transferredBytes / byte_bucket_ >= bucket))
            return false;
    }

    emit();
    return true;
}

void ProgressReporter::complete()
{
    if (current_.sizeKnown())
    {
        current_.percent = 100;
        if (last_emitted_ && last_emitted_->percent >= 100)
            return;
    }
    else if (last_emitted_ && last_emitted_->transferredBytes >= current_.transferredBytes)
    {
        return;
    }

    emit();
}

void ProgressReporter::emit()
{
    last_emitted_ = current_;
    ++emitted_;
    PLOG_DEBUG << "Progress " << current_.percent << "% (" << current_.transferredBytes << " bytes)";
    if (callback_)
        callback_(current_);
}

} // namespace sideload
