#include "BatchProgress.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sideload
{

BatchProgress::BatchProgress(std::size_t fileCount, BatchProgressCallback callback)
    : fractions_(fileCount, 0.0)
    , callback_(std::move(callback))
{
}

void BatchProgress::update(std::size_t index, double fraction)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= fractions_.size())
        return;

    fraction = std::clamp(fraction, 0.0, 1.0);
    fractions_[index] = std::max(fractions_[index], fraction);

    double sum = 0.0;
    for (double f : fractions_)
        sum += f;
    double aggregate = sum / static_cast<double>(fractions_.size()) * 100.0;
    max_aggregate_ = std::max(max_aggregate_, aggregate);

    int percent = std::clamp(static_cast<int>(std::floor(max_aggregate_ + 1e-9)), 0, 100);
    if (percent <= last_percent_)
        return;

    last_percent_ = percent;
    if (callback_)
        callback_(percent);
}

int BatchProgress::percent() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return std::max(last_percent_, 0);
}

} // namespace sideload
