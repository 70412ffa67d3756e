#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace sideload
{

using BatchProgressCallback = std::function<void(int percent)>;

// Aggregate progress of an upload batch. Each file weighs 1/N; the aggregate is
// the weighted sum of per-file fractions, kept as a running maximum so it never
// decreases. Callbacks are serialized and fire only when the integer percentage
// rises.
class BatchProgress
{
public:
    BatchProgress(std::size_t fileCount, BatchProgressCallback callback);

    // fraction in [0, 1]; lower values than already seen for the file are ignored
    void update(std::size_t index, double fraction);
    void markComplete(std::size_t index) { update(index, 1.0); }

    int percent() const;

private:
    mutable std::mutex mutex_;
    std::vector<double> fractions_;
    BatchProgressCallback callback_;
    double max_aggregate_ = 0.0;
    int last_percent_ = -1;
};

} // namespace sideload
