#pragma once

#include "../api/TransferTypes.hpp"

#include <cstdint>
#include <optional>

namespace sideload
{

// Single consumer of raw byte counts for one transfer. Forwards a value only when
// the integer percentage changes, or, with an unknown size, when the byte count
// crosses into a new bucket. Emitted values never decrease.
class ProgressReporter
{
public:
    static constexpr std::uint64_t kDefaultByteBucket = 100 * 1024;

    explicit ProgressReporter(ProgressCallback callback, std::uint64_t byteBucket = kDefaultByteBucket);

    void setTotal(std::optional<std::uint64_t> totalBytes);

    // Returns true when a value was emitted
    bool advance(std::uint64_t transferredBytes);

    // Emits the terminal value (100 %, or the final byte count) unless already emitted
    void complete();

    const TransferProgress& current() const { return current_; }
    int emittedCount() const { return emitted_; }

    static int percentOf(std::uint64_t transferred, std::uint64_t total);

private:
    void emit();

    ProgressCallback callback_;
    std::uint64_t byte_bucket_;
    TransferProgress current_;
    std::optional<TransferProgress> last_emitted_;
    int emitted_ = 0;
};

} // namespace sideload
