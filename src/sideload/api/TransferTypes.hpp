#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace sideload
{

// Lifecycle of a single download or upload. Transitions only move forward.
enum class TransferStatus
{
    Pending, // Created, nothing on the wire yet
    Probing, // HEAD request for the expected size
    Streaming, // Body is being written
    Verifying, // Size heuristic and optional checksum
    Completed, // File is on disk and usable
    Failed, // Terminal, partial file removed
    Cancelled // Terminal, partial file removed
};

struct TransferProgress
{
    std::uint64_t transferredBytes = 0;
    std::optional<std::uint64_t> totalBytes; // Unknown when the server omits a length
    int percent = 0; // Stays 0 while the size is unknown

    bool sizeKnown() const { return totalBytes.has_value() && *totalBytes > 0; }
};

using ProgressCallback = std::function<void(const TransferProgress&)>;

// One in-flight transfer. Owned by the engine that created it and never persisted.
struct TransferTask
{
    std::string id;
    std::string sourceUrl;
    std::string destinationPath;
    std::optional<std::uint64_t> totalBytes;
    std::uint64_t transferredBytes = 0;
    TransferStatus status = TransferStatus::Pending;

    // Returns false and leaves the status untouched when the move would go backwards
    // or leave a terminal state.
    bool advance(TransferStatus next)
    {
        if (isTerminal() || static_cast<int>(next) <= static_cast<int>(status))
            return false;
        status = next;
        return true;
    }

    bool isTerminal() const
    {
        return status == TransferStatus::Completed || status == TransferStatus::Failed ||
               status == TransferStatus::Cancelled;
    }
};

// Single-set latch shared by the caller (who cancels) and the engine (who polls).
class CancellationToken
{
public:
    void cancel() { cancelled_.store(true); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{ false };
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

enum class TransferError
{
    None,
    InvalidUrl,
    PermissionDenied,
    DownloadFailed, // Network or file I/O
    CorruptDownload, // Size heuristic or checksum
    Cancelled, // Normal terminal state
    InstallDeferred, // Suspended until the user acts in settings
    InstallRejected, // Platform installer refused
    UploadFailed
};

const char* toString(TransferError error);
const char* toString(TransferStatus status);

// Everything the façade can report back to the host.
enum class OutcomeKind
{
    Success,
    Cancelled,
    PermissionDenied,
    DownloadFailed,
    InstallDeferred,
    InstallFailed,
    NothingToResume
};

const char* toString(OutcomeKind kind);

struct TransferOutcome
{
    OutcomeKind kind = OutcomeKind::Success;
    TransferError error = TransferError::None;
    bool needsSettings = false;
    std::string reason;
    std::string filePath;

    TransferOutcome() = default;

    TransferOutcome(OutcomeKind k, TransferError err, std::string why = {})
        : kind(k)
        , error(err)
        , reason(std::move(why))
    {
    }

    bool succeeded() const { return kind == OutcomeKind::Success; }
};

enum class MessageClass
{
    Success,
    Retryable, // Offer a retry action
    PermissionSettings, // Offer to open settings or ask again
    Info // Neutral, nothing to do
};

const char* toString(MessageClass cls);

struct UserMessage
{
    MessageClass messageClass = MessageClass::Info;
    std::string text;
    bool offerSettings = false;
};

} // namespace sideload
