#include "TransferTypes.hpp"

namespace sideload
{

const char* toString(TransferError error)
{
    switch (error)
    {
    case TransferError::None:
        return "None";
    case TransferError::InvalidUrl:
        return "InvalidUrl";
    case TransferError::PermissionDenied:
        return "PermissionDenied";
    case TransferError::DownloadFailed:
        return "DownloadFailed";
    case TransferError::CorruptDownload:
        return "CorruptDownload";
    case TransferError::Cancelled:
        return "Cancelled";
    case TransferError::InstallDeferred:
        return "InstallDeferred";
    case TransferError::InstallRejected:
        return "InstallRejected";
    case TransferError::UploadFailed:
        return "UploadFailed";
    default:
        return "Unknown";
    }
}

const char* toString(TransferStatus status)
{
    switch (status)
    {
    case TransferStatus::Pending:
        return "Pending";
    case TransferStatus::Probing:
        return "Probing";
    case TransferStatus::Streaming:
        return "Streaming";
    case TransferStatus::Verifying:
        return "Verifying";
    case TransferStatus::Completed:
        return "Completed";
    case TransferStatus::Failed:
        return "Failed";
    case TransferStatus::Cancelled:
        return "Cancelled";
    default:
        return "Unknown";
    }
}

const char* toString(OutcomeKind kind)
{
    switch (kind)
    {
    case OutcomeKind::Success:
        return "Success";
    case OutcomeKind::Cancelled:
        return "Cancelled";
    case OutcomeKind::PermissionDenied:
        return "PermissionDenied";
    case OutcomeKind::DownloadFailed:
        return "DownloadFailed";
    case OutcomeKind::InstallDeferred:
        return "InstallDeferred";
    case OutcomeKind::InstallFailed:
        return "InstallFailed";
    case OutcomeKind::NothingToResume:
        return "NothingToResume";
    default:
        return "Unknown";
    }
}

const char* toString(MessageClass cls)
{
    switch (cls)
    {
    case MessageClass::Success:
        return "Success";
    case MessageClass::Retryable:
        return "Retryable";
    case MessageClass::PermissionSettings:
        return "PermissionSettings";
    case MessageClass::Info:
        return "Info";
    default:
        return "Unknown";
    }
}

} // namespace sideload
