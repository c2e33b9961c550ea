#pragma once

#include <stdexcept>
#include <string>

enum class ImportErrorCode
{
    NotFound,
    NoMediaFound,
    InsufficientSpace,
    TransferFailure,
    HardlinkUnsupported,
    PermissionApplicationFailure,
    AgentUnreachable,
    StorageUnavailable,
    LibraryUpdateFailure,
    LedgerWriteFailure,
    QueueWriteFailure
};

inline const char* ImportErrorCodeName(ImportErrorCode Code)
{
    switch (Code)
    {
    case ImportErrorCode::NotFound:                     return "NotFound";
    case ImportErrorCode::NoMediaFound:                 return "NoMediaFound";
    case ImportErrorCode::InsufficientSpace:            return "InsufficientSpace";
    case ImportErrorCode::TransferFailure:              return "TransferFailure";
    case ImportErrorCode::HardlinkUnsupported:          return "HardlinkUnsupported";
    case ImportErrorCode::PermissionApplicationFailure: return "PermissionApplicationFailure";
    case ImportErrorCode::AgentUnreachable:             return "AgentUnreachable";
    case ImportErrorCode::StorageUnavailable:           return "StorageUnavailable";
    case ImportErrorCode::LibraryUpdateFailure:         return "LibraryUpdateFailure";
    case ImportErrorCode::LedgerWriteFailure:           return "LedgerWriteFailure";
    case ImportErrorCode::QueueWriteFailure:            return "QueueWriteFailure";
    }
    return "Unknown";
}

// Fatal for an import run; caught at the run boundary and recorded on the queue item
class ImportError : public std::runtime_error
{
public:
    ImportError(ImportErrorCode Code, const std::string& Message)
        : std::runtime_error(std::string(ImportErrorCodeName(Code)) + ": " + Message), ErrorCode(Code)
    {
    }

    ImportErrorCode Code() const noexcept { return ErrorCode; }

private:
    ImportErrorCode ErrorCode;
};
