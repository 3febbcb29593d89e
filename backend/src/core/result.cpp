/**
 * Error taxonomy — maps each failure code to the category the UI reports.
 */

#include "core/result.h"

namespace nodeward {

ErrorKind kind_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:      return ErrorKind::Validation;
        case ErrorCode::AlreadyRunning:
        case ErrorCode::NotRunning:
        case ErrorCode::Busy:               return ErrorKind::Conflict;
        case ErrorCode::ExecutableMissing:  return ErrorKind::NotFound;
        case ErrorCode::SpawnRejected:
        case ErrorCode::SpawnFailed:
        case ErrorCode::TerminateFailed:    return ErrorKind::Process;
        case ErrorCode::NetworkError:
        case ErrorCode::NoReleaseFound:
        case ErrorCode::IncompleteTransfer:
        case ErrorCode::IOError:            return ErrorKind::Transfer;
    }
    return ErrorKind::Process;
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::Conflict:   return "ConflictError";
        case ErrorKind::Process:    return "ProcessError";
        case ErrorKind::Transfer:   return "TransferError";
        case ErrorKind::NotFound:   return "NotFoundError";
    }
    return "Error";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidConfig:      return "InvalidConfig";
        case ErrorCode::AlreadyRunning:     return "AlreadyRunning";
        case ErrorCode::NotRunning:         return "NotRunning";
        case ErrorCode::Busy:               return "Busy";
        case ErrorCode::ExecutableMissing:  return "ExecutableMissing";
        case ErrorCode::SpawnRejected:      return "SpawnRejected";
        case ErrorCode::SpawnFailed:        return "SpawnFailed";
        case ErrorCode::TerminateFailed:    return "TerminateFailed";
        case ErrorCode::NetworkError:       return "NetworkError";
        case ErrorCode::NoReleaseFound:     return "NoReleaseFound";
        case ErrorCode::IncompleteTransfer: return "IncompleteTransfer";
        case ErrorCode::IOError:            return "IOError";
    }
    return "Unknown";
}

}  // namespace nodeward
