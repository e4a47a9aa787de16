#include "chunkvault/core/error.h"

namespace chunkvault::core {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "OK";
        case ErrorCode::kInvalidArgument:
            return "INVALID_ARGUMENT";
        case ErrorCode::kNotFound:
            return "NOT_FOUND";
        case ErrorCode::kIoError:
            return "IO_ERROR";
        case ErrorCode::kDbError:
            return "DB_ERROR";
        case ErrorCode::kUnauthorized:
            return "UNAUTHORIZED";
        case ErrorCode::kInternal:
            return "INTERNAL";
        case ErrorCode::kMalformedHeader:
            return "MALFORMED_HEADER";
        case ErrorCode::kChecksumMismatch:
            return "CHECKSUM_MISMATCH";
        case ErrorCode::kOutOfBounds:
            return "OUT_OF_BOUNDS";
        case ErrorCode::kSizeConflict:
            return "SIZE_CONFLICT";
        case ErrorCode::kInvalidTransition:
            return "INVALID_TRANSITION";
        case ErrorCode::kSessionClosed:
            return "SESSION_CLOSED";
        case ErrorCode::kSessionBusy:
            return "SESSION_BUSY";
        case ErrorCode::kRangeUnavailable:
            return "RANGE_UNAVAILABLE";
        case ErrorCode::kRangeNotSatisfiable:
            return "RANGE_NOT_SATISFIABLE";
        case ErrorCode::kFileNotReady:
            return "FILE_NOT_READY";
        case ErrorCode::kAssemblyFailure:
            return "ASSEMBLY_FAILURE";
    }
    return "INTERNAL";
}

}  // namespace chunkvault::core
