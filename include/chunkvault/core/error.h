#pragma once

#include <string>

namespace chunkvault::core {

/// @brief Canonical error codes used across modules and mapped to HTTP responses.
enum class ErrorCode {
    kOk = 0,
    kInvalidArgument,
    kNotFound,
    kIoError,
    kDbError,
    kUnauthorized,
    kInternal,
    // Per-chunk integrity and boundary failures; the session is left untouched.
    kMalformedHeader,
    kChecksumMismatch,
    kOutOfBounds,
    // Session consistency failures.
    kSizeConflict,
    kInvalidTransition,
    kSessionClosed,
    kSessionBusy,
    // Read-side failures, recoverable by the caller.
    kRangeUnavailable,
    kRangeNotSatisfiable,
    kFileNotReady,
    kAssemblyFailure,
};

/// @brief Error payload describing a failure with a code and human-readable message.
struct Error {
    ErrorCode code{ErrorCode::kOk};
    std::string message;
};

/// @brief Stable upper-case identifier sent to clients, e.g. "CHECKSUM_MISMATCH".
const char* ErrorCodeName(ErrorCode code);

}  // namespace chunkvault::core
