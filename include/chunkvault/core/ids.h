#pragma once

#include <string>

namespace chunkvault::core {

/// @brief Generate a unique request ID for correlation.
std::string GenerateRequestId();
/// @brief Generate the identifier of a freshly opened upload session.
std::string GenerateUploadId();
/// @brief Stable directory-safe name for a device identity (SHA-256 hex).
std::string OwnerDigest(const std::string& owner);

}  // namespace chunkvault::core
