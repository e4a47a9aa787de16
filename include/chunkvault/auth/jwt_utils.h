#pragma once

#include <string>
#include <vector>

namespace chunkvault::auth {

std::vector<unsigned char> Base64UrlDecode(const std::string& input);
std::string Base64UrlDecodeToString(const std::string& input);
/// @brief Unpadded base64url, as used in JWT segments.
std::string Base64UrlEncode(const std::string& input);
std::vector<std::string> Split(const std::string& input, char delimiter);
std::string Trim(const std::string& input);

/// @brief Raw HMAC-SHA256 of message keyed with secret.
std::string HmacSha256(const std::string& secret, const std::string& message);
bool ConstantTimeEquals(const std::string& lhs, const std::string& rhs);
/// @brief Compact HS256 token for a JSON claims object (devices and tests).
std::string EncodeHs256Token(const std::string& claims_json, const std::string& secret);

}  // namespace chunkvault::auth
