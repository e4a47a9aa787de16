#pragma once

#include <string>
#include <vector>

#include "chunkvault/core/config.h"
#include "chunkvault/core/result.h"

namespace chunkvault::auth {

struct JwtClaims {
    std::string subject;
    std::string issuer;
    std::vector<std::string> audience;
};

/// @brief Verifies HS256 bearer tokens signed with the shared device secret.
class JwtVerifier {
public:
    explicit JwtVerifier(core::AuthConfig config);
    core::Result<JwtClaims> Verify(const std::string& token) const;

private:
    core::AuthConfig config_;
};

}  // namespace chunkvault::auth
