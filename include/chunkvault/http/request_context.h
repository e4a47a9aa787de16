#pragma once

#include <optional>
#include <string>
#include <vector>

namespace chunkvault::http {

struct AuthContext {
    std::string subject;
    std::string issuer;
    std::vector<std::string> audience;
};

/// @brief Per-request metadata used for logging and error responses.
struct RequestContext {
    std::string request_id;
    std::string method;
    std::string target;
    std::string remote;
    // Owner of every file touched by the request.
    std::string device_id;
    std::optional<AuthContext> auth;
};

}  // namespace chunkvault::http
