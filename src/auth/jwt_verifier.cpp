#include "chunkvault/auth/jwt_verifier.h"

#include <chrono>

#include <Poco/Dynamic/Var.h>
#include <Poco/Exception.h>
#include <Poco/JSON/Array.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "chunkvault/auth/jwt_utils.h"
#include "chunkvault/core/error.h"

namespace chunkvault::auth {

namespace {

bool ContainsAudience(const std::vector<std::string>& aud, const std::string& expected) {
    for (const auto& item : aud) {
        if (item == expected) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> ParseAudience(const Poco::Dynamic::Var& var) {
    // "aud" can be a string or an array (RFC 7519).
    std::vector<std::string> aud;
    if (var.isString()) {
        aud.push_back(var.convert<std::string>());
        return aud;
    }
    if (var.type() == typeid(Poco::JSON::Array::Ptr)) {
        auto arr = var.extract<Poco::JSON::Array::Ptr>();
        if (arr) {
            for (size_t i = 0; i < arr->size(); ++i) {
                aud.push_back(arr->getElement<std::string>(i));
            }
        }
    }
    return aud;
}

core::Result<void> VerifySignature(const std::string& message,
                                   const std::string& signature_b64u,
                                   const std::string& secret) {
    // HS256 over "header.payload".
    const auto signature = Base64UrlDecodeToString(signature_b64u);
    if (signature.empty()) {
        return core::Error{core::ErrorCode::kUnauthorized, "invalid signature encoding"};
    }
    const auto expected = HmacSha256(secret, message);
    if (expected.empty()) {
        return core::Error{core::ErrorCode::kInternal, "hmac computation failed"};
    }
    if (!ConstantTimeEquals(signature, expected)) {
        return core::Error{core::ErrorCode::kUnauthorized, "signature verification failed"};
    }
    return core::Ok();
}

}  // namespace

JwtVerifier::JwtVerifier(core::AuthConfig config) : config_(std::move(config)) {}

core::Result<JwtClaims> JwtVerifier::Verify(const std::string& token) const {
    if (!config_.enabled) {
        return JwtClaims{};
    }
    auto parts = Split(token, '.');
    if (parts.size() != 3) {
        return core::Error{core::ErrorCode::kUnauthorized, "invalid token format"};
    }

    const auto& header_b64 = parts[0];
    const auto& payload_b64 = parts[1];
    const auto& signature_b64 = parts[2];

    JwtClaims claims;
    try {
        Poco::JSON::Parser parser;
        auto header =
            parser.parse(Base64UrlDecodeToString(header_b64)).extract<Poco::JSON::Object::Ptr>();
        parser.reset();
        auto payload =
            parser.parse(Base64UrlDecodeToString(payload_b64)).extract<Poco::JSON::Object::Ptr>();

        if (!header || !header->has("alg") ||
            header->getValue<std::string>("alg") != config_.allowed_alg) {
            return core::Error{core::ErrorCode::kUnauthorized, "unsupported alg"};
        }

        auto verify = VerifySignature(header_b64 + "." + payload_b64, signature_b64,
                                      config_.secret);
        if (!verify.ok()) {
            return verify.error();
        }

        if (!payload) {
            return core::Error{core::ErrorCode::kUnauthorized, "invalid token payload"};
        }
        if (payload->has("iss")) {
            claims.issuer = payload->getValue<std::string>("iss");
        }
        if (!config_.issuer.empty() && claims.issuer != config_.issuer) {
            return core::Error{core::ErrorCode::kUnauthorized, "issuer mismatch"};
        }

        if (payload->has("aud")) {
            claims.audience = ParseAudience(payload->get("aud"));
        }
        if (!config_.audience.empty() && !ContainsAudience(claims.audience, config_.audience)) {
            return core::Error{core::ErrorCode::kUnauthorized, "audience mismatch"};
        }

        const auto now = std::chrono::system_clock::now();
        const auto now_sec =
            std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
        const long skew = config_.clock_skew_seconds;

        if (!payload->has("exp")) {
            return core::Error{core::ErrorCode::kUnauthorized, "missing exp"};
        }
        const auto exp = payload->getValue<long>("exp");
        if (now_sec > exp + skew) {
            return core::Error{core::ErrorCode::kUnauthorized, "token expired"};
        }
        if (payload->has("nbf")) {
            const auto nbf = payload->getValue<long>("nbf");
            if (now_sec + skew < nbf) {
                return core::Error{core::ErrorCode::kUnauthorized, "token not yet valid"};
            }
        }

        if (payload->has("sub")) {
            claims.subject = payload->getValue<std::string>("sub");
        }
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kUnauthorized, "malformed token: " + ex.displayText()};
    } catch (const std::exception& ex) {
        return core::Error{core::ErrorCode::kUnauthorized, std::string("malformed token: ") + ex.what()};
    }

    // The subject names the device that owns the uploads.
    if (claims.subject.empty()) {
        return core::Error{core::ErrorCode::kUnauthorized, "missing subject"};
    }
    return claims;
}

}  // namespace chunkvault::auth
