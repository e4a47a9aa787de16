#include "chunkvault/auth/jwt_utils.h"

#include <algorithm>
#include <cctype>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace chunkvault::auth {

std::vector<unsigned char> Base64UrlDecode(const std::string& input) {
    // Normalize base64url to base64 and pad for EVP_DecodeBlock.
    std::string padded = input;
    std::replace(padded.begin(), padded.end(), '-', '+');
    std::replace(padded.begin(), padded.end(), '_', '/');
    while (padded.size() % 4 != 0) {
        padded.push_back('=');
    }

    std::vector<unsigned char> output((padded.size() / 4) * 3);
    int out_len = EVP_DecodeBlock(output.data(),
                                  reinterpret_cast<const unsigned char*>(padded.data()),
                                  static_cast<int>(padded.size()));
    if (out_len < 0) {
        return {};
    }
    int padding = 0;
    if (!padded.empty() && padded.back() == '=') {
        padding++;
        if (padded.size() > 1 && padded[padded.size() - 2] == '=') {
            padding++;
        }
    }
    output.resize(static_cast<size_t>(out_len - padding));
    return output;
}

std::string Base64UrlDecodeToString(const std::string& input) {
    auto decoded = Base64UrlDecode(input);
    return std::string(reinterpret_cast<const char*>(decoded.data()), decoded.size());
}

std::string Base64UrlEncode(const std::string& input) {
    std::string output(4 * ((input.size() + 2) / 3) + 1, '\0');
    const int out_len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                                        reinterpret_cast<const unsigned char*>(input.data()),
                                        static_cast<int>(input.size()));
    output.resize(static_cast<size_t>(out_len));
    while (!output.empty() && output.back() == '=') {
        output.pop_back();
    }
    std::replace(output.begin(), output.end(), '+', '-');
    std::replace(output.begin(), output.end(), '/', '_');
    return output;
}

std::vector<std::string> Split(const std::string& input, char delimiter) {
    // Simple splitter without trimming; callers can Trim() if needed.
    std::vector<std::string> parts;
    std::string current;
    for (char c : input) {
        if (c == delimiter) {
            parts.push_back(current);
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    parts.push_back(current);
    return parts;
}

std::string Trim(const std::string& input) {
    // Whitespace trim for header parsing.
    auto start = input.begin();
    while (start != input.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto end = input.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1)))) {
        --end;
    }
    return std::string(start, end);
}

std::string HmacSha256(const std::string& secret, const std::string& message) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;
    const auto* result = HMAC(EVP_sha256(), secret.data(), static_cast<int>(secret.size()),
                              reinterpret_cast<const unsigned char*>(message.data()),
                              message.size(), digest, &digest_len);
    if (result == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

bool ConstantTimeEquals(const std::string& lhs, const std::string& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string EncodeHs256Token(const std::string& claims_json, const std::string& secret) {
    const auto signing_input = Base64UrlEncode("{\"alg\":\"HS256\",\"typ\":\"JWT\"}") + "." +
                               Base64UrlEncode(claims_json);
    return signing_input + "." + Base64UrlEncode(HmacSha256(secret, signing_input));
}

}  // namespace chunkvault::auth
