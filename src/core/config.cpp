#include "chunkvault/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace chunkvault::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

void RequirePositive(int value, const char* key) {
    if (value <= 0) {
        throw std::invalid_argument(std::string(key) + " must be positive");
    }
}

}  // namespace

Config LoadConfig(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));

    Config config;
    config.server.host = cfg->getString("server.host", "0.0.0.0");
    config.server.port = cfg->getInt("server.port", 8080);
    config.server.threads = cfg->getInt("server.threads", 4);
    config.server.tls.enabled = cfg->getBool("server.tls.enabled", false);
    config.server.tls.certificate = cfg->getString("server.tls.certificate", "");
    config.server.tls.private_key = cfg->getString("server.tls.private_key", "");
    config.server.limits.max_body_bytes =
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 16777216));

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");

    config.cleanup.enabled = cfg->getBool("cleanup.enabled", true);
    config.cleanup.sweep_interval_seconds = cfg->getInt("cleanup.sweep_interval_seconds", 3600);
    config.cleanup.idle_threshold_seconds = cfg->getInt("cleanup.idle_threshold_seconds", 86400);
    config.cleanup.max_sessions_per_sweep = cfg->getInt("cleanup.max_sessions_per_sweep", 200);

    config.observability.log_level = cfg->getString("observability.log_level", "information");

    config.auth.enabled = cfg->getBool("auth.enabled", false);
    config.auth.issuer = cfg->getString("auth.issuer", "");
    config.auth.audience = cfg->getString("auth.audience", "");
    config.auth.secret = cfg->getString("auth.secret", "");
    config.auth.allowed_alg = cfg->getString("auth.allowed_alg", "HS256");
    config.auth.clock_skew_seconds = cfg->getInt("auth.clock_skew_seconds", 60);

    if (config.auth.enabled) {
        // Fail fast so auth mode cannot run with an empty signing secret.
        if (IsBlank(config.auth.secret)) {
            throw std::invalid_argument("auth.enabled=true requires non-empty auth.secret");
        }
        if (config.auth.allowed_alg != "HS256") {
            throw std::invalid_argument("auth.allowed_alg must be HS256");
        }
    }
    if (config.server.limits.max_body_bytes <= 17) {
        throw std::invalid_argument("server.limits.max_body_bytes must exceed the chunk header");
    }
    RequirePositive(config.server.threads, "server.threads");
    RequirePositive(config.cleanup.sweep_interval_seconds, "cleanup.sweep_interval_seconds");
    RequirePositive(config.cleanup.idle_threshold_seconds, "cleanup.idle_threshold_seconds");
    RequirePositive(config.cleanup.max_sessions_per_sweep, "cleanup.max_sessions_per_sweep");
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/sessions.db");
}

}  // namespace chunkvault::core
