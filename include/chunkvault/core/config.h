#pragma once

#include <cstdint>
#include <string>

namespace chunkvault::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    // Upper bound of one chunk request (17-byte header plus payload).
    std::uint64_t max_body_bytes{16777216};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Storage roots: artifacts live under base_path, chunk holdings under temp_path.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
};

/// @brief Reclamation sweeper schedule and idle policy.
struct CleanupConfig {
    bool enabled{true};
    int sweep_interval_seconds{3600};
    int idle_threshold_seconds{86400};
    int max_sessions_per_sweep{200};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
};

/// @brief Bearer token verification for device identities.
struct AuthConfig {
    bool enabled{false};
    std::string issuer;
    std::string audience;
    std::string secret;
    std::string allowed_alg{"HS256"};
    int clock_skew_seconds{60};
};

/// @brief Top-level configuration for ChunkVault.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    CleanupConfig cleanup;
    ObservabilityConfig observability;
    AuthConfig auth;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite session DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);

}  // namespace chunkvault::core
