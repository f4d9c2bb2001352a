#pragma once

#include <cstdint>
#include <string>

namespace tilestitch::core {

/// @brief TLS configuration for the HTTP server.
struct TlsConfig {
    bool enabled{false};
    std::string certificate;
    std::string private_key;
};

/// @brief Request/connection limits for the HTTP server.
struct LimitsConfig {
    std::uint64_t max_body_bytes{1048576};
};

/// @brief HTTP server configuration (bind address, TLS, limits).
struct ServerConfig {
    std::string host{"0.0.0.0"};
    int port{8080};
    int threads{4};
    TlsConfig tls;
    LimitsConfig limits;
};

/// @brief Blob store configuration for the local filesystem backend.
struct StorageConfig {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
    std::string bucket{"tilestitch-resources"};
    // Prefix of presigned URLs; must point at this server's /v1/objects route.
    std::string public_base_url{"http://127.0.0.1:8080"};
    std::string signing_secret;
    std::uint64_t min_part_bytes{5242880};
};

/// @brief Reassembly engine and finalizer settings.
struct ReassemblyConfig {
    std::uint64_t min_segment_bytes{5242880};
    std::uint64_t direct_max_bytes{536870912};
    int url_ttl_seconds{1209600};
    std::string resource_type{"geotiff"};
    std::string content_type{"image/tiff"};
    std::string session_tag{"timestamp"};
    int merge_claim_ttl_seconds{900};
};

/// @brief Periodic sweep of stale pending sessions.
struct SweeperConfig {
    bool enabled{true};
    int interval_seconds{60};
    int stale_after_seconds{120};
    int max_sessions_per_sweep{100};
};

/// @brief Observability settings (logging).
struct ObservabilityConfig {
    std::string log_level{"information"};
    /// Empty logs to the console only.
    std::string log_file;
};

/// @brief Top-level configuration for TileStitch.
struct Config {
    ServerConfig server;
    StorageConfig storage;
    ReassemblyConfig reassembly;
    SweeperConfig sweeper;
    ObservabilityConfig observability;
};

/// @brief Load server configuration from a JSON file.
Config LoadConfig(const std::string& path);
/// @brief Load SQLite metadata DB path from a JSON file.
std::string LoadDatabasePath(const std::string& path);

}  // namespace tilestitch::core
