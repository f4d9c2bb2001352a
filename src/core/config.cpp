#include "tilestitch/core/config.h"

#include <cctype>
#include <stdexcept>

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>

namespace tilestitch::core {

namespace {

bool IsBlank(const std::string& value) {
    for (char c : value) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
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
        static_cast<std::uint64_t>(cfg->getInt64("server.limits.max_body_bytes", 1048576));

    config.storage.base_path = cfg->getString("storage.base_path", "data");
    config.storage.temp_path = cfg->getString("storage.temp_path", "data/tmp");
    config.storage.bucket = cfg->getString("storage.bucket", "tilestitch-resources");
    config.storage.public_base_url =
        cfg->getString("storage.public_base_url", "http://127.0.0.1:8080");
    config.storage.signing_secret = cfg->getString("storage.signing_secret", "");
    const auto min_part_bytes = cfg->getInt64("storage.min_part_bytes", 5242880);

    const auto min_segment_bytes = cfg->getInt64("reassembly.min_segment_bytes", 5242880);
    const auto direct_max_bytes = cfg->getInt64("reassembly.direct_max_bytes", 536870912);
    config.reassembly.url_ttl_seconds = cfg->getInt("reassembly.url_ttl_seconds", 1209600);
    config.reassembly.resource_type = cfg->getString("reassembly.resource_type", "geotiff");
    config.reassembly.content_type = cfg->getString("reassembly.content_type", "image/tiff");
    config.reassembly.session_tag = cfg->getString("reassembly.session_tag", "timestamp");
    config.reassembly.merge_claim_ttl_seconds =
        cfg->getInt("reassembly.merge_claim_ttl_seconds", 900);

    config.sweeper.enabled = cfg->getBool("sweeper.enabled", true);
    config.sweeper.interval_seconds = cfg->getInt("sweeper.interval_seconds", 60);
    config.sweeper.stale_after_seconds = cfg->getInt("sweeper.stale_after_seconds", 120);
    config.sweeper.max_sessions_per_sweep = cfg->getInt("sweeper.max_sessions_per_sweep", 100);

    config.observability.log_level = cfg->getString("observability.log_level", "information");
    config.observability.log_file = cfg->getString("observability.log_file", "");

    // Fail fast so a misconfigured store cannot hand out unverifiable URLs.
    if (IsBlank(config.storage.signing_secret)) {
        throw std::invalid_argument("storage.signing_secret must be non-empty");
    }
    if (IsBlank(config.storage.bucket)) {
        throw std::invalid_argument("storage.bucket must be non-empty");
    }
    if (min_part_bytes <= 0) {
        throw std::invalid_argument("storage.min_part_bytes must be positive");
    }
    if (min_segment_bytes <= 0) {
        throw std::invalid_argument("reassembly.min_segment_bytes must be positive");
    }
    if (direct_max_bytes < min_segment_bytes) {
        throw std::invalid_argument(
            "reassembly.direct_max_bytes must not be smaller than reassembly.min_segment_bytes");
    }
    if (config.reassembly.url_ttl_seconds <= 0) {
        throw std::invalid_argument("reassembly.url_ttl_seconds must be positive");
    }
    if (config.reassembly.merge_claim_ttl_seconds <= 0) {
        throw std::invalid_argument("reassembly.merge_claim_ttl_seconds must be positive");
    }
    if (config.sweeper.interval_seconds <= 0) {
        throw std::invalid_argument("sweeper.interval_seconds must be positive");
    }
    if (config.sweeper.stale_after_seconds < 0) {
        throw std::invalid_argument("sweeper.stale_after_seconds must not be negative");
    }
    if (config.sweeper.max_sessions_per_sweep <= 0) {
        throw std::invalid_argument("sweeper.max_sessions_per_sweep must be positive");
    }
    config.storage.min_part_bytes = static_cast<std::uint64_t>(min_part_bytes);
    config.reassembly.min_segment_bytes = static_cast<std::uint64_t>(min_segment_bytes);
    config.reassembly.direct_max_bytes = static_cast<std::uint64_t>(direct_max_bytes);
    return config;
}

std::string LoadDatabasePath(const std::string& path) {
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg(
        new Poco::Util::JSONConfiguration(path));
    return cfg->getString("sqlite.path", "data/metadata.db");
}

}  // namespace tilestitch::core
