#include "tilestitch/reassembly/manifest_resolver.h"

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>

#include "tilestitch/core/logger.h"
#include "tilestitch/core/time.h"

namespace tilestitch::reassembly {

namespace {

constexpr const char* kManifestSuffix = "_manifest.json";

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

}  // namespace

ManifestResolver::ManifestResolver(std::shared_ptr<storage::ObjectStore> store,
                                   std::shared_ptr<metadata::MetadataStore> metadata)
    : store_(std::move(store)), metadata_(std::move(metadata)) {}

std::optional<Manifest> ManifestResolver::ParseManifest(const std::string& json) {
    try {
        Poco::JSON::Parser parser;
        auto parsed = parser.parse(json);
        auto obj = parsed.extract<Poco::JSON::Object::Ptr>();
        if (!obj) {
            return std::nullopt;
        }
        Manifest manifest;
        manifest.session_id = obj->optValue<std::string>("sessionId", "");
        manifest.original_file_name = obj->optValue<std::string>("originalFileName", "");
        manifest.total_chunks = obj->optValue<int>("totalChunks", 0);
        manifest.checksum = obj->optValue<std::string>("checksum", "");
        manifest.timestamp = obj->optValue<Poco::Int64>("timestamp", core::NowEpochMillis());
        if (manifest.total_chunks < 0) {
            return std::nullopt;
        }
        return manifest;
    } catch (const Poco::Exception&) {
        return std::nullopt;
    }
}

std::optional<Manifest> ManifestResolver::Fetch(const std::string& key) {
    auto body = store_->GetObject(key);
    if (!body.ok()) {
        core::LogWarning("Manifest " + key + " unavailable: " + body.error().message);
        return std::nullopt;
    }
    auto manifest = ParseManifest(body.value());
    if (!manifest) {
        core::LogWarning("Manifest " + key + " is not a valid manifest document");
    }
    return manifest;
}

core::Result<metadata::ChunkSession> ManifestResolver::Register(const std::string& booking_id,
                                                                const Manifest& manifest,
                                                                const std::string& manifest_key) {
    if (manifest.session_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "Manifest missing sessionId"};
    }
    if (manifest.original_file_name.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "Manifest missing originalFileName"};
    }

    metadata::ChunkSession session;
    session.booking_id = booking_id;
    session.chunk_id = metadata::SessionChunkId(manifest.session_id);
    session.session_id = manifest.session_id;
    session.original_file_name = manifest.original_file_name;
    session.total_chunks = manifest.total_chunks;
    session.checksum = manifest.checksum;
    session.manifest_key = manifest_key;
    session.manifest_timestamp = manifest.timestamp;
    session.status = metadata::kStatusPending;

    auto registered = metadata_->RegisterSession(session);
    if (registered.ok()) {
        core::LogInfo("Registered chunk session " + manifest.session_id + " for booking " +
                      booking_id);
    }
    return registered;
}

core::Result<metadata::ChunkSession> ManifestResolver::Resolve(const std::string& booking_id,
                                                               const std::string& manifest_key) {
    auto manifest = Fetch(manifest_key);
    if (!manifest) {
        return core::Error{core::ErrorCode::kNotFound, "Manifest file not found or invalid"};
    }
    return Register(booking_id, *manifest, manifest_key);
}

std::optional<std::string> ManifestResolver::FindManifestKey(const std::string& booking_id,
                                                             const std::string& session_id) {
    auto listing = store_->ListObjects(booking_id + "/" + session_id);
    if (!listing.ok()) {
        core::LogWarning("Listing manifests for session " + session_id +
                         " failed: " + listing.error().message);
        return std::nullopt;
    }
    std::optional<std::string> best;
    for (const auto& object : listing.value()) {
        if (!EndsWith(object.key, kManifestSuffix)) {
            continue;
        }
        if (!best || object.key > *best) {
            best = object.key;
        }
    }
    return best;
}

}  // namespace tilestitch::reassembly
