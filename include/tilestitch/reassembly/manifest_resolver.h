#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "tilestitch/core/result.h"
#include "tilestitch/metadata/metadata_store.h"
#include "tilestitch/storage/object_store.h"

namespace tilestitch::reassembly {

/// @brief Uploader-written description of one chunked upload session.
struct Manifest {
    std::string session_id;
    std::string original_file_name;
    int total_chunks{0};
    std::string checksum;
    std::int64_t timestamp{0};
};

/// @brief Loads manifests from the object store and registers their sessions.
class ManifestResolver {
public:
    ManifestResolver(std::shared_ptr<storage::ObjectStore> store,
                     std::shared_ptr<metadata::MetadataStore> metadata);

    /// Reads and parses `key`. Missing or malformed manifests yield nullopt.
    std::optional<Manifest> Fetch(const std::string& key);

    /// Registers `manifest` as a pending session of `booking_id`. A manifest without
    /// sessionId or originalFileName is rejected with kInvalidArgument.
    core::Result<metadata::ChunkSession> Register(const std::string& booking_id,
                                                  const Manifest& manifest,
                                                  const std::string& manifest_key);

    /// Fetch followed by Register; kNotFound when no usable manifest exists at `key`.
    core::Result<metadata::ChunkSession> Resolve(const std::string& booking_id,
                                                 const std::string& manifest_key);

    /// Greatest `_manifest.json` key under `{booking_id}/{session_id}`, if any.
    std::optional<std::string> FindManifestKey(const std::string& booking_id,
                                               const std::string& session_id);

    static std::optional<Manifest> ParseManifest(const std::string& json);

private:
    std::shared_ptr<storage::ObjectStore> store_;
    std::shared_ptr<metadata::MetadataStore> metadata_;
};

}  // namespace tilestitch::reassembly
