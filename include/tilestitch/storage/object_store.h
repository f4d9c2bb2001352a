#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "tilestitch/core/error.h"
#include "tilestitch/core/result.h"

namespace tilestitch::storage {

using ObjectTags = std::map<std::string, std::string>;

/// @brief Listing/HEAD view of a stored object.
struct ObjectInfo {
    std::string key;
    std::uint64_t size_bytes{0};
    std::string etag;
    std::string content_type;
    std::string last_modified;
};

/// @brief Attributes supplied when writing an object.
struct PutOptions {
    std::string content_type{"application/octet-stream"};
    ObjectTags tags;
};

/// @brief A part produced by a server-side copy into a multipart upload.
struct CompletedPart {
    int part_number{0};
    std::string etag;
};

/// @brief Blob store with S3-like semantics: flat keys, HEAD, tags, multipart copy.
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /// Keys starting with `prefix`, in ascending key order.
    virtual core::Result<std::vector<ObjectInfo>> ListObjects(const std::string& prefix) = 0;
    virtual core::Result<ObjectInfo> HeadObject(const std::string& key) = 0;
    virtual core::Result<ObjectTags> GetObjectTags(const std::string& key) = 0;
    virtual core::Result<std::string> GetObject(const std::string& key) = 0;
    virtual core::Result<ObjectInfo> PutObject(const std::string& key, const std::string& data,
                                               const PutOptions& options) = 0;

    virtual core::Result<std::string> CreateMultipartUpload(const std::string& key,
                                                            const std::string& content_type) = 0;
    /// Copies `source_key` into part `part_number` without routing bytes through the caller.
    virtual core::Result<CompletedPart> UploadPartCopy(const std::string& upload_id,
                                                       int part_number,
                                                       const std::string& source_key) = 0;
    virtual core::Result<ObjectInfo> CompleteMultipartUpload(
        const std::string& upload_id, const std::vector<CompletedPart>& parts) = 0;
    virtual core::Result<void> AbortMultipartUpload(const std::string& upload_id) = 0;

    /// Time-limited GET URL for `key`.
    virtual core::Result<std::string> PresignGetUrl(const std::string& key,
                                                    int expires_in_seconds) = 0;
};

}  // namespace tilestitch::storage
