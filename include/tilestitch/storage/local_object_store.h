#pragma once

#include <cstdint>
#include <string>

#include "tilestitch/storage/object_store.h"

namespace tilestitch::storage {

/// @brief Settings for the filesystem-backed object store.
struct LocalObjectStoreOptions {
    std::string base_path{"data"};
    std::string temp_path{"data/tmp"};
    std::string public_base_url{"http://127.0.0.1:8080"};
    std::string signing_secret;
    std::uint64_t min_part_bytes{5242880};
};

/// @brief Local filesystem object store with atomic writes and multipart staging.
///
/// Objects live under `<base>/objects/<key>`; content type and tags are kept in a JSON
/// sidecar under `<base>/attributes/<key>.json`. Multipart parts are staged in
/// `<temp>/multipart/<upload_id>/part-<n>` until completion.
class LocalObjectStore : public ObjectStore {
public:
    explicit LocalObjectStore(LocalObjectStoreOptions options);

    core::Result<std::vector<ObjectInfo>> ListObjects(const std::string& prefix) override;
    core::Result<ObjectInfo> HeadObject(const std::string& key) override;
    core::Result<ObjectTags> GetObjectTags(const std::string& key) override;
    core::Result<std::string> GetObject(const std::string& key) override;
    core::Result<ObjectInfo> PutObject(const std::string& key, const std::string& data,
                                       const PutOptions& options) override;

    core::Result<std::string> CreateMultipartUpload(const std::string& key,
                                                    const std::string& content_type) override;
    core::Result<CompletedPart> UploadPartCopy(const std::string& upload_id, int part_number,
                                               const std::string& source_key) override;
    core::Result<ObjectInfo> CompleteMultipartUpload(
        const std::string& upload_id, const std::vector<CompletedPart>& parts) override;
    core::Result<void> AbortMultipartUpload(const std::string& upload_id) override;

    core::Result<std::string> PresignGetUrl(const std::string& key,
                                            int expires_in_seconds) override;

    /// Checks a presigned GET: signature must match and `expires` must not have passed.
    core::Result<void> VerifyPresignedGet(const std::string& key, const std::string& expires,
                                          const std::string& signature) const;
    /// Absolute filesystem path of an existing object, for streaming downloads.
    core::Result<std::string> ResolveObjectPath(const std::string& key) const;

    const LocalObjectStoreOptions& options() const { return options_; }

    static bool IsSafeKey(const std::string& key);
    static std::string BuildObjectPath(const std::string& base_path, const std::string& key);

private:
    std::string Sign(const std::string& key, const std::string& expires) const;
    std::string UploadDir(const std::string& upload_id) const;
    core::Result<ObjectInfo> CommitTempFile(const std::string& key, const std::string& temp_path,
                                            const std::string& etag, std::uint64_t size,
                                            const PutOptions& options);

    LocalObjectStoreOptions options_;
};

}  // namespace tilestitch::storage
