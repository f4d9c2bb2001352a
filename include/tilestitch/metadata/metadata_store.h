#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "tilestitch/core/error.h"
#include "tilestitch/core/result.h"

namespace tilestitch::metadata {

inline constexpr const char* kStatusPending = "pending";
inline constexpr const char* kStatusCompleted = "completed";
inline constexpr const char* kStatusFailed = "failed";

/// @brief Builds the registry key of a session: "{session_id}_manifest".
std::string SessionChunkId(const std::string& session_id);

/// @brief Per-upload-session status record keyed by (booking_id, chunk_id).
struct ChunkSession {
    int id{0};
    std::string booking_id;
    std::string chunk_id;
    std::string session_id;
    std::string original_file_name;
    int total_chunks{0};
    int chunks_uploaded{0};
    std::string checksum;
    std::string manifest_key;
    std::string status{kStatusPending};
    std::int64_t manifest_timestamp{0};
    std::string last_updated;
    std::string completed_at;
    std::string failed_at;
    std::string final_resource_id;
    std::string reassembled_url;
    std::string error_message;
    std::string merge_owner;
    std::string merge_started_at;
    std::string created_at;
};

/// @brief Record describing a reassembled file, read by the booking detail path.
struct ResourceRecord {
    std::string resource_id;
    std::string booking_id;
    std::string file_name;
    std::string content_type;
    std::string resource_type;
    std::string blob_key;
    std::string url;
    std::uint64_t size{0};
    std::string created_at;
    std::string updated_at;
    std::string status{"active"};
    bool is_chunked_file{true};
    bool is_complete{true};
    std::string session_id;
    std::string original_resource_id;
};

/// @brief Abstract metadata store for chunk sessions and resource records.
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    /// Inserts a pending session, or refreshes the manifest fields of a pending one.
    /// Terminal sessions are returned unchanged.
    virtual core::Result<ChunkSession> RegisterSession(const ChunkSession& session) = 0;
    virtual core::Result<ChunkSession> GetSession(const std::string& booking_id,
                                                  const std::string& session_id) = 0;
    /// Persists the latest chunk count and bumps last_updated.
    virtual core::Result<void> UpdateProgress(const std::string& booking_id,
                                              const std::string& session_id,
                                              int chunks_uploaded) = 0;

    /// Conditionally writes `owner` as the merge owner. The claim is granted only when the
    /// session is pending (or failed, with `allow_failed`) and any previous claim started
    /// before `stale_claim_before`. Returns true when `owner` holds the claim afterwards.
    virtual core::Result<bool> TryClaimMerge(const std::string& booking_id,
                                             const std::string& session_id,
                                             const std::string& owner,
                                             const std::string& stale_claim_before,
                                             bool allow_failed) = 0;
    virtual core::Result<void> ReleaseMergeClaim(const std::string& booking_id,
                                                 const std::string& session_id,
                                                 const std::string& owner) = 0;
    /// Terminal transitions; both return false when `owner` no longer holds the claim.
    virtual core::Result<bool> MarkSessionCompleted(const std::string& booking_id,
                                                    const std::string& session_id,
                                                    const std::string& owner,
                                                    const std::string& resource_id,
                                                    const std::string& url) = 0;
    virtual core::Result<bool> MarkSessionFailed(const std::string& booking_id,
                                                 const std::string& session_id,
                                                 const std::string& owner,
                                                 const std::string& error_message) = 0;

    /// Pending sessions with last_updated at or before `updated_before`, oldest first.
    virtual core::Result<std::vector<ChunkSession>> ListStalePendingSessions(
        const std::string& updated_before, int limit) = 0;
    virtual core::Result<std::vector<ChunkSession>> ListBookingSessions(
        const std::string& booking_id, const std::string& status) = 0;
    virtual core::Result<ChunkSession> FindSessionByResourceId(const std::string& booking_id,
                                                               const std::string& resource_id) = 0;

    virtual core::Result<ResourceRecord> UpsertResource(const ResourceRecord& record) = 0;
    virtual core::Result<ResourceRecord> GetResource(const std::string& resource_id) = 0;
    virtual core::Result<ResourceRecord> FindResourceBySession(const std::string& booking_id,
                                                               const std::string& session_id) = 0;
};

}  // namespace tilestitch::metadata
