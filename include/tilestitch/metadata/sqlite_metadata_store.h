#pragma once

#include <mutex>
#include <string>

#include <Poco/Data/Session.h>

#include "tilestitch/metadata/metadata_store.h"

namespace tilestitch::metadata {

/// @brief SQLite-backed metadata store for single-node mode.
class SqliteMetadataStore : public MetadataStore {
public:
    explicit SqliteMetadataStore(const std::string& db_path);

    core::Result<ChunkSession> RegisterSession(const ChunkSession& session) override;
    core::Result<ChunkSession> GetSession(const std::string& booking_id,
                                          const std::string& session_id) override;
    core::Result<void> UpdateProgress(const std::string& booking_id,
                                      const std::string& session_id,
                                      int chunks_uploaded) override;

    core::Result<bool> TryClaimMerge(const std::string& booking_id,
                                     const std::string& session_id, const std::string& owner,
                                     const std::string& stale_claim_before,
                                     bool allow_failed) override;
    core::Result<void> ReleaseMergeClaim(const std::string& booking_id,
                                         const std::string& session_id,
                                         const std::string& owner) override;
    core::Result<bool> MarkSessionCompleted(const std::string& booking_id,
                                            const std::string& session_id,
                                            const std::string& owner,
                                            const std::string& resource_id,
                                            const std::string& url) override;
    core::Result<bool> MarkSessionFailed(const std::string& booking_id,
                                         const std::string& session_id,
                                         const std::string& owner,
                                         const std::string& error_message) override;

    core::Result<std::vector<ChunkSession>> ListStalePendingSessions(
        const std::string& updated_before, int limit) override;
    core::Result<std::vector<ChunkSession>> ListBookingSessions(
        const std::string& booking_id, const std::string& status) override;
    core::Result<ChunkSession> FindSessionByResourceId(const std::string& booking_id,
                                                       const std::string& resource_id) override;

    core::Result<ResourceRecord> UpsertResource(const ResourceRecord& record) override;
    core::Result<ResourceRecord> GetResource(const std::string& resource_id) override;
    core::Result<ResourceRecord> FindResourceBySession(const std::string& booking_id,
                                                       const std::string& session_id) override;

private:
    // Schema creation is done once per store instance; in production this will be migrated.
    void InitSchema();
    core::Result<ChunkSession> GetSessionLocked(const std::string& booking_id,
                                                const std::string& chunk_id);
    core::Result<ResourceRecord> GetResourceLocked(const std::string& resource_id);

    std::mutex mutex_;
    Poco::Data::Session session_;
};

}  // namespace tilestitch::metadata
