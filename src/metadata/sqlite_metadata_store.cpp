#include "tilestitch/metadata/sqlite_metadata_store.h"

#include <Poco/Data/SQLite/Connector.h>
#include <Poco/Data/SessionFactory.h>
#include <Poco/Data/Statement.h>

#include "tilestitch/core/time.h"

namespace {
using namespace Poco::Data::Keywords;

constexpr const char* kSessionColumns =
    "id, booking_id, chunk_id, session_id, original_file_name, total_chunks, chunks_uploaded, "
    "checksum, manifest_key, status, manifest_timestamp, last_updated, completed_at, failed_at, "
    "final_resource_id, reassembled_url, error_message, merge_owner, merge_started_at, "
    "created_at";

constexpr const char* kResourceColumns =
    "resource_id, booking_id, file_name, content_type, resource_type, blob_key, url, size, "
    "created_at, updated_at, status, is_chunked_file, is_complete, session_id, "
    "original_resource_id";

void BindSessionRow(Poco::Data::Statement& stmt, tilestitch::metadata::ChunkSession& row) {
    stmt, into(row.id), into(row.booking_id), into(row.chunk_id), into(row.session_id),
        into(row.original_file_name), into(row.total_chunks), into(row.chunks_uploaded),
        into(row.checksum), into(row.manifest_key), into(row.status),
        into(row.manifest_timestamp), into(row.last_updated), into(row.completed_at),
        into(row.failed_at), into(row.final_resource_id), into(row.reassembled_url),
        into(row.error_message), into(row.merge_owner), into(row.merge_started_at),
        into(row.created_at);
}

void BindResourceRow(Poco::Data::Statement& stmt, tilestitch::metadata::ResourceRecord& row) {
    stmt, into(row.resource_id), into(row.booking_id), into(row.file_name),
        into(row.content_type), into(row.resource_type), into(row.blob_key), into(row.url),
        into(row.size), into(row.created_at), into(row.updated_at), into(row.status),
        into(row.is_chunked_file), into(row.is_complete), into(row.session_id),
        into(row.original_resource_id);
}

// Drains a statement bound with range(0, 1) one row at a time.
template <typename Row, typename IsEmpty>
std::vector<Row> DrainRows(Poco::Data::Statement& select, Row& row, IsEmpty is_empty) {
    std::vector<Row> rows;
    while (!select.done()) {
        row = {};
        select.execute();
        if (select.done() && is_empty(row)) {
            break;
        }
        if (!is_empty(row)) {
            rows.push_back(row);
        }
    }
    return rows;
}

}  // namespace

namespace tilestitch::metadata {

std::string SessionChunkId(const std::string& session_id) { return session_id + "_manifest"; }

SqliteMetadataStore::SqliteMetadataStore(const std::string& db_path)
    : session_([](const std::string& path) {
          Poco::Data::SQLite::Connector::registerConnector();
          return Poco::Data::Session("SQLite", path);
      }(db_path)) {
    InitSchema();
}

void SqliteMetadataStore::InitSchema() {
    // Schema is created on startup for developer convenience; migrations will replace this later.
    session_ <<
            "CREATE TABLE IF NOT EXISTS chunk_sessions ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT,"
            "booking_id TEXT NOT NULL,"
            "chunk_id TEXT NOT NULL,"
            "session_id TEXT NOT NULL,"
            "original_file_name TEXT NOT NULL DEFAULT '',"
            "total_chunks INTEGER NOT NULL DEFAULT 0,"
            "chunks_uploaded INTEGER NOT NULL DEFAULT 0,"
            "checksum TEXT NOT NULL DEFAULT '',"
            "manifest_key TEXT NOT NULL DEFAULT '',"
            "status TEXT NOT NULL,"
            "manifest_timestamp INTEGER NOT NULL DEFAULT 0,"
            "last_updated TEXT NOT NULL,"
            "completed_at TEXT NOT NULL DEFAULT '',"
            "failed_at TEXT NOT NULL DEFAULT '',"
            "final_resource_id TEXT NOT NULL DEFAULT '',"
            "reassembled_url TEXT NOT NULL DEFAULT '',"
            "error_message TEXT NOT NULL DEFAULT '',"
            "merge_owner TEXT NOT NULL DEFAULT '',"
            "merge_started_at TEXT NOT NULL DEFAULT '',"
            "created_at TEXT NOT NULL,"
            "UNIQUE(booking_id, chunk_id)"
            ")",
        now;

    session_ <<
            "CREATE TABLE IF NOT EXISTS resources ("
            "resource_id TEXT PRIMARY KEY,"
            "booking_id TEXT NOT NULL,"
            "file_name TEXT NOT NULL,"
            "content_type TEXT NOT NULL,"
            "resource_type TEXT NOT NULL,"
            "blob_key TEXT NOT NULL,"
            "url TEXT NOT NULL,"
            "size INTEGER NOT NULL,"
            "created_at TEXT NOT NULL,"
            "updated_at TEXT NOT NULL,"
            "status TEXT NOT NULL,"
            "is_chunked_file INTEGER NOT NULL,"
            "is_complete INTEGER NOT NULL,"
            "session_id TEXT NOT NULL DEFAULT '',"
            "original_resource_id TEXT NOT NULL DEFAULT ''"
            ")",
        now;

    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_chunk_sessions_status_updated "
            "ON chunk_sessions(status, last_updated)",
        now;
    session_ <<
            "CREATE INDEX IF NOT EXISTS idx_resources_booking_session "
            "ON resources(booking_id, session_id)",
        now;
}

core::Result<ChunkSession> SqliteMetadataStore::GetSessionLocked(const std::string& booking_id,
                                                                 const std::string& chunk_id) {
    ChunkSession row;
    std::string booking_value = booking_id;
    std::string chunk_value = chunk_id;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kSessionColumns +
                      " FROM chunk_sessions WHERE booking_id = ? AND chunk_id = ?",
            use(booking_value), use(chunk_value);
        BindSessionRow(select, row);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (row.chunk_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "chunk session not found"};
    }
    return row;
}

core::Result<ChunkSession> SqliteMetadataStore::RegisterSession(const ChunkSession& session) {
    if (session.booking_id.empty() || session.session_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument,
                           "booking_id and session_id are required"};
    }
    std::lock_guard<std::mutex> lock(mutex_);

    const std::string chunk_id = SessionChunkId(session.session_id);
    std::string now_time = core::NowIso8601();
    try {
        std::string booking_value = session.booking_id;
        std::string chunk_value = chunk_id;
        std::string session_value = session.session_id;
        std::string file_name_value = session.original_file_name;
        int total_value = session.total_chunks;
        int uploaded_value = session.chunks_uploaded;
        std::string checksum_value = session.checksum;
        std::string manifest_key_value = session.manifest_key;
        std::int64_t manifest_ts_value = session.manifest_timestamp;
        // Terminal sessions are never touched: the DO UPDATE only fires while pending.
        session_ <<
                "INSERT INTO chunk_sessions(booking_id, chunk_id, session_id, "
                "original_file_name, total_chunks, chunks_uploaded, checksum, manifest_key, "
                "status, manifest_timestamp, last_updated, created_at) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, ?, 'pending', ?, ?, ?) "
                "ON CONFLICT(booking_id, chunk_id) DO UPDATE SET "
                "original_file_name = CASE WHEN excluded.original_file_name <> '' "
                "THEN excluded.original_file_name ELSE chunk_sessions.original_file_name END, "
                "total_chunks = CASE WHEN excluded.total_chunks > 0 "
                "THEN excluded.total_chunks ELSE chunk_sessions.total_chunks END, "
                "checksum = CASE WHEN excluded.checksum <> '' "
                "THEN excluded.checksum ELSE chunk_sessions.checksum END, "
                "manifest_key = CASE WHEN excluded.manifest_key <> '' "
                "THEN excluded.manifest_key ELSE chunk_sessions.manifest_key END, "
                "manifest_timestamp = CASE WHEN excluded.manifest_timestamp > 0 "
                "THEN excluded.manifest_timestamp ELSE chunk_sessions.manifest_timestamp END, "
                "last_updated = excluded.last_updated "
                "WHERE chunk_sessions.status = 'pending'",
            use(booking_value), use(chunk_value), use(session_value), use(file_name_value),
            use(total_value), use(uploaded_value), use(checksum_value), use(manifest_key_value),
            use(manifest_ts_value), use(now_time), use(now_time), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    return GetSessionLocked(session.booking_id, chunk_id);
}

core::Result<ChunkSession> SqliteMetadataStore::GetSession(const std::string& booking_id,
                                                           const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetSessionLocked(booking_id, SessionChunkId(session_id));
}

core::Result<void> SqliteMetadataStore::UpdateProgress(const std::string& booking_id,
                                                       const std::string& session_id,
                                                       int chunks_uploaded) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto chunk_id = SessionChunkId(session_id);
    auto existing = GetSessionLocked(booking_id, chunk_id);
    if (!existing.ok()) {
        return existing.error();
    }

    std::string now_time = core::NowIso8601();
    std::string booking_value = booking_id;
    std::string chunk_value = chunk_id;
    int count_value = chunks_uploaded;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE chunk_sessions SET chunks_uploaded = ?, last_updated = ? "
                  "WHERE booking_id = ? AND chunk_id = ?",
            use(count_value), use(now_time), use(booking_value), use(chunk_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<bool> SqliteMetadataStore::TryClaimMerge(const std::string& booking_id,
                                                      const std::string& session_id,
                                                      const std::string& owner,
                                                      const std::string& stale_claim_before,
                                                      bool allow_failed) {
    if (owner.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "merge owner is required"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto chunk_id = SessionChunkId(session_id);
    auto existing = GetSessionLocked(booking_id, chunk_id);
    if (!existing.ok()) {
        return existing.error();
    }

    std::string now_time = core::NowIso8601();
    std::string owner_value = owner;
    std::string booking_value = booking_id;
    std::string chunk_value = chunk_id;
    int allow_failed_value = allow_failed ? 1 : 0;
    std::string cutoff_value = stale_claim_before;
    try {
        // Compare-and-swap on (status, merge_owner): at most one writer sees its own token.
        Poco::Data::Statement update(session_);
        update << "UPDATE chunk_sessions SET merge_owner = ?, merge_started_at = ? "
                  "WHERE booking_id = ? AND chunk_id = ? "
                  "AND (status = 'pending' OR (? = 1 AND status = 'failed')) "
                  "AND (merge_owner = '' OR merge_started_at < ?)",
            use(owner_value), use(now_time), use(booking_value), use(chunk_value),
            use(allow_failed_value), use(cutoff_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    auto after = GetSessionLocked(booking_id, chunk_id);
    if (!after.ok()) {
        return after.error();
    }
    return after.value().merge_owner == owner;
}

core::Result<void> SqliteMetadataStore::ReleaseMergeClaim(const std::string& booking_id,
                                                          const std::string& session_id,
                                                          const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string booking_value = booking_id;
    std::string chunk_value = SessionChunkId(session_id);
    std::string owner_value = owner;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE chunk_sessions SET merge_owner = '', merge_started_at = '' "
                  "WHERE booking_id = ? AND chunk_id = ? AND merge_owner = ?",
            use(booking_value), use(chunk_value), use(owner_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
    return core::Ok();
}

core::Result<bool> SqliteMetadataStore::MarkSessionCompleted(const std::string& booking_id,
                                                             const std::string& session_id,
                                                             const std::string& owner,
                                                             const std::string& resource_id,
                                                             const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto chunk_id = SessionChunkId(session_id);
    std::string now_time = core::NowIso8601();
    std::string resource_value = resource_id;
    std::string url_value = url;
    std::string booking_value = booking_id;
    std::string chunk_value = chunk_id;
    std::string owner_value = owner;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE chunk_sessions SET status = 'completed', final_resource_id = ?, "
                  "reassembled_url = ?, completed_at = ?, last_updated = ?, error_message = '', "
                  "merge_owner = '', merge_started_at = '' "
                  "WHERE booking_id = ? AND chunk_id = ? AND merge_owner = ? "
                  "AND status IN ('pending', 'failed')",
            use(resource_value), use(url_value), use(now_time), use(now_time), use(booking_value),
            use(chunk_value), use(owner_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    auto after = GetSessionLocked(booking_id, chunk_id);
    if (!after.ok()) {
        return after.error();
    }
    return after.value().status == kStatusCompleted &&
           after.value().final_resource_id == resource_id;
}

core::Result<bool> SqliteMetadataStore::MarkSessionFailed(const std::string& booking_id,
                                                          const std::string& session_id,
                                                          const std::string& owner,
                                                          const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto chunk_id = SessionChunkId(session_id);
    auto before = GetSessionLocked(booking_id, chunk_id);
    if (!before.ok()) {
        return before.error();
    }
    if (before.value().merge_owner != owner ||
        before.value().status == kStatusCompleted) {
        return false;
    }

    std::string now_time = core::NowIso8601();
    std::string message_value = error_message;
    std::string booking_value = booking_id;
    std::string chunk_value = chunk_id;
    std::string owner_value = owner;
    try {
        Poco::Data::Statement update(session_);
        update << "UPDATE chunk_sessions SET status = 'failed', error_message = ?, failed_at = ?, "
                  "last_updated = ?, merge_owner = '', merge_started_at = '' "
                  "WHERE booking_id = ? AND chunk_id = ? AND merge_owner = ? "
                  "AND status IN ('pending', 'failed')",
            use(message_value), use(now_time), use(now_time), use(booking_value),
            use(chunk_value), use(owner_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    auto after = GetSessionLocked(booking_id, chunk_id);
    if (!after.ok()) {
        return after.error();
    }
    return after.value().status == kStatusFailed && after.value().merge_owner.empty();
}

core::Result<std::vector<ChunkSession>> SqliteMetadataStore::ListStalePendingSessions(
    const std::string& updated_before, int limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkSession row;
    std::string cutoff_value = updated_before;
    int limit_value = limit;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kSessionColumns +
                      " FROM chunk_sessions WHERE status = 'pending' AND last_updated <= ? "
                      "ORDER BY last_updated ASC, id ASC LIMIT ?",
            use(cutoff_value), use(limit_value);
        BindSessionRow(select, row);
        select, range(0, 1);
        return DrainRows(select, row,
                         [](const ChunkSession& s) { return s.chunk_id.empty(); });
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
}

core::Result<std::vector<ChunkSession>> SqliteMetadataStore::ListBookingSessions(
    const std::string& booking_id, const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkSession row;
    std::string booking_value = booking_id;
    std::string status_value = status;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kSessionColumns +
                      " FROM chunk_sessions WHERE booking_id = ? AND (? = '' OR status = ?) "
                      "ORDER BY created_at ASC, id ASC",
            use(booking_value), use(status_value), use(status_value);
        BindSessionRow(select, row);
        select, range(0, 1);
        return DrainRows(select, row,
                         [](const ChunkSession& s) { return s.chunk_id.empty(); });
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }
}

core::Result<ChunkSession> SqliteMetadataStore::FindSessionByResourceId(
    const std::string& booking_id, const std::string& resource_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ChunkSession row;
    std::string booking_value = booking_id;
    std::string resource_value = resource_id;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kSessionColumns +
                      " FROM chunk_sessions WHERE booking_id = ? AND final_resource_id = ? "
                      "ORDER BY id ASC LIMIT 1",
            use(booking_value), use(resource_value);
        BindSessionRow(select, row);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (row.chunk_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "no session for resource"};
    }
    return row;
}

core::Result<ResourceRecord> SqliteMetadataStore::UpsertResource(const ResourceRecord& record) {
    if (record.resource_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "resource_id is required"};
    }
    std::lock_guard<std::mutex> lock(mutex_);

    std::string now_time = core::NowIso8601();
    try {
        std::string id_value = record.resource_id;
        std::string booking_value = record.booking_id;
        std::string file_name_value = record.file_name;
        std::string content_type_value = record.content_type;
        std::string resource_type_value = record.resource_type;
        std::string blob_key_value = record.blob_key;
        std::string url_value = record.url;
        std::uint64_t size_value = record.size;
        std::string created_value = record.created_at.empty() ? now_time : record.created_at;
        std::string status_value = record.status;
        bool chunked_value = record.is_chunked_file;
        bool complete_value = record.is_complete;
        std::string session_value = record.session_id;
        std::string original_value = record.original_resource_id;
        session_ <<
                "INSERT INTO resources(resource_id, booking_id, file_name, content_type, "
                "resource_type, blob_key, url, size, created_at, updated_at, status, "
                "is_chunked_file, is_complete, session_id, original_resource_id) "
                "VALUES(?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?) "
                "ON CONFLICT(resource_id) DO UPDATE SET "
                "booking_id=excluded.booking_id, file_name=excluded.file_name, "
                "content_type=excluded.content_type, resource_type=excluded.resource_type, "
                "blob_key=excluded.blob_key, url=excluded.url, size=excluded.size, "
                "updated_at=excluded.updated_at, status=excluded.status, "
                "is_chunked_file=excluded.is_chunked_file, is_complete=excluded.is_complete, "
                "session_id=excluded.session_id, original_resource_id=excluded.original_resource_id",
            use(id_value), use(booking_value), use(file_name_value), use(content_type_value),
            use(resource_type_value), use(blob_key_value), use(url_value), use(size_value),
            use(created_value), use(now_time), use(status_value), use(chunked_value),
            use(complete_value), use(session_value), use(original_value), now;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    return GetResourceLocked(record.resource_id);
}

core::Result<ResourceRecord> SqliteMetadataStore::GetResourceLocked(
    const std::string& resource_id) {
    ResourceRecord row;
    std::string id_value = resource_id;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kResourceColumns +
                      " FROM resources WHERE resource_id = ?",
            use(id_value);
        BindResourceRow(select, row);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (row.resource_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "resource not found"};
    }
    return row;
}

core::Result<ResourceRecord> SqliteMetadataStore::GetResource(const std::string& resource_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return GetResourceLocked(resource_id);
}

core::Result<ResourceRecord> SqliteMetadataStore::FindResourceBySession(
    const std::string& booking_id, const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    ResourceRecord row;
    std::string booking_value = booking_id;
    std::string session_value = session_id;
    try {
        Poco::Data::Statement select(session_);
        select << std::string("SELECT ") + kResourceColumns +
                      " FROM resources WHERE booking_id = ? AND session_id = ? "
                      "ORDER BY created_at DESC LIMIT 1",
            use(booking_value), use(session_value);
        BindResourceRow(select, row);
        select.execute();
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kDbError, ex.displayText()};
    }

    if (row.resource_id.empty()) {
        return core::Error{core::ErrorCode::kNotFound, "resource not found for session"};
    }
    return row;
}

}  // namespace tilestitch::metadata
