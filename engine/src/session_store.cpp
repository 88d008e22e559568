#include "session_store.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>

#include <sqlite3.h>

namespace chunkflow::engine {

namespace {

using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

StatementPtr prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db)));
    }
    return StatementPtr(stmt, &sqlite3_finalize);
}

void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    if (sqlite3_step(stmt) != SQLITE_DONE) {
        throw std::runtime_error("Statement failed: " + std::string(sqlite3_errmsg(db)));
    }
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string column_text(sqlite3_stmt* stmt, int index) {
    const auto* text = sqlite3_column_text(stmt, index);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

constexpr const char* kSessionColumns =
    "session_id,upload_id,file_key,file_name,file_size,mime_type,category,owner,source_path,"
    "chunk_size,total_chunks,status,created_at,updated_at,expires_at";

SessionRecord read_session_row(sqlite3_stmt* stmt) {
    SessionRecord record;
    record.session_id = column_text(stmt, 0);
    record.upload_id = column_text(stmt, 1);
    record.file_key = column_text(stmt, 2);
    record.file_name = column_text(stmt, 3);
    record.file_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 4));
    record.mime_type = column_text(stmt, 5);
    record.category = parse_category(column_text(stmt, 6)).value_or(Category::kDocument);
    record.owner = column_text(stmt, 7);
    record.source_path = column_text(stmt, 8);
    record.chunk_size = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 9));
    record.total_chunks = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 10));
    record.status = parse_status(column_text(stmt, 11)).value_or(UploadStatus::kFailed);
    record.created_at = from_epoch_ms(sqlite3_column_int64(stmt, 12));
    record.updated_at = from_epoch_ms(sqlite3_column_int64(stmt, 13));
    record.expires_at = from_epoch_ms(sqlite3_column_int64(stmt, 14));
    return record;
}

}  // namespace

SessionStore::SessionStore(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open session database: " + message);
    }
    sqlite3_busy_timeout(db_, 5000);
}

SessionStore::~SessionStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SessionStore::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Session store error: " + msg);
    }
}

void SessionStore::initialize_schema() {
    const char* ddl = R"SQL(
        PRAGMA journal_mode=WAL;
        CREATE TABLE IF NOT EXISTS upload_sessions (
            session_id TEXT PRIMARY KEY,
            upload_id TEXT NOT NULL,
            file_key TEXT NOT NULL,
            file_name TEXT NOT NULL,
            file_size INTEGER NOT NULL,
            mime_type TEXT NOT NULL,
            category TEXT NOT NULL,
            owner TEXT NOT NULL,
            source_path TEXT NOT NULL,
            chunk_size INTEGER NOT NULL,
            total_chunks INTEGER NOT NULL,
            status TEXT NOT NULL,
            created_at INTEGER NOT NULL,
            updated_at INTEGER NOT NULL,
            expires_at INTEGER NOT NULL
        );
        CREATE INDEX IF NOT EXISTS idx_upload_sessions_expiry ON upload_sessions(expires_at);
        CREATE TABLE IF NOT EXISTS session_chunks (
            session_id TEXT NOT NULL,
            chunk_index INTEGER NOT NULL,
            etag TEXT NOT NULL,
            checksum TEXT NOT NULL,
            uploaded_at INTEGER NOT NULL,
            PRIMARY KEY(session_id, chunk_index)
        );
        CREATE TABLE IF NOT EXISTS session_metadata (
            session_id TEXT NOT NULL,
            key TEXT NOT NULL,
            value TEXT NOT NULL,
            PRIMARY KEY(session_id, key)
        );
        CREATE TABLE IF NOT EXISTS orphaned_uploads (
            upload_id TEXT PRIMARY KEY,
            session_id TEXT NOT NULL,
            file_key TEXT NOT NULL,
            reason TEXT NOT NULL,
            recorded_at INTEGER NOT NULL
        );
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    exec(ddl);
}

void SessionStore::insert(const SessionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE");
    try {
        const std::string sql = std::string("INSERT INTO upload_sessions(") + kSessionColumns +
                                ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)";
        auto stmt = prepare(db_, sql.c_str());
        bind_text(stmt.get(), 1, record.session_id);
        bind_text(stmt.get(), 2, record.upload_id);
        bind_text(stmt.get(), 3, record.file_key);
        bind_text(stmt.get(), 4, record.file_name);
        sqlite3_bind_int64(stmt.get(), 5, static_cast<sqlite3_int64>(record.file_size));
        bind_text(stmt.get(), 6, record.mime_type);
        bind_text(stmt.get(), 7, std::string(to_string(record.category)));
        bind_text(stmt.get(), 8, record.owner);
        bind_text(stmt.get(), 9, record.source_path);
        sqlite3_bind_int64(stmt.get(), 10, static_cast<sqlite3_int64>(record.chunk_size));
        sqlite3_bind_int64(stmt.get(), 11, static_cast<sqlite3_int64>(record.total_chunks));
        bind_text(stmt.get(), 12, std::string(to_string(record.status)));
        sqlite3_bind_int64(stmt.get(), 13, to_epoch_ms(record.created_at));
        sqlite3_bind_int64(stmt.get(), 14, to_epoch_ms(record.updated_at));
        sqlite3_bind_int64(stmt.get(), 15, to_epoch_ms(record.expires_at));
        step_done(db_, stmt.get());

        auto meta = prepare(db_, "INSERT INTO session_metadata(session_id, key, value) VALUES(?,?,?)");
        for (const auto& [key, value] : record.metadata) {
            sqlite3_reset(meta.get());
            bind_text(meta.get(), 1, record.session_id);
            bind_text(meta.get(), 2, key);
            bind_text(meta.get(), 3, value);
            step_done(db_, meta.get());
        }

        auto chunk = prepare(db_, R"SQL(
            INSERT INTO session_chunks(session_id, chunk_index, etag, checksum, uploaded_at)
            VALUES(?,?,?,?,?)
        )SQL");
        for (const auto& [index, persisted] : record.chunks) {
            sqlite3_reset(chunk.get());
            bind_text(chunk.get(), 1, record.session_id);
            sqlite3_bind_int64(chunk.get(), 2, index);
            bind_text(chunk.get(), 3, persisted.etag);
            bind_text(chunk.get(), 4, persisted.checksum);
            sqlite3_bind_int64(chunk.get(), 5, to_epoch_ms(persisted.uploaded_at));
            step_done(db_, chunk.get());
        }
        exec("COMMIT");
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

bool SessionStore::update_status(const std::string& session_id, UploadStatus status, TimePoint updated_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "UPDATE upload_sessions SET status=?, updated_at=? WHERE session_id=?");
    bind_text(stmt.get(), 1, std::string(to_string(status)));
    sqlite3_bind_int64(stmt.get(), 2, to_epoch_ms(updated_at));
    bind_text(stmt.get(), 3, session_id);
    step_done(db_, stmt.get());
    return sqlite3_changes(db_) > 0;
}

bool SessionStore::record_chunk(const std::string& session_id, const PersistedChunk& chunk, TimePoint updated_at) {
    const char* sql = R"SQL(
        INSERT INTO session_chunks(session_id, chunk_index, etag, checksum, uploaded_at)
        SELECT ?1, ?2, ?3, ?4, ?5
        WHERE EXISTS (
            SELECT 1 FROM upload_sessions
            WHERE session_id = ?1 AND status IN ('initializing', 'uploading', 'paused')
        )
        ON CONFLICT(session_id, chunk_index)
        DO UPDATE SET etag=excluded.etag,
                      checksum=excluded.checksum,
                      uploaded_at=excluded.uploaded_at
    )SQL";

    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, sql);
    bind_text(stmt.get(), 1, session_id);
    sqlite3_bind_int64(stmt.get(), 2, chunk.chunk_index);
    bind_text(stmt.get(), 3, chunk.etag);
    bind_text(stmt.get(), 4, chunk.checksum);
    sqlite3_bind_int64(stmt.get(), 5, to_epoch_ms(chunk.uploaded_at));
    step_done(db_, stmt.get());
    if (sqlite3_changes(db_) == 0) {
        return false;
    }

    auto touch = prepare(db_, "UPDATE upload_sessions SET updated_at=? WHERE session_id=?");
    sqlite3_bind_int64(touch.get(), 1, to_epoch_ms(updated_at));
    bind_text(touch.get(), 2, session_id);
    step_done(db_, touch.get());
    return true;
}

void SessionStore::load_children(SessionRecord& record) {
    auto meta = prepare(db_, "SELECT key,value FROM session_metadata WHERE session_id=?");
    bind_text(meta.get(), 1, record.session_id);
    while (sqlite3_step(meta.get()) == SQLITE_ROW) {
        record.metadata.emplace(column_text(meta.get(), 0), column_text(meta.get(), 1));
    }

    auto chunks = prepare(db_, R"SQL(
        SELECT chunk_index,etag,checksum,uploaded_at FROM session_chunks
        WHERE session_id=? ORDER BY chunk_index
    )SQL");
    bind_text(chunks.get(), 1, record.session_id);
    while (sqlite3_step(chunks.get()) == SQLITE_ROW) {
        PersistedChunk chunk;
        chunk.chunk_index = static_cast<std::uint32_t>(sqlite3_column_int64(chunks.get(), 0));
        chunk.etag = column_text(chunks.get(), 1);
        chunk.checksum = column_text(chunks.get(), 2);
        chunk.uploaded_at = from_epoch_ms(sqlite3_column_int64(chunks.get(), 3));
        record.chunks.emplace(chunk.chunk_index, std::move(chunk));
    }
}

std::vector<SessionRecord> SessionStore::load_where(const char* where_clause, std::optional<std::int64_t> bound) {
    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions " + where_clause +
                            " ORDER BY created_at";
    auto stmt = prepare(db_, sql.c_str());
    if (bound) {
        sqlite3_bind_int64(stmt.get(), 1, *bound);
    }
    std::vector<SessionRecord> records;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        records.push_back(read_session_row(stmt.get()));
    }
    for (auto& record : records) {
        load_children(record);
    }
    return records;
}

std::optional<SessionRecord> SessionStore::load(const std::string& session_id) {
    const std::string sql = std::string("SELECT ") + kSessionColumns + " FROM upload_sessions WHERE session_id=?";
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, sql.c_str());
    bind_text(stmt.get(), 1, session_id);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        return std::nullopt;
    }
    auto record = read_session_row(stmt.get());
    stmt.reset();
    load_children(record);
    return record;
}

std::vector<SessionRecord> SessionStore::load_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_where("", std::nullopt);
}

std::vector<SessionRecord> SessionStore::load_expired(TimePoint now) {
    std::lock_guard<std::mutex> lock(mutex_);
    return load_where("WHERE expires_at <= ?", to_epoch_ms(now));
}

bool SessionStore::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    exec("BEGIN IMMEDIATE");
    try {
        for (const char* sql : {"DELETE FROM session_chunks WHERE session_id=?",
                                "DELETE FROM session_metadata WHERE session_id=?"}) {
            auto stmt = prepare(db_, sql);
            bind_text(stmt.get(), 1, session_id);
            step_done(db_, stmt.get());
        }
        auto stmt = prepare(db_, "DELETE FROM upload_sessions WHERE session_id=?");
        bind_text(stmt.get(), 1, session_id);
        step_done(db_, stmt.get());
        const bool removed = sqlite3_changes(db_) > 0;
        exec("COMMIT");
        return removed;
    } catch (...) {
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
        throw;
    }
}

void SessionStore::record_orphan(const OrphanedUpload& orphan) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, R"SQL(
        INSERT INTO orphaned_uploads(upload_id, session_id, file_key, reason, recorded_at)
        VALUES(?,?,?,?,?)
        ON CONFLICT(upload_id) DO UPDATE SET reason=excluded.reason, recorded_at=excluded.recorded_at
    )SQL");
    bind_text(stmt.get(), 1, orphan.upload_id);
    bind_text(stmt.get(), 2, orphan.session_id);
    bind_text(stmt.get(), 3, orphan.file_key);
    bind_text(stmt.get(), 4, orphan.reason);
    sqlite3_bind_int64(stmt.get(), 5, to_epoch_ms(orphan.recorded_at));
    step_done(db_, stmt.get());
}

std::vector<OrphanedUpload> SessionStore::orphans() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, R"SQL(
        SELECT upload_id,session_id,file_key,reason,recorded_at FROM orphaned_uploads ORDER BY recorded_at
    )SQL");
    std::vector<OrphanedUpload> result;
    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        result.push_back(OrphanedUpload{column_text(stmt.get(), 0), column_text(stmt.get(), 1),
                                        column_text(stmt.get(), 2), column_text(stmt.get(), 3),
                                        from_epoch_ms(sqlite3_column_int64(stmt.get(), 4))});
    }
    return result;
}

bool SessionStore::remove_orphan(const std::string& upload_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stmt = prepare(db_, "DELETE FROM orphaned_uploads WHERE upload_id=?");
    bind_text(stmt.get(), 1, upload_id);
    step_done(db_, stmt.get());
    return sqlite3_changes(db_) > 0;
}

}  // namespace chunkflow::engine
