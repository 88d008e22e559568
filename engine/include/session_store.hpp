#pragma once

#include "upload_types.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace chunkflow::engine {

// SQLite-backed persistence for upload sessions. All methods are thread-safe.
class SessionStore {
public:
    explicit SessionStore(const std::string& database_path);
    ~SessionStore();

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    void initialize_schema();

    void insert(const SessionRecord& record);
    bool update_status(const std::string& session_id, UploadStatus status, TimePoint updated_at);

    // Writes the chunk only while the session is non-terminal; returns false
    // when the session is missing or terminal.
    bool record_chunk(const std::string& session_id, const PersistedChunk& chunk, TimePoint updated_at);

    std::optional<SessionRecord> load(const std::string& session_id);
    std::vector<SessionRecord> load_all();
    std::vector<SessionRecord> load_expired(TimePoint now);
    bool remove(const std::string& session_id);

    void record_orphan(const OrphanedUpload& orphan);
    std::vector<OrphanedUpload> orphans();
    bool remove_orphan(const std::string& upload_id);

private:
    void exec(const char* sql);
    std::vector<SessionRecord> load_where(const char* where_clause, std::optional<std::int64_t> bound);
    void load_children(SessionRecord& record);

    std::mutex mutex_;
    sqlite3* db_{};
};

}  // namespace chunkflow::engine
