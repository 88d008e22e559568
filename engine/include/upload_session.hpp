#pragma once

#include "storage_backend.hpp"
#include "upload_types.hpp"

#include <cstdint>
#include <vector>

namespace chunkflow::engine {

// State machine over one session record. Not synchronized; the owning
// orchestrator serializes access.
class UploadSession {
public:
    UploadSession() = default;
    explicit UploadSession(SessionRecord record);

    const SessionRecord& record() const { return record_; }
    const std::string& id() const { return record_.session_id; }
    UploadStatus status() const { return record_.status; }

    // Throws UploadError(kInvalidState) for transitions the lifecycle forbids.
    void transition_to(UploadStatus next, TimePoint now);
    static bool can_transition(UploadStatus from, UploadStatus to);

    // Idempotent: a later result for the same index overwrites the etag but
    // never shrinks the set. Returns true when the index was new.
    bool record_chunk(const PersistedChunk& chunk, TimePoint now);

    bool is_terminal() const { return engine::is_terminal(record_.status); }
    bool is_expired(TimePoint now) const { return now >= record_.expires_at; }
    bool is_complete() const;
    bool has_chunk(std::uint32_t chunk_index) const;

    // Throws SessionExpired or InvalidState when the session cannot be operated on.
    void ensure_active(TimePoint now) const;

    std::uint64_t chunk_length(std::uint32_t chunk_index) const;
    std::uint64_t uploaded_bytes() const;
    std::uint32_t uploaded_count() const { return static_cast<std::uint32_t>(record_.chunks.size()); }

    SessionResumeInfo resume_info(TimePoint now) const;
    std::vector<std::uint32_t> remaining_chunks() const;
    std::vector<CompletedPart> ordered_parts() const;

private:
    SessionRecord record_;
};

}  // namespace chunkflow::engine
