#include "upload_session.hpp"

#include "upload_error.hpp"

#include <algorithm>

namespace chunkflow::engine {

UploadSession::UploadSession(SessionRecord record) : record_(std::move(record)) {}

bool UploadSession::can_transition(UploadStatus from, UploadStatus to) {
    switch (from) {
        case UploadStatus::kInitializing:
            return to == UploadStatus::kUploading || to == UploadStatus::kFailed ||
                   to == UploadStatus::kCancelled;
        case UploadStatus::kUploading:
            return to == UploadStatus::kPaused || to == UploadStatus::kCompleted ||
                   to == UploadStatus::kFailed || to == UploadStatus::kCancelled;
        case UploadStatus::kPaused:
            return to == UploadStatus::kUploading || to == UploadStatus::kFailed ||
                   to == UploadStatus::kCancelled;
        case UploadStatus::kCompleted:
        case UploadStatus::kFailed:
        case UploadStatus::kCancelled:
            return false;
    }
    return false;
}

void UploadSession::transition_to(UploadStatus next, TimePoint now) {
    if (!can_transition(record_.status, next)) {
        throw UploadError(UploadErrorCode::kInvalidState,
                          "Session " + record_.session_id + " cannot move from " +
                              std::string(to_string(record_.status)) + " to " + std::string(to_string(next)));
    }
    if (next == UploadStatus::kCompleted && !is_complete()) {
        throw UploadError(UploadErrorCode::kInvalidState,
                          "Session " + record_.session_id + " is missing chunks and cannot complete");
    }
    record_.status = next;
    record_.updated_at = now;
}

bool UploadSession::record_chunk(const PersistedChunk& chunk, TimePoint now) {
    if (is_terminal()) {
        throw UploadError(UploadErrorCode::kInvalidState, "Session " + record_.session_id + " is terminal");
    }
    if (chunk.chunk_index >= record_.total_chunks) {
        throw UploadError(UploadErrorCode::kValidationError,
                          "Chunk index " + std::to_string(chunk.chunk_index) + " out of range");
    }
    const bool added = record_.chunks.find(chunk.chunk_index) == record_.chunks.end();
    record_.chunks[chunk.chunk_index] = chunk;
    record_.updated_at = now;
    return added;
}

bool UploadSession::is_complete() const {
    if (record_.total_chunks == 0 || record_.chunks.size() != record_.total_chunks) {
        return false;
    }
    // Keys are unique and in range, so size equality means full coverage.
    return record_.chunks.rbegin()->first == record_.total_chunks - 1;
}

bool UploadSession::has_chunk(std::uint32_t chunk_index) const {
    return record_.chunks.count(chunk_index) > 0;
}

void UploadSession::ensure_active(TimePoint now) const {
    if (is_terminal()) {
        throw UploadError(UploadErrorCode::kInvalidState,
                          "Session " + record_.session_id + " is " + std::string(to_string(record_.status)));
    }
    if (is_expired(now)) {
        throw UploadError(UploadErrorCode::kSessionExpired, "Session " + record_.session_id + " has expired");
    }
}

std::uint64_t UploadSession::chunk_length(std::uint32_t chunk_index) const {
    if (chunk_index + 1 < record_.total_chunks) {
        return record_.chunk_size;
    }
    return record_.file_size - static_cast<std::uint64_t>(chunk_index) * record_.chunk_size;
}

std::uint64_t UploadSession::uploaded_bytes() const {
    std::uint64_t total = 0;
    for (const auto& entry : record_.chunks) {
        total += chunk_length(entry.first);
    }
    return total;
}

std::vector<std::uint32_t> UploadSession::remaining_chunks() const {
    std::vector<std::uint32_t> remaining;
    for (std::uint32_t i = 0; i < record_.total_chunks; ++i) {
        if (!has_chunk(i)) {
            remaining.push_back(i);
        }
    }
    return remaining;
}

SessionResumeInfo UploadSession::resume_info(TimePoint now) const {
    SessionResumeInfo info;
    info.session_id = record_.session_id;
    for (const auto& entry : record_.chunks) {
        info.uploaded_chunks.push_back(entry.first);
    }
    info.remaining_chunks = remaining_chunks();
    info.next_chunk_index = info.remaining_chunks.empty() ? record_.total_chunks : info.remaining_chunks.front();

    if (record_.status == UploadStatus::kCompleted || record_.status == UploadStatus::kCancelled ||
        record_.status == UploadStatus::kFailed) {
        info.can_resume = false;
        info.reason = "Session is " + std::string(to_string(record_.status));
    } else if (is_expired(now)) {
        info.can_resume = false;
        info.reason = "Session has expired";
    } else {
        info.can_resume = true;
    }
    return info;
}

std::vector<CompletedPart> UploadSession::ordered_parts() const {
    std::vector<CompletedPart> parts;
    parts.reserve(record_.chunks.size());
    for (const auto& [index, chunk] : record_.chunks) {
        parts.push_back(CompletedPart{index, chunk.etag});
    }
    return parts;
}

}  // namespace chunkflow::engine
