#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace chunkflow::engine {

using TimePoint = std::chrono::system_clock::time_point;

// Opaque to the engine; only external collaborators interpret it.
using Metadata = std::map<std::string, std::string>;

enum class Category {
    kDocument,
    kImage,
    kVideo,
    kNda,
};

enum class Priority {
    kLow,
    kNormal,
    kHigh,
};

enum class UploadStatus {
    kInitializing,
    kUploading,
    kPaused,
    kCompleted,
    kFailed,
    kCancelled,
};

std::string_view to_string(Category category);
std::optional<Category> parse_category(std::string_view text);
std::string_view to_string(Priority priority);
std::optional<Priority> parse_priority(std::string_view text);
std::string_view to_string(UploadStatus status);
std::optional<UploadStatus> parse_status(std::string_view text);

bool is_terminal(UploadStatus status);

std::int64_t to_epoch_ms(TimePoint point);
TimePoint from_epoch_ms(std::int64_t millis);

// Half-open byte range [start_byte, end_byte) of the source file.
struct ChunkMetadata {
    std::uint32_t chunk_index = 0;
    std::uint64_t start_byte = 0;
    std::uint64_t end_byte = 0;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    std::string checksum;
};

struct ChunkUploadResult {
    std::uint32_t chunk_index = 0;
    std::string etag;
    std::string checksum;
    TimePoint uploaded_at{};
    bool success = false;
    std::optional<std::string> error;
    std::uint32_t retry_count = 0;
};

struct PersistedChunk {
    std::uint32_t chunk_index = 0;
    std::string etag;
    std::string checksum;
    TimePoint uploaded_at{};
};

struct SessionRecord {
    std::string session_id;
    std::string upload_id;
    std::string file_key;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string mime_type;
    Category category = Category::kDocument;
    std::string owner;
    std::string source_path;
    std::uint64_t chunk_size = 0;
    std::uint32_t total_chunks = 0;
    UploadStatus status = UploadStatus::kInitializing;
    TimePoint created_at{};
    TimePoint updated_at{};
    TimePoint expires_at{};
    Metadata metadata;
    std::map<std::uint32_t, PersistedChunk> chunks;
};

struct SessionResumeInfo {
    std::string session_id;
    std::vector<std::uint32_t> uploaded_chunks;
    std::vector<std::uint32_t> remaining_chunks;
    std::uint32_t next_chunk_index = 0;
    bool can_resume = false;
    std::string reason;
};

struct ChunkedUploadProgress {
    std::string session_id;
    std::uint64_t uploaded_bytes = 0;
    std::uint64_t total_bytes = 0;
    std::uint32_t uploaded_chunks = 0;
    std::uint32_t total_chunks = 0;
    double percentage = 0.0;
    double speed = 0.0;                     // bytes per second
    double estimated_time_remaining = 0.0;  // seconds
    std::size_t active_chunks = 0;
    std::size_t queued_chunks = 0;
    std::size_t failed_chunks = 0;
    UploadStatus status = UploadStatus::kInitializing;
};

struct CompletedUploadResult {
    std::string session_id;
    std::string file_key;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::string mime_type;
    std::string url;
    std::optional<std::string> public_url;
    TimePoint uploaded_at{};
    std::chrono::milliseconds duration{0};
    double average_speed = 0.0;
    Metadata metadata;
};

// Remote multipart upload left behind when abort_multipart failed.
struct OrphanedUpload {
    std::string upload_id;
    std::string session_id;
    std::string file_key;
    std::string reason;
    TimePoint recorded_at{};
};

struct QueueStats {
    std::size_t total_items = 0;
    std::size_t active_uploads = 0;
    std::size_t queued_uploads = 0;
    std::size_t completed_uploads = 0;
    std::size_t failed_uploads = 0;
    std::size_t cancelled_uploads = 0;
    std::uint64_t total_uploaded_bytes = 0;
    double average_upload_speed = 0.0;
    double estimated_queue_time = 0.0;  // seconds
};

}  // namespace chunkflow::engine
