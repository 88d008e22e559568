#pragma once

#include "chunk_planner.hpp"
#include "config_loader.hpp"
#include "retry_strategy.hpp"
#include "upload_error.hpp"
#include "upload_types.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chunkflow::engine {

class Clock;
class EventBus;
class FileSource;
class Logger;
class SessionStore;
class StorageBackend;
class TaskExecutor;

struct UploadRequest {
    std::shared_ptr<const FileSource> source;
    std::string file_name;
    std::string mime_type;
    Category category = Category::kDocument;
    std::string owner;
    Metadata metadata;
};

struct UploadOptions {
    // Overrides the category policy for this session only.
    std::optional<std::uint64_t> chunk_size;
    std::optional<std::size_t> max_concurrent_chunks;
};

// Reopens the bytes behind a session that was loaded from the store.
using SourceResolver = std::function<std::shared_ptr<const FileSource>(const SessionRecord&)>;

// Owns every session of this process. Synchronous calls throw UploadError;
// everything that happens on worker threads is reported through the EventBus.
class UploadOrchestrator {
public:
    UploadOrchestrator(const EngineConfig& config,
                       SessionStore& store,
                       StorageBackend& backend,
                       TaskExecutor& executor,
                       EventBus& events,
                       const Clock& clock,
                       Logger& logger);
    ~UploadOrchestrator();

    UploadOrchestrator(const UploadOrchestrator&) = delete;
    UploadOrchestrator& operator=(const UploadOrchestrator&) = delete;

    // Returns as soon as every chunk has been handed to the worker pool.
    std::string start_upload(UploadRequest request, const UploadOptions& options = {});

    // Re-enqueues only the chunks the backend has not acknowledged.
    SessionResumeInfo resume_upload(const std::string& session_id);

    // Blocks until in-flight chunks have finished and the session is paused.
    void pause_upload(const std::string& session_id);

    void cancel_upload(const std::string& session_id, const std::string& reason);

    ChunkedUploadProgress get_progress(const std::string& session_id) const;

    // True once the session is paused or terminal with no worker still running.
    bool wait(const std::string& session_id, std::chrono::milliseconds timeout) const;

    std::vector<SessionRecord> list_sessions() const;
    std::vector<OrphanedUpload> orphans() const;

    // Adopts persisted non-terminal sessions; ones interrupted mid-upload
    // become paused. Returns the number adopted.
    std::size_t restore();

    // Fails expired live sessions, aborts and deletes expired records and
    // retries orphaned aborts. Returns the number of records deleted.
    std::size_t collect_expired();

    void set_source_resolver(SourceResolver resolver);

    // Pauses every uploading session; returns how many were paused.
    std::size_t pause_all();

    // pause_all() and waits for every worker to leave.
    void shutdown();

private:
    struct SessionContext;
    using ContextPtr = std::shared_ptr<SessionContext>;

    ContextPtr lookup(const std::string& session_id) const;
    ContextPtr adopt(SessionRecord record) const;
    std::vector<ContextPtr> snapshot() const;

    void validate(const UploadRequest& request, std::uint64_t file_size) const;
    std::shared_ptr<const FileSource> resolve_source(SessionContext& ctx) const;
    void launch(const ContextPtr& ctx, std::vector<ChunkMetadata> chunks, std::size_t max_concurrent_chunks);

    void on_chunk_started(const ContextPtr& ctx, const ChunkMetadata& chunk);
    void on_chunk_retry(const ContextPtr& ctx,
                        const ChunkMetadata& chunk,
                        std::uint32_t retry,
                        std::chrono::milliseconds delay,
                        const UploadError& error);
    void on_chunk_succeeded(const ContextPtr& ctx, const ChunkMetadata& chunk, const ChunkUploadResult& result);
    void on_chunk_exhausted(const ContextPtr& ctx,
                            const ChunkMetadata& chunk,
                            const UploadError& error,
                            std::uint32_t retries);
    void on_chunk_fatal(const ContextPtr& ctx, const ChunkMetadata& chunk, const UploadError& error);
    void on_workers_drained(const ContextPtr& ctx, std::uint64_t generation);

    void complete(const ContextPtr& ctx);
    void fail(const ContextPtr& ctx, const UploadError& error);
    void abort_remote(const SessionRecord& record, const std::string& reason);
    // Throws like UploadSession::ensure_active; an expired session is failed first.
    void require_active(const ContextPtr& ctx, std::unique_lock<std::mutex>& lock, TimePoint now);

    void persist_status(SessionContext& ctx);
    void publish_progress_locked(const SessionContext& ctx);
    ChunkedUploadProgress progress_locked(const SessionContext& ctx) const;

    const EngineConfig& config_;
    SessionStore& store_;
    StorageBackend& backend_;
    TaskExecutor& executor_;
    EventBus& events_;
    const Clock& clock_;
    Logger& logger_;
    ChunkSizePolicy policy_;
    ExponentialBackoffStrategy retry_;
    SourceResolver resolver_;

    mutable std::mutex sessions_mutex_;
    mutable std::map<std::string, ContextPtr> sessions_;
};

}  // namespace chunkflow::engine
