#pragma once

#include "clock.hpp"
#include "config_loader.hpp"
#include "event_bus.hpp"
#include "local_storage_backend.hpp"
#include "logger.hpp"
#include "session_janitor.hpp"
#include "session_store.hpp"
#include "task_executor.hpp"
#include "upload_orchestrator.hpp"
#include "upload_queue_manager.hpp"

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace chunkflow::cli {

class CliApp {
public:
    explicit CliApp(engine::EngineConfig config);
    ~CliApp();

    CliApp(const CliApp&) = delete;
    CliApp& operator=(const CliApp&) = delete;

    // Reads commands from stdin until quit, EOF or should_run turns false.
    void run_shell(const std::atomic<bool>& should_run);

    // Pauses uploading sessions so a later run can resume them.
    void shutdown();

private:
    void print_event(const engine::UploadEvent& event);
    std::string resolve_session(const std::string& id_or_ticket) const;

    void handle_upload(std::istringstream& args);
    void handle_sessions();
    void handle_status(const std::string& id);
    void handle_queue();
    void handle_orphans();

    std::mutex output_mutex_;
    engine::EngineConfig config_;
    engine::Logger logger_;
    engine::SystemClock clock_;
    engine::SessionStore store_;
    engine::LocalStorageBackend backend_;
    engine::TaskExecutor executor_;
    engine::EventBus events_;
    engine::UploadOrchestrator orchestrator_;
    engine::UploadQueueManager queue_;
    engine::SessionJanitor janitor_;
    engine::EventBus::SubscriptionId subscription_{0};
    std::string owner_;
    bool stopped_{false};
};

}  // namespace chunkflow::cli
