#include "cli_app.hpp"

#include "file_source.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <variant>

namespace chunkflow::cli {

namespace {

const std::map<std::string, std::string>& extension_mime_types() {
    static const std::map<std::string, std::string> types = {
        {".pdf", "application/pdf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".txt", "text/plain"},
        {".rtf", "application/rtf"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".png", "image/png"},
        {".gif", "image/gif"},
        {".webp", "image/webp"},
        {".avif", "image/avif"},
        {".mp4", "video/mp4"},
        {".mov", "video/quicktime"},
        {".avi", "video/x-msvideo"},
        {".webm", "video/webm"},
    };
    return types;
}

std::string guess_mime_type(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    const auto& types = extension_mime_types();
    auto it = types.find(ext);
    return it == types.end() ? "application/octet-stream" : it->second;
}

engine::Category guess_category(const std::string& mime_type) {
    if (mime_type.rfind("image/", 0) == 0) {
        return engine::Category::kImage;
    }
    if (mime_type.rfind("video/", 0) == 0) {
        return engine::Category::kVideo;
    }
    return engine::Category::kDocument;
}

std::string format_bytes(double bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    while (bytes >= 1024.0 && unit < 3) {
        bytes /= 1024.0;
        ++unit;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << bytes << units[unit];
    return oss.str();
}

std::string default_owner() {
    const char* user = std::getenv("USER");
    return user && *user ? user : "local";
}

}  // namespace

CliApp::CliApp(engine::EngineConfig config)
    : config_(std::move(config)),
      logger_(config_.log_file, engine::parse_log_level(config_.log_level), false),
      store_(config_.database_file),
      backend_(config_.storage_root, config_.public_base_url, logger_),
      executor_(config_.effective_worker_threads(), &logger_),
      events_(logger_),
      orchestrator_(config_, store_, backend_, executor_, events_, clock_, logger_),
      queue_(orchestrator_, events_, clock_, logger_, config_.max_concurrent_uploads),
      janitor_(orchestrator_, clock_, logger_, config_.cleanup_interval),
      owner_(default_owner()) {
    store_.initialize_schema();
    subscription_ = events_.subscribe([this](const engine::UploadEvent& event) { print_event(event); });
    events_.start();

    const auto restored = orchestrator_.restore();
    if (restored > 0) {
        std::cout << restored << " unfinished session(s) restored; use 'sessions' and 'resume <id>'." << std::endl;
    }
    queue_.start();
    janitor_.start();
    logger_.info("chunkflow started for owner " + owner_ + " with " + std::to_string(executor_.stats().workers) +
                 " transfer thread(s)");
}

CliApp::~CliApp() {
    shutdown();
}

void CliApp::shutdown() {
    if (stopped_) {
        return;
    }
    stopped_ = true;
    janitor_.stop();
    queue_.stop();
    const auto paused = orchestrator_.pause_all();
    if (paused > 0) {
        std::cout << paused << " upload(s) paused; they can be resumed next time." << std::endl;
    }
    orchestrator_.shutdown();
    events_.stop();
    events_.unsubscribe(subscription_);
    logger_.info("chunkflow stopped");
}

void CliApp::print_event(const engine::UploadEvent& event) {
    std::ostringstream line;
    switch (event.type) {
        case engine::UploadEventType::kSessionProgress: {
            const auto& progress = std::get<engine::ChunkedUploadProgress>(event.payload);
            line << "[" << event.session_id.substr(0, 8) << "] " << std::fixed << std::setprecision(1)
                 << progress.percentage << "% (" << progress.uploaded_chunks << "/" << progress.total_chunks
                 << " chunks, " << format_bytes(progress.speed) << "/s)";
            break;
        }
        case engine::UploadEventType::kSessionCompleted: {
            const auto& result = std::get<engine::CompletedUploadResult>(event.payload);
            line << "[" << event.session_id.substr(0, 8) << "] completed " << result.file_name << " -> "
                 << (result.public_url ? *result.public_url : result.url) << " in " << result.duration.count()
                 << "ms";
            break;
        }
        case engine::UploadEventType::kSessionFailed: {
            const auto& failure = std::get<engine::UploadFailure>(event.payload);
            line << "[" << event.session_id.substr(0, 8) << "] failed [" << engine::to_string(failure.code)
                 << "] " << failure.message;
            break;
        }
        case engine::UploadEventType::kSessionPaused:
        case engine::UploadEventType::kSessionCancelled:
        case engine::UploadEventType::kUploadOrphaned:
            line << "[" << event.session_id.substr(0, 8) << "] " << engine::event_name(event.type) << ": "
                 << event.reason;
            break;
        case engine::UploadEventType::kChunkRetry: {
            const auto& chunk = std::get<engine::ChunkEvent>(event.payload);
            line << "[" << event.session_id.substr(0, 8) << "] chunk " << chunk.chunk_index << " retry "
                 << chunk.retry_count << " in " << chunk.delay.count() << "ms";
            break;
        }
        case engine::UploadEventType::kQueueStarted: {
            const auto& queued = std::get<engine::QueueEvent>(event.payload);
            line << "[" << queued.ticket << "] started as session " << event.session_id;
            break;
        }
        default:
            return;
    }
    std::lock_guard<std::mutex> lock(output_mutex_);
    std::cout << "\n" << line.str() << std::endl;
}

std::string CliApp::resolve_session(const std::string& id_or_ticket) const {
    if (auto session = queue_.session_for(id_or_ticket)) {
        return *session;
    }
    return id_or_ticket;
}

void CliApp::handle_upload(std::istringstream& args) {
    std::string path_text, category_text, priority_text, mime_type;
    args >> path_text >> category_text >> priority_text >> mime_type;
    if (path_text.empty()) {
        std::cout << "Usage: upload <path> [category] [priority] [mime]" << std::endl;
        return;
    }
    const std::filesystem::path path(path_text);
    if (mime_type.empty()) {
        mime_type = guess_mime_type(path);
    }
    auto category = guess_category(mime_type);
    if (!category_text.empty()) {
        auto parsed = engine::parse_category(category_text);
        if (!parsed) {
            std::cout << "Unknown category: " << category_text << std::endl;
            return;
        }
        category = *parsed;
    }
    auto priority = engine::Priority::kNormal;
    if (!priority_text.empty()) {
        auto parsed = engine::parse_priority(priority_text);
        if (!parsed) {
            std::cout << "Unknown priority: " << priority_text << std::endl;
            return;
        }
        priority = *parsed;
    }

    engine::UploadRequest request;
    request.source = std::make_shared<engine::LocalFileSource>(std::filesystem::absolute(path));
    request.file_name = path.filename().string();
    request.mime_type = mime_type;
    request.category = category;
    request.owner = owner_;

    const auto file_name = request.file_name;
    const auto ticket = queue_.submit(std::move(request), priority, {}, {},
                                      [this, file_name](const engine::UploadFailure& failure) {
                                          std::lock_guard<std::mutex> lock(output_mutex_);
                                          std::cout << "\n" << file_name << ": " << engine::to_string(failure.code)
                                                    << " " << failure.message << std::endl;
                                      });
    std::cout << "Queued " << file_name << " as ticket " << ticket << std::endl;
}

void CliApp::handle_sessions() {
    const auto sessions = orchestrator_.list_sessions();
    if (sessions.empty()) {
        std::cout << "No sessions." << std::endl;
        return;
    }
    for (const auto& record : sessions) {
        std::cout << record.session_id << "  " << std::setw(12) << std::left << engine::to_string(record.status)
                  << std::right << record.chunks.size() << "/" << record.total_chunks << "  " << record.file_name
                  << std::endl;
    }
}

void CliApp::handle_status(const std::string& id) {
    const auto progress = orchestrator_.get_progress(resolve_session(id));
    std::cout << "status:    " << engine::to_string(progress.status) << "\n"
              << "uploaded:  " << format_bytes(static_cast<double>(progress.uploaded_bytes)) << " / "
              << format_bytes(static_cast<double>(progress.total_bytes)) << " (" << std::fixed
              << std::setprecision(1) << progress.percentage << "%)\n"
              << "chunks:    " << progress.uploaded_chunks << "/" << progress.total_chunks << " (active "
              << progress.active_chunks << ", queued " << progress.queued_chunks << ", failed "
              << progress.failed_chunks << ")\n"
              << "speed:     " << format_bytes(progress.speed) << "/s, eta " << std::setprecision(0)
              << progress.estimated_time_remaining << "s" << std::endl;
}

void CliApp::handle_queue() {
    const auto stats = queue_.stats();
    std::cout << "active " << stats.active_uploads << ", queued " << stats.queued_uploads << ", completed "
              << stats.completed_uploads << ", failed " << stats.failed_uploads << ", cancelled "
              << stats.cancelled_uploads << "\n"
              << "uploaded " << format_bytes(static_cast<double>(stats.total_uploaded_bytes)) << " at "
              << format_bytes(stats.average_upload_speed) << "/s, queue eta " << std::fixed
              << std::setprecision(0) << stats.estimated_queue_time << "s" << std::endl;
    const auto transfers = executor_.stats();
    std::cout << "transfer threads " << transfers.workers << ": " << transfers.busy << " busy, "
              << transfers.pending << " waiting, " << transfers.finished << " finished" << std::endl;
    for (const auto& item : queue_.queued_items()) {
        std::cout << "  " << item.ticket << "  " << engine::to_string(item.priority) << "  "
                  << item.request.file_name << std::endl;
    }
}

void CliApp::handle_orphans() {
    const auto orphans = orchestrator_.orphans();
    if (orphans.empty()) {
        std::cout << "No orphaned uploads." << std::endl;
        return;
    }
    for (const auto& orphan : orphans) {
        std::cout << orphan.upload_id << "  session " << orphan.session_id << "  " << orphan.reason << std::endl;
    }
}

void CliApp::run_shell(const std::atomic<bool>& should_run) {
    std::cout << "Type 'help' for available commands." << std::endl;
    std::string input;
    while (should_run.load()) {
        {
            std::lock_guard<std::mutex> lock(output_mutex_);
            std::cout << "chunkflow> " << std::flush;
        }
        if (!std::getline(std::cin, input)) {
            break;
        }
        if (input.empty()) {
            continue;
        }
        std::istringstream iss(input);
        std::string command;
        iss >> command;
        std::transform(command.begin(), command.end(), command.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });

        if (command == "help") {
            std::cout << "Commands:\n"
                      << "  upload <path> [document|image|video|nda] [low|normal|high] [mime]\n"
                      << "  sessions\n"
                      << "  status <session|ticket>\n"
                      << "  pause <session|ticket>\n"
                      << "  resume <session|ticket>\n"
                      << "  cancel <session|ticket> [reason]\n"
                      << "  queue\n"
                      << "  sweep\n"
                      << "  orphans\n"
                      << "  quit" << std::endl;
            continue;
        }
        if (command == "quit") {
            break;
        }

        try {
            if (command == "upload") {
                handle_upload(iss);
            } else if (command == "sessions") {
                handle_sessions();
            } else if (command == "queue") {
                handle_queue();
            } else if (command == "sweep") {
                std::cout << "Removed " << janitor_.sweep_once() << " expired session(s)" << std::endl;
            } else if (command == "orphans") {
                handle_orphans();
            } else {
                std::string id;
                iss >> id;
                if (id.empty() || (command != "status" && command != "pause" && command != "resume" &&
                                   command != "cancel")) {
                    std::cout << "Unknown command. Type 'help'." << std::endl;
                    continue;
                }
                if (command == "status") {
                    handle_status(id);
                } else if (command == "pause") {
                    orchestrator_.pause_upload(resolve_session(id));
                    std::cout << "Paused." << std::endl;
                } else if (command == "resume") {
                    const auto info = orchestrator_.resume_upload(resolve_session(id));
                    std::cout << "Resuming " << info.remaining_chunks.size() << " chunk(s)." << std::endl;
                } else {
                    std::string reason;
                    std::getline(iss >> std::ws, reason);
                    const auto ticket_cancelled = queue_.cancel(id, reason);
                    if (!ticket_cancelled) {
                        orchestrator_.cancel_upload(id, reason);
                    }
                    std::cout << "Cancelled." << std::endl;
                }
            }
        } catch (const engine::UploadError& ex) {
            std::cout << engine::to_string(ex.code()) << ": " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << std::endl;
        }
    }
}

}  // namespace chunkflow::cli
