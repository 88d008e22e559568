#pragma once

#include "upload_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace chunkflow::engine {

struct RetrySettings {
    std::uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    std::chrono::milliseconds max_delay{10000};
    double backoff_multiplier = 2.0;
};

struct CategoryLimits {
    std::uint64_t document = 100ULL * 1024 * 1024;
    std::uint64_t image = 10ULL * 1024 * 1024;
    std::uint64_t video = 500ULL * 1024 * 1024;
    std::uint64_t nda = 50ULL * 1024 * 1024;

    std::uint64_t for_category(Category category) const;
};

struct ChunkSizes {
    std::uint64_t small = 1ULL * 1024 * 1024;
    std::uint64_t medium = 2ULL * 1024 * 1024;
    std::uint64_t large = 5ULL * 1024 * 1024;
};

struct MimeTypes {
    std::vector<std::string> document = {
        "application/pdf",
        "application/msword",
        "application/vnd.openxmlformats-officedocument.wordprocessingml.document",
        "text/plain",
        "application/rtf",
    };
    std::vector<std::string> image = {"image/jpeg", "image/png", "image/gif", "image/webp", "image/avif"};
    std::vector<std::string> video = {"video/mp4", "video/quicktime", "video/x-msvideo", "video/webm"};
    std::vector<std::string> nda = {"application/pdf"};

    const std::vector<std::string>& for_category(Category category) const;
};

struct EngineConfig {
    std::string database_file = "./data/chunkflow.db";
    std::string storage_root = "./data/storage";
    std::string log_file = "./data/chunkflow.log";
    std::string log_level = "info";
    std::string public_base_url;

    CategoryLimits max_file_size;
    ChunkSizes chunk_size;
    MimeTypes mime_types;

    std::size_t max_concurrent_uploads = 3;
    std::size_t max_concurrent_chunks = 3;
    std::size_t worker_threads = 0;  // 0: uploads x chunks

    RetrySettings retry;
    std::chrono::milliseconds chunk_timeout{30000};
    std::chrono::seconds session_expiry{24 * 60 * 60};
    std::chrono::seconds cleanup_interval{60 * 60};
    double speed_smoothing = 0.3;

    std::size_t effective_worker_threads() const;
};

EngineConfig load_config(const std::string& path);

}  // namespace chunkflow::engine
