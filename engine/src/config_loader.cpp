#include "config_loader.hpp"

#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace chunkflow::engine {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

// Unsigned decimal only; stoull would wrap a leading '-' around.
std::uint64_t parse_u64(const std::string& key, const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument("Invalid numeric value for " + key + ": " + value);
    }
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoull(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid numeric value for " + key + ": " + value);
    }
}

double parse_double(const std::string& key, const std::string& value) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid numeric value for " + key + ": " + value);
    }
}

std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace

std::uint64_t CategoryLimits::for_category(Category category) const {
    switch (category) {
        case Category::kImage:
            return image;
        case Category::kVideo:
            return video;
        case Category::kNda:
            return nda;
        case Category::kDocument:
        default:
            return document;
    }
}

const std::vector<std::string>& MimeTypes::for_category(Category category) const {
    switch (category) {
        case Category::kImage:
            return image;
        case Category::kVideo:
            return video;
        case Category::kNda:
            return nda;
        case Category::kDocument:
        default:
            return document;
    }
}

std::size_t EngineConfig::effective_worker_threads() const {
    if (worker_threads > 0) {
        return worker_threads;
    }
    const auto product = max_concurrent_uploads * max_concurrent_chunks;
    return product > 0 ? product : 1;
}

EngineConfig load_config(const std::string& path) {
    EngineConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "database_file") {
            config.database_file = value;
        } else if (key == "storage_root") {
            config.storage_root = value;
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = value;
        } else if (key == "public_base_url") {
            config.public_base_url = value;
        } else if (key == "max_file_size.document") {
            config.max_file_size.document = parse_u64(key, value);
        } else if (key == "max_file_size.image") {
            config.max_file_size.image = parse_u64(key, value);
        } else if (key == "max_file_size.video") {
            config.max_file_size.video = parse_u64(key, value);
        } else if (key == "max_file_size.nda") {
            config.max_file_size.nda = parse_u64(key, value);
        } else if (key == "chunk_size.small") {
            config.chunk_size.small = parse_u64(key, value);
        } else if (key == "chunk_size.medium") {
            config.chunk_size.medium = parse_u64(key, value);
        } else if (key == "chunk_size.large") {
            config.chunk_size.large = parse_u64(key, value);
        } else if (key == "mime_types.document") {
            config.mime_types.document = split_list(value);
        } else if (key == "mime_types.image") {
            config.mime_types.image = split_list(value);
        } else if (key == "mime_types.video") {
            config.mime_types.video = split_list(value);
        } else if (key == "mime_types.nda") {
            config.mime_types.nda = split_list(value);
        } else if (key == "max_concurrent_uploads") {
            config.max_concurrent_uploads = static_cast<std::size_t>(parse_u64(key, value));
        } else if (key == "max_concurrent_chunks") {
            config.max_concurrent_chunks = static_cast<std::size_t>(parse_u64(key, value));
        } else if (key == "worker_threads") {
            config.worker_threads = static_cast<std::size_t>(parse_u64(key, value));
        } else if (key == "retry.max_retries") {
            config.retry.max_retries = static_cast<std::uint32_t>(parse_u64(key, value));
        } else if (key == "retry.base_delay_ms") {
            config.retry.base_delay = std::chrono::milliseconds(parse_u64(key, value));
        } else if (key == "retry.max_delay_ms") {
            config.retry.max_delay = std::chrono::milliseconds(parse_u64(key, value));
        } else if (key == "retry.backoff_multiplier") {
            config.retry.backoff_multiplier = parse_double(key, value);
        } else if (key == "chunk_timeout_ms") {
            config.chunk_timeout = std::chrono::milliseconds(parse_u64(key, value));
        } else if (key == "session_expiry_seconds") {
            config.session_expiry = std::chrono::seconds(parse_u64(key, value));
        } else if (key == "cleanup_interval_seconds") {
            config.cleanup_interval = std::chrono::seconds(parse_u64(key, value));
        } else if (key == "speed_smoothing") {
            config.speed_smoothing = parse_double(key, value);
        }
    }

    return config;
}

}  // namespace chunkflow::engine
