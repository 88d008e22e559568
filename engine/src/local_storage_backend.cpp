#include "local_storage_backend.hpp"

#include "checksum.hpp"
#include "logger.hpp"
#include "upload_error.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <vector>

namespace chunkflow::engine {

namespace {
constexpr std::size_t kCopyBuffer = 1024 * 1024;

struct Manifest {
    std::string file_key;
    std::string mime_type;
};

void write_manifest(const std::filesystem::path& path, const Manifest& manifest, const Metadata& metadata) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw UploadError(UploadErrorCode::kServerError, "Unable to write manifest " + path.string());
    }
    out << "key=" << manifest.file_key << "\n";
    out << "mime=" << manifest.mime_type << "\n";
    for (const auto& [key, value] : metadata) {
        if (key.find_first_of("=\n") != std::string::npos || value.find('\n') != std::string::npos) {
            continue;
        }
        out << "meta." << key << "=" << value << "\n";
    }
    out.flush();
}

Manifest read_manifest(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw UploadError(UploadErrorCode::kServerError, "NoSuchUpload: missing manifest " + path.string());
    }
    Manifest manifest;
    std::string line;
    while (std::getline(in, line)) {
        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }
        const auto key = line.substr(0, pos);
        const auto value = line.substr(pos + 1);
        if (key == "key") {
            manifest.file_key = value;
        } else if (key == "mime") {
            manifest.mime_type = value;
        }
    }
    return manifest;
}

bool write_file(const std::filesystem::path& path, std::span<const std::byte> data) {
    const int fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (fd < 0) {
        return false;
    }
    std::size_t total = 0;
    while (total < data.size()) {
        const ssize_t written = ::pwrite(fd, data.data() + total, data.size() - total,
                                         static_cast<off_t>(total));
        if (written < 0 && errno == EINTR) {
            continue;
        }
        if (written <= 0) {
            ::close(fd);
            return false;
        }
        total += static_cast<std::size_t>(written);
    }
    const bool synced = ::fsync(fd) == 0;
    ::close(fd);
    return synced;
}

std::vector<std::byte> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw UploadError(UploadErrorCode::kServerError, "Unable to read " + path.string());
    }
    const auto size = std::filesystem::file_size(path);
    std::vector<std::byte> buffer(static_cast<std::size_t>(size));
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
    return buffer;
}

std::string quoted(const std::string& value) {
    return "\"" + value + "\"";
}

}  // namespace

LocalStorageBackend::LocalStorageBackend(std::filesystem::path root, std::string public_base_url, Logger& logger)
    : root_(std::move(root)), public_base_url_(std::move(public_base_url)), logger_(logger) {
    std::filesystem::create_directories(root_ / ".multipart");
    while (!public_base_url_.empty() && public_base_url_.back() == '/') {
        public_base_url_.pop_back();
    }
}

std::filesystem::path LocalStorageBackend::sanitize_path(const std::filesystem::path& base,
                                                         const std::filesystem::path& relative) const {
    auto target = base / relative;
    auto canonical_base = std::filesystem::weakly_canonical(base);
    auto canonical_target = std::filesystem::weakly_canonical(target);
    if (canonical_target.string().rfind(canonical_base.string() + "/", 0) != 0) {
        throw UploadError(UploadErrorCode::kValidationError, "Path traversal detected in " + relative.string());
    }
    return canonical_target;
}

std::filesystem::path LocalStorageBackend::object_path(const std::string& file_key) const {
    return sanitize_path(root_, file_key);
}

std::filesystem::path LocalStorageBackend::staging_dir(const std::string& upload_id) const {
    if (upload_id.empty() || upload_id.find_first_not_of("0123456789abcdef") != std::string::npos) {
        throw UploadError(UploadErrorCode::kServerError, "NoSuchUpload: malformed upload id");
    }
    return root_ / ".multipart" / upload_id;
}

std::filesystem::path LocalStorageBackend::part_file(const std::string& upload_id, std::uint32_t chunk_index) const {
    return staging_dir(upload_id) / ("part-" + std::to_string(chunk_index));
}

std::filesystem::path LocalStorageBackend::manifest_file(const std::string& upload_id) const {
    return staging_dir(upload_id) / "manifest";
}

bool LocalStorageBackend::upload_exists(const std::string& upload_id) const {
    return std::filesystem::exists(manifest_file(upload_id));
}

std::string LocalStorageBackend::initiate(const std::string& file_key,
                                          const std::string& mime_type,
                                          const Metadata& metadata) {
    if (file_key.empty()) {
        throw UploadError(UploadErrorCode::kValidationError, "Empty file key");
    }
    object_path(file_key);

    const auto upload_id = random_hex_id();
    const auto dir = staging_dir(upload_id);
    std::filesystem::create_directories(dir);
    write_manifest(manifest_file(upload_id), Manifest{file_key, mime_type}, metadata);
    logger_.debug("Initiated multipart " + upload_id + " for " + file_key);
    return upload_id;
}

// Local writes do not block long enough to need the timeout.
PartAck LocalStorageBackend::upload_part(const std::string& upload_id,
                                         std::uint32_t chunk_index,
                                         std::span<const std::byte> bytes,
                                         const std::string& checksum,
                                         std::chrono::milliseconds) {
    if (!upload_exists(upload_id)) {
        throw UploadError(UploadErrorCode::kServerError, "NoSuchUpload: " + upload_id);
    }
    const auto received_checksum = ChecksumComputer::compute(bytes);
    if (!checksum.empty() && received_checksum != checksum) {
        throw UploadError(UploadErrorCode::kChecksumMismatch,
                          "Part " + std::to_string(chunk_index) + " checksum mismatch", true);
    }

    const auto target = part_file(upload_id, chunk_index);
    auto temp = target;
    temp += ".tmp";
    if (!write_file(temp, bytes)) {
        throw UploadError(UploadErrorCode::kServerError,
                          "Failed to write part " + std::to_string(chunk_index) + ": " + std::strerror(errno),
                          true);
    }
    std::filesystem::rename(temp, target);
    return PartAck{quoted(ChecksumComputer::md5(bytes)), received_checksum};
}

MultipartResult LocalStorageBackend::complete_multipart(const std::string& upload_id,
                                                        const std::vector<CompletedPart>& parts) {
    if (!upload_exists(upload_id)) {
        throw UploadError(UploadErrorCode::kServerError, "NoSuchUpload: " + upload_id);
    }
    if (parts.empty()) {
        throw UploadError(UploadErrorCode::kValidationError, "Multipart completion requires at least one part");
    }
    for (std::size_t i = 1; i < parts.size(); ++i) {
        if (parts[i].chunk_index <= parts[i - 1].chunk_index) {
            throw UploadError(UploadErrorCode::kValidationError, "Parts must be in ascending order");
        }
    }

    const auto manifest = read_manifest(manifest_file(upload_id));
    const auto final_path = object_path(manifest.file_key);
    std::filesystem::create_directories(final_path.parent_path());

    auto assembling = final_path;
    assembling += ".assembling";
    {
        std::ofstream out(assembling, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw UploadError(UploadErrorCode::kServerError, "Unable to create " + assembling.string());
        }
        for (const auto& part : parts) {
            const auto path = part_file(upload_id, part.chunk_index);
            if (!std::filesystem::exists(path)) {
                throw UploadError(UploadErrorCode::kServerError,
                                  "InvalidPart: part " + std::to_string(part.chunk_index) + " was never uploaded");
            }
            const auto data = read_file(path);
            if (quoted(ChecksumComputer::md5(data)) != part.etag) {
                throw UploadError(UploadErrorCode::kServerError,
                                  "InvalidPart: etag mismatch for part " + std::to_string(part.chunk_index));
            }
            for (std::size_t offset = 0; offset < data.size(); offset += kCopyBuffer) {
                const auto len = std::min(kCopyBuffer, data.size() - offset);
                out.write(reinterpret_cast<const char*>(data.data() + offset), static_cast<std::streamsize>(len));
            }
        }
        out.flush();
        if (!out) {
            throw UploadError(UploadErrorCode::kServerError, "Write failed for " + assembling.string());
        }
    }
    std::filesystem::rename(assembling, final_path);
    std::filesystem::remove_all(staging_dir(upload_id));
    logger_.info("Completed multipart " + upload_id + " into " + final_path.string());

    MultipartResult result;
    result.url = "file://" + final_path.string();
    if (!public_base_url_.empty()) {
        result.public_url = public_base_url_ + "/" + manifest.file_key;
    }
    return result;
}

void LocalStorageBackend::abort_multipart(const std::string& upload_id) {
    const auto dir = staging_dir(upload_id);
    if (!std::filesystem::exists(dir)) {
        throw UploadError(UploadErrorCode::kServerError, "NoSuchUpload: " + upload_id);
    }
    std::filesystem::remove_all(dir);
    logger_.info("Aborted multipart " + upload_id);
}

}  // namespace chunkflow::engine
