#pragma once

#include "storage_backend.hpp"

#include <filesystem>
#include <string>

namespace chunkflow::engine {

class Logger;

// Filesystem multipart store: parts are staged under
// <root>/.multipart/<upload_id>/ and concatenated into <root>/<file_key>.
class LocalStorageBackend : public StorageBackend {
public:
    LocalStorageBackend(std::filesystem::path root, std::string public_base_url, Logger& logger);

    std::string initiate(const std::string& file_key,
                         const std::string& mime_type,
                         const Metadata& metadata) override;
    PartAck upload_part(const std::string& upload_id,
                        std::uint32_t chunk_index,
                        std::span<const std::byte> bytes,
                        const std::string& checksum,
                        std::chrono::milliseconds timeout) override;
    MultipartResult complete_multipart(const std::string& upload_id,
                                       const std::vector<CompletedPart>& parts) override;
    void abort_multipart(const std::string& upload_id) override;

    std::filesystem::path object_path(const std::string& file_key) const;
    bool upload_exists(const std::string& upload_id) const;

private:
    std::filesystem::path sanitize_path(const std::filesystem::path& base,
                                        const std::filesystem::path& relative) const;
    std::filesystem::path staging_dir(const std::string& upload_id) const;
    std::filesystem::path part_file(const std::string& upload_id, std::uint32_t chunk_index) const;
    std::filesystem::path manifest_file(const std::string& upload_id) const;

    std::filesystem::path root_;
    std::string public_base_url_;
    Logger& logger_;
};

}  // namespace chunkflow::engine
