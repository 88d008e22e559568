#pragma once

#include "upload_types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace chunkflow::engine {

struct PartAck {
    std::string etag;
    std::string checksum;
};

struct CompletedPart {
    std::uint32_t chunk_index = 0;
    std::string etag;
};

struct MultipartResult {
    std::string url;
    std::optional<std::string> public_url;
};

// Durable multipart object store. Implementations report failures by throwing
// UploadError (NetworkError, ServerError, AuthenticationError, QuotaExceeded);
// any other exception from upload_part is treated as a ServerError.
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    virtual std::string initiate(const std::string& file_key,
                                 const std::string& mime_type,
                                 const Metadata& metadata) = 0;

    // Must be safe to call concurrently for different chunk indices of one upload.
    virtual PartAck upload_part(const std::string& upload_id,
                                std::uint32_t chunk_index,
                                std::span<const std::byte> bytes,
                                const std::string& checksum,
                                std::chrono::milliseconds timeout) = 0;

    // parts are in strictly ascending chunk_index order.
    virtual MultipartResult complete_multipart(const std::string& upload_id,
                                               const std::vector<CompletedPart>& parts) = 0;

    virtual void abort_multipart(const std::string& upload_id) = 0;
};

}  // namespace chunkflow::engine
