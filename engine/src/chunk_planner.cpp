#include "chunk_planner.hpp"

#include "checksum.hpp"
#include "file_source.hpp"
#include "upload_error.hpp"

#include <algorithm>
#include <limits>

namespace chunkflow::engine {

namespace {
constexpr std::uint64_t kLargeVideoThreshold = 50ULL * 1024 * 1024;
constexpr std::uint64_t kSmallImageThreshold = 5ULL * 1024 * 1024;
}

ChunkSizePolicy::ChunkSizePolicy(ChunkSizes sizes) : sizes_(sizes) {}

std::uint64_t ChunkSizePolicy::chunk_size_for(Category category, std::uint64_t file_size) const {
    if (category == Category::kVideo && file_size > kLargeVideoThreshold) {
        return sizes_.large;
    }
    if (category == Category::kImage && file_size < kSmallImageThreshold) {
        return sizes_.small;
    }
    return sizes_.medium;
}

std::uint32_t ChunkPlanner::chunk_count(std::uint64_t file_size, std::uint64_t chunk_size) {
    if (file_size == 0) {
        throw UploadError(UploadErrorCode::kValidationError, "File size must be greater than zero");
    }
    if (chunk_size == 0) {
        throw UploadError(UploadErrorCode::kValidationError, "Chunk size must be greater than zero");
    }
    const std::uint64_t count = (file_size + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw UploadError(UploadErrorCode::kValidationError, "Chunk size too small for file");
    }
    return static_cast<std::uint32_t>(count);
}

std::vector<ChunkMetadata> ChunkPlanner::plan(std::uint64_t file_size, std::uint64_t chunk_size) {
    const auto total = chunk_count(file_size, chunk_size);
    std::vector<ChunkMetadata> chunks;
    chunks.reserve(total);
    for (std::uint32_t i = 0; i < total; ++i) {
        ChunkMetadata chunk;
        chunk.chunk_index = i;
        chunk.start_byte = static_cast<std::uint64_t>(i) * chunk_size;
        chunk.end_byte = std::min(chunk.start_byte + chunk_size, file_size);
        chunk.chunk_size = chunk.end_byte - chunk.start_byte;
        chunk.total_chunks = total;
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

std::vector<ChunkMetadata> ChunkPlanner::plan(const FileSource& source, std::uint64_t chunk_size) {
    auto chunks = plan(source.size(), chunk_size);
    for (auto& chunk : chunks) {
        const auto bytes = source.read(chunk.start_byte, static_cast<std::size_t>(chunk.chunk_size));
        if (bytes.size() != chunk.chunk_size) {
            throw UploadError(UploadErrorCode::kValidationError, "Source shorter than its reported size");
        }
        chunk.checksum = ChecksumComputer::compute(bytes);
    }
    return chunks;
}

}  // namespace chunkflow::engine
