#pragma once

#include "config_loader.hpp"
#include "upload_types.hpp"

#include <cstdint>
#include <vector>

namespace chunkflow::engine {

class FileSource;

// Picks the chunk size for a new session. The value is frozen into the
// session record, so later policy changes never affect it.
class ChunkSizePolicy {
public:
    explicit ChunkSizePolicy(ChunkSizes sizes);

    std::uint64_t chunk_size_for(Category category, std::uint64_t file_size) const;

private:
    ChunkSizes sizes_;
};

class ChunkPlanner {
public:
    // Ranges only; checksum fields are left empty.
    static std::vector<ChunkMetadata> plan(std::uint64_t file_size, std::uint64_t chunk_size);

    // Ranges tagged with the checksum of each range's current content.
    static std::vector<ChunkMetadata> plan(const FileSource& source, std::uint64_t chunk_size);

    static std::uint32_t chunk_count(std::uint64_t file_size, std::uint64_t chunk_size);
};

}  // namespace chunkflow::engine
