#include "file_source.hpp"

#include <fcntl.h>
#include <sys/mman.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace chunkflow::engine {

namespace {
constexpr std::uint64_t kMmapThreshold = 100ULL * 1024 * 1024;
}

LocalFileSource::LocalFileSource(std::filesystem::path path) : path_(std::move(path)) {
    if (!std::filesystem::is_regular_file(path_)) {
        throw std::runtime_error("Source file not found: " + path_.string());
    }
    size_ = std::filesystem::file_size(path_);
}

std::vector<std::byte> LocalFileSource::read(std::uint64_t offset, std::size_t length) const {
    if (offset >= size_) {
        return {};
    }
    const std::size_t to_read = static_cast<std::size_t>(std::min<std::uint64_t>(length, size_ - offset));
    std::vector<std::byte> buffer(to_read);

    const int fd = ::open(path_.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Unable to open source file: " + path_.string());
    }

    if (size_ >= kMmapThreshold) {
        const long page_size = sysconf(_SC_PAGESIZE);
        const std::uint64_t page_offset = offset % static_cast<std::uint64_t>(page_size);
        const std::uint64_t map_offset = offset - page_offset;
        const std::size_t map_length = static_cast<std::size_t>(page_offset + to_read);
        void* mapped =
            ::mmap(nullptr, map_length, PROT_READ, MAP_PRIVATE, fd, static_cast<off_t>(map_offset));
        if (mapped == MAP_FAILED) {
            ::close(fd);
            throw std::runtime_error("mmap failed for " + path_.string());
        }
        std::memcpy(buffer.data(), static_cast<char*>(mapped) + page_offset, to_read);
        ::munmap(mapped, map_length);
        ::close(fd);
        return buffer;
    }

    std::size_t total = 0;
    while (total < to_read) {
        const ssize_t got = ::pread(fd, buffer.data() + total, to_read - total,
                                    static_cast<off_t>(offset + total));
        if (got < 0 && errno == EINTR) {
            continue;
        }
        if (got <= 0) {
            ::close(fd);
            throw std::runtime_error("Short read from " + path_.string());
        }
        total += static_cast<std::size_t>(got);
    }
    ::close(fd);
    return buffer;
}

}  // namespace chunkflow::engine
