#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunkflow::engine {

// Random-access view of the bytes being uploaded. read() may be called from
// several worker threads at once.
class FileSource {
public:
    virtual ~FileSource() = default;

    virtual std::uint64_t size() const = 0;
    virtual std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const = 0;
    virtual std::string path() const { return {}; }
};

class LocalFileSource : public FileSource {
public:
    explicit LocalFileSource(std::filesystem::path path);

    std::uint64_t size() const override { return size_; }
    std::vector<std::byte> read(std::uint64_t offset, std::size_t length) const override;
    std::string path() const override { return path_.string(); }

private:
    std::filesystem::path path_;
    std::uint64_t size_;
};

}  // namespace chunkflow::engine
