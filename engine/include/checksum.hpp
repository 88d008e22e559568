#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

namespace chunkflow::engine {

// Deterministic content digests, lowercase hex.
class ChecksumComputer {
public:
    static std::string compute(std::span<const std::byte> data);  // SHA-256
    static std::string md5(std::span<const std::byte> data);
    static bool matches(std::span<const std::byte> data, std::string_view expected);
};

std::string random_hex_id(std::size_t bytes = 16);

}  // namespace chunkflow::engine
