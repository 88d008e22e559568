#include "checksum.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunkflow::engine {

namespace {

std::string to_hex(const unsigned char* digest, std::size_t length) {
    std::ostringstream oss;
    oss << std::hex;
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string digest_hex(const EVP_MD* md, std::span<const std::byte> data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1) {
        throw std::runtime_error("Digest computation failed");
    }
    return to_hex(digest.data(), length);
}

}  // namespace

std::string ChecksumComputer::compute(std::span<const std::byte> data) {
    return digest_hex(EVP_sha256(), data);
}

std::string ChecksumComputer::md5(std::span<const std::byte> data) {
    return digest_hex(EVP_md5(), data);
}

bool ChecksumComputer::matches(std::span<const std::byte> data, std::string_view expected) {
    return compute(data) == expected;
}

std::string random_hex_id(std::size_t bytes) {
    std::vector<unsigned char> buffer(bytes);
    if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    return to_hex(buffer.data(), buffer.size());
}

}  // namespace chunkflow::engine
