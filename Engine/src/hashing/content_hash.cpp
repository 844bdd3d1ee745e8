/**
 * @file content_hash.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/content_hash.hpp>
#include <stdexcept>

extern "C" {
#include <blake3.h>
}

namespace Cerebrum {

namespace {
constexpr char k_hex_lut[] = "0123456789abcdef";
}

ContentHash::Hash ContentHash::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

uint64_t ContentHash::hash64(std::string_view str) {
    Hash digest = hash(str);
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | digest[static_cast<size_t>(i)];
    }
    return value;
}

std::string ContentHash::to_hex(const Hash& hash) {
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(k_hex_lut[(byte >> 4) & 0xF]);
        out.push_back(k_hex_lut[byte & 0xF]);
    }
    return out;
}

std::string ContentHash::hex_prefix(std::string_view str, size_t hex_chars) {
    if (hex_chars > HASH_SIZE * 2) {
        throw std::invalid_argument("Hex prefix of " + std::to_string(hex_chars) +
                                    " exceeds digest width " + std::to_string(HASH_SIZE * 2));
    }
    return to_hex(hash(str)).substr(0, hex_chars);
}

} // namespace Cerebrum
