/**
 * @file content_hash.hpp
 * @brief BLAKE3 content addressing for cluster identity and feature hashing
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace Cerebrum {

/**
 * @brief BLAKE3 content hashing.
 *
 * SAME KEY = SAME HASH = SAME ID. Cluster rebuilds rely on this to stay idempotent.
 */
class ContentHash {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    /**
     * @brief First 8 digest bytes as an integer (little-endian), for bucketing.
     */
    static uint64_t hash64(std::string_view str);

    static std::string to_hex(const Hash& hash);

    /**
     * @brief Lower-case hex digest truncated to hex_chars characters.
     * @throws std::invalid_argument if hex_chars exceeds the digest width
     */
    static std::string hex_prefix(std::string_view str, size_t hex_chars);
};

} // namespace Cerebrum
