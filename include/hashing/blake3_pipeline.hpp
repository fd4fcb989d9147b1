/**
 * @file blake3_pipeline.hpp
 * @brief BLAKE3 content hashing
 */

#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C" {
#include <blake3.h>
}

namespace WikiCorpus {

/**
 * @brief BLAKE3 hashing for content-addressed deduplication
 *
 * SAME CONTENT = SAME HASH = STORED ONCE
 */
class BLAKE3Pipeline {
public:
    static constexpr size_t HASH_SIZE = 16; // 128 bits
    using Hash = std::array<uint8_t, HASH_SIZE>;

    /**
     * @brief Hash single buffer
     * @param data Input data
     * @param len Length in bytes
     * @return 16-byte BLAKE3 hash
     */
    static Hash hash(const void* data, size_t len);

    static Hash hash(std::string_view str) {
        return hash(str.data(), str.size());
    }

    static Hash hash(const std::vector<uint8_t>& data) {
        return hash(data.data(), data.size());
    }

    /**
     * @brief Lower-case hex rendering, 32 characters
     */
    static std::string to_hex(const Hash& hash);
};

} // namespace WikiCorpus
