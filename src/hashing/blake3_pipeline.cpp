/**
 * @file blake3_pipeline.cpp
 * @brief BLAKE3 hashing implementation
 */

#include <hashing/blake3_pipeline.hpp>

namespace WikiCorpus {

BLAKE3Pipeline::Hash BLAKE3Pipeline::hash(const void* data, size_t len) {
    Hash result;

    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    blake3_hasher_update(&hasher, data, len);
    blake3_hasher_finalize(&hasher, result.data(), HASH_SIZE);

    return result;
}

std::string BLAKE3Pipeline::to_hex(const Hash& hash) {
    static constexpr char lut[] = "0123456789abcdef";
    std::string out;
    out.reserve(HASH_SIZE * 2);
    for (uint8_t byte : hash) {
        out.push_back(lut[(byte >> 4) & 0xF]);
        out.push_back(lut[byte & 0xF]);
    }
    return out;
}

} // namespace WikiCorpus
