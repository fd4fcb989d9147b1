#pragma once

#include <cstdint>
#include <cstring>
#include <endian.h>
#include <string>
#include <vector>
#include <utils/errors.hpp>

namespace WikiCorpus {

// Shared formatting utilities for the storage layer.

inline constexpr char k_hex_lut[] = "0123456789abcdef";

// Encode a float vector as a bytea hex literal (\x...), little-endian float32
inline std::string floats_to_bytea_hex(const std::vector<float>& values) {
    std::string out;
    out.resize(2 + values.size() * 8);
    out[0] = '\\';
    out[1] = 'x';
    char* p = &out[2];
    for (float f : values) {
        uint32_t bits;
        std::memcpy(&bits, &f, sizeof(bits));
        bits = htole32(bits);
        unsigned char bytes[4];
        std::memcpy(bytes, &bits, sizeof(bytes));
        for (unsigned char b : bytes) {
            *p++ = k_hex_lut[(b >> 4) & 0xF];
            *p++ = k_hex_lut[b & 0xF];
        }
    }
    return out;
}

inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decode the text form of a bytea column (\x...) written by floats_to_bytea_hex
inline std::vector<float> bytea_hex_to_floats(const std::string& text) {
    if (text.size() < 2 || text[0] != '\\' || text[1] != 'x') {
        throw StoreError("Expected hex bytea, got '" + text.substr(0, 16) + "'");
    }
    size_t nbytes = (text.size() - 2) / 2;
    if ((text.size() - 2) % 2 != 0 || nbytes % 4 != 0) {
        throw StoreError("Stored vector has a length that is not a multiple of 4 bytes");
    }

    std::vector<float> out(nbytes / 4);
    const char* p = text.data() + 2;
    for (size_t i = 0; i < out.size(); ++i) {
        unsigned char bytes[4];
        for (unsigned char& b : bytes) {
            int hi = hex_value(*p++);
            int lo = hex_value(*p++);
            if (hi < 0 || lo < 0) throw StoreError("Invalid hex digit in stored vector");
            b = static_cast<unsigned char>((hi << 4) | lo);
        }
        uint32_t bits;
        std::memcpy(&bits, bytes, sizeof(bits));
        bits = le32toh(bits);
        std::memcpy(&out[i], &bits, sizeof(float));
    }
    return out;
}

// Text form of a BOOLEAN parameter
inline std::string bool_literal(bool value) {
    return value ? "true" : "false";
}

} // namespace WikiCorpus
