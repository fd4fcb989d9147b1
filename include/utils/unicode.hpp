#pragma once

#include <string>
#include <cstdint>

namespace WikiCorpus {

/**
 * @brief Append the UTF-8 encoding of a codepoint.
 *
 * Surrogates and values above U+10FFFF are replaced with U+FFFD.
 */
inline void append_utf8(std::string& out, char32_t cp) {
    if ((cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) cp = 0xFFFD;

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/**
 * @brief Whitespace as understood by the markup layer (ASCII only).
 */
inline bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

inline std::string trim(const std::string& s) {
    size_t first = 0;
    while (first < s.size() && is_space(s[first])) ++first;
    size_t last = s.size();
    while (last > first && is_space(s[last - 1])) --last;
    return s.substr(first, last - first);
}

} // namespace WikiCorpus
