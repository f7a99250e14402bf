#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace board {

// =============================================================================
// UTF-8 Decoding
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        if ((c1 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (c1 & 0x3F);
    }

    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 3;
        return ((c0 & 0x0F) << 12) | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
    }

    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n) {
        const unsigned char c1 = static_cast<unsigned char>(content[pos + 1]);
        const unsigned char c2 = static_cast<unsigned char>(content[pos + 2]);
        const unsigned char c3 = static_cast<unsigned char>(content[pos + 3]);
        if ((c1 & 0xC0) != 0x80 || (c2 & 0xC0) != 0x80 || (c3 & 0xC0) != 0x80) {
            byteLen = 1;
            return 0xFFFD;
        }
        byteLen = 4;
        return ((c0 & 0x07) << 18) | ((c1 & 0x3F) << 12) | ((c2 & 0x3F) << 6) | (c3 & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

/**
 * Split UTF-8 content into one string per code point. Invalid bytes become
 * single-byte entries so that concatenating the result reproduces the input.
 */
inline std::vector<std::string_view> splitCodepoints(std::string_view content) {
    std::vector<std::string_view> out;
    out.reserve(content.size());
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        out.push_back(content.substr(pos, byteLen));
        pos += byteLen;
    }
    return out;
}

inline std::size_t codepointCount(std::string_view content) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t byteLen = 0;
        decodeUtf8Codepoint(content, pos, byteLen);
        if (byteLen == 0) break;
        pos += byteLen;
        ++count;
    }
    return count;
}

// Splits on every occurrence of `sep`; empty fields are kept.
inline std::vector<std::string_view> splitOn(std::string_view content, char sep) {
    std::vector<std::string_view> out;
    std::size_t start = 0;
    while (true) {
        const std::size_t idx = content.find(sep, start);
        if (idx == std::string_view::npos) {
            out.push_back(content.substr(start));
            break;
        }
        out.push_back(content.substr(start, idx - start));
        start = idx + 1;
    }
    return out;
}

inline bool isBlank(std::string_view content) {
    for (const char c : content) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') return false;
    }
    return true;
}

// =============================================================================
// Hash (FNV-1a)
// =============================================================================

constexpr std::uint64_t kHashOffset = 14695981039346656037ull;
constexpr std::uint64_t kHashPrime = 1099511628211ull;

inline std::uint64_t hashString(std::string_view s) {
    std::uint64_t h = kHashOffset;
    for (const char c : s) {
        h ^= static_cast<unsigned char>(c);
        h *= kHashPrime;
    }
    return h;
}

} // namespace board
