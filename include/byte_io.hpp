//
//  byte_io.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tonieforge {

// ------------- Helper write functions ---------------------------------------
// Ogg and Opus fields are little-endian; the container length prefix is big-endian.

inline void write_u8(std::vector<uint8_t> &p, uint8_t v) { p.push_back(v); }

inline void write_u16_le(std::vector<uint8_t> &p, uint16_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
}

inline void write_u32_le(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back(v & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 24) & 0xFF);
}

inline void write_u64_le(std::vector<uint8_t> &p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p.push_back((v >> (8 * i)) & 0xFF);
    }
}

inline void write_u32_be(std::vector<uint8_t> &p, uint32_t v) {
    p.push_back((v >> 24) & 0xFF);
    p.push_back((v >> 16) & 0xFF);
    p.push_back((v >> 8) & 0xFF);
    p.push_back(v & 0xFF);
}

inline void write_string(std::vector<uint8_t> &p, const std::string &s) {
    p.insert(p.end(), s.begin(), s.end());
}

// Base-128 varint as used by the header's tagged-field encoding.
inline void write_varint(std::vector<uint8_t> &p, uint64_t v) {
    while (v >= 0x80) {
        p.push_back(static_cast<uint8_t>(v | 0x80));
        v >>= 7;
    }
    p.push_back(static_cast<uint8_t>(v));
}

inline size_t varint_size(uint64_t v) {
    size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        ++n;
    }
    return n;
}

// ------------- Helper read functions (caller checks bounds) -----------------

inline uint16_t read_u16_le(const uint8_t *p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

inline uint32_t read_u32_le(const uint8_t *p) {
    return uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) |
           (uint32_t(p[3]) << 24);
}

inline uint64_t read_u64_le(const uint8_t *p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

inline uint32_t read_u32_be(const uint8_t *p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) |
           uint32_t(p[3]);
}

// Read a varint at `pos`, advancing it. Returns nullopt on truncation or overlong encoding.
inline std::optional<uint64_t> read_varint(const std::vector<uint8_t> &buf, size_t &pos,
                                           size_t end) {
    uint64_t v = 0;
    for (int shift = 0; shift < 64; shift += 7) {
        if (pos >= end) {
            return std::nullopt;
        }
        uint8_t b = buf[pos++];
        v |= uint64_t(b & 0x7F) << shift;
        if ((b & 0x80) == 0) {
            return v;
        }
    }
    return std::nullopt;
}

}  // namespace tonieforge
