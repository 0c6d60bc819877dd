//
//  sha1.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tonieforge {

// SHA-1 digest (20 bytes) of the given bytes.
std::vector<uint8_t> sha1(const uint8_t *data, size_t len);

inline std::vector<uint8_t> sha1(const std::vector<uint8_t> &data) {
    return sha1(data.data(), data.size());
}

// Lowercase hex rendering, e.g. for logs and JSON output.
std::string to_hex(const std::vector<uint8_t> &bytes);

}  // namespace tonieforge
