//
//  file_io.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "tonie_status.hpp"

namespace tonieforge {

/// Read up to `max_bytes` from the start of a file. Fails with `Io`.
TonieResult<std::vector<uint8_t>> read_file(
    const std::string &path, size_t max_bytes = std::numeric_limits<size_t>::max());

/// Size of a file in bytes. Fails with `Io`.
TonieResult<uint64_t> file_size(const std::string &path);

/**
 * @brief Replace `path` with `data` atomically.
 *
 * Writes a sibling temporary file, flushes it and renames it over `path`. On any failure
 * the temporary is removed and a previous file at `path` is left untouched.
 */
TonieStatus write_file_atomic(const std::string &path, const std::vector<uint8_t> &data);

}  // namespace tonieforge
