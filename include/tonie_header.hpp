//
//  tonie_header.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "tonie_status.hpp"

namespace tonieforge {

inline constexpr size_t kHeaderRegionSize = 0x1000;
// Declared length of the tagged-field message following the 4-byte prefix.
inline constexpr uint32_t kHeaderPayloadSize = 0xFFC;
inline constexpr size_t kHashSize = 20;

/// Container metadata stored in the first 4096 bytes of a Tonie file.
struct TonieHeader {
    std::vector<uint8_t> hash;             ///< SHA1 of the audio region.
    int32_t audio_length{0};               ///< Byte length of the audio region.
    uint32_t audio_id{0};                  ///< Equals the Ogg stream serial.
    std::vector<uint32_t> audio_chapters;  ///< First page sequence number of each track.
    std::vector<uint8_t> padding;          ///< Filler; rebuilt on every encode.
};

/**
 * @brief Serialize a header region of exactly 0x1000 bytes.
 *
 * Layout: big-endian 0x00000FFC, then fields 1 hash, 2 audio_length, 3 audio_id,
 * 4 audio_chapters (packed) and 5 padding sized so the message is exactly 0xFFC bytes.
 */
TonieResult<std::vector<uint8_t>> encode_tonie_header(const std::vector<uint8_t> &hash,
                                                      int32_t audio_length, uint32_t audio_id,
                                                      const std::vector<uint32_t> &chapters);

TonieResult<std::vector<uint8_t>> encode_tonie_header(const TonieHeader &header);

/// Parse the header region. Unknown fields are skipped; chapters may be packed or not.
TonieResult<TonieHeader> decode_tonie_header(const std::vector<uint8_t> &bytes);

}  // namespace tonieforge
