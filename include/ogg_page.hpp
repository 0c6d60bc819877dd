//
//  ogg_page.hpp
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

inline constexpr uint8_t kOggFlagContinued = 0x01;
inline constexpr uint8_t kOggFlagBos = 0x02;
inline constexpr uint8_t kOggFlagEos = 0x04;

inline constexpr size_t kOggPageHeaderSize = 27;
inline constexpr size_t kOggMaxSegments = 255;
inline constexpr size_t kOggMaxSegmentSize = 255;
// Padding segments stay below 255 so each one terminates its own packet.
inline constexpr size_t kOggMaxPaddingSegment = 254;
inline constexpr uint64_t kOggNoGranule = ~0ULL;

// Hardware block size; no audio page may cross a multiple of it.
inline constexpr uint64_t kTonieBlockSize = 0x1000;

/// One Ogg page. `segments` holds one chunk per lacing value, so a page parsed from bytes
/// serializes back to the same bytes.
struct OggPage {
    uint8_t version{0};
    uint8_t flags{0};
    uint64_t granule_position{0};
    uint32_t stream_serial{0};
    uint32_t sequence_number{0};
    uint32_t crc32{0};
    std::vector<std::vector<uint8_t>> segments;

    bool continued() const { return (flags & kOggFlagContinued) != 0; }
    bool bos() const { return (flags & kOggFlagBos) != 0; }
    bool eos() const { return (flags & kOggFlagEos) != 0; }
    void set_flag(uint8_t flag, bool on) {
        flags = on ? static_cast<uint8_t>(flags | flag) : static_cast<uint8_t>(flags & ~flag);
    }
};

/// Packets reassembled from a single page.
struct OggPagePackets {
    std::vector<std::vector<uint8_t>> packets;
    bool first_is_continuation{false};  ///< packets.front() is the tail of a previous packet.
    bool last_is_open{false};           ///< packets.back() continues on the next page.
};

/// Parse one page starting at `offset`. On success `page_size` receives the serialized size.
TonieResult<OggPage> parse_ogg_page(const std::vector<uint8_t> &buffer, size_t offset,
                                    size_t &page_size);

/// Parse back-to-back pages covering the whole buffer. An empty buffer yields no pages.
TonieResult<std::vector<OggPage>> parse_ogg_pages(const std::vector<uint8_t> &buffer);

/// Serialize and store the recomputed checksum in `page.crc32`.
std::vector<uint8_t> serialize_ogg_page(OggPage &page);

/// Serialize onto the end of `out`.
void append_ogg_page(std::vector<uint8_t> &out, OggPage &page);

/// Checksum the page would carry if serialized now.
uint32_t compute_ogg_page_crc(const OggPage &page);

size_t ogg_page_size(const OggPage &page);
size_t ogg_payload_size(const OggPage &page);

/// Segment sizes that fill exactly `space` serialized bytes (payload plus lacing entries).
std::vector<size_t> padding_layout(size_t space);

/// Append zero-filled padding so a page placed at `current_file_offset` ends exactly on the
/// next `boundary`. Returns the number of segments added.
size_t pad_to_boundary(OggPage &page, uint64_t current_file_offset,
                       uint64_t boundary = kTonieBlockSize);

/**
 * @brief Remove trailing zero-filled standalone segments. Returns the number removed.
 *
 * Padding is recognized by shape only: a trailing all-zero packet of at most 254 bytes after
 * the first packet is dropped even if an encoder produced it. Packets carrying a TOC byte
 * other than zero are never touched.
 */
size_t strip_padding(OggPage &page);

/// True for an all-zero packet of at most 254 bytes, the shape padding takes.
bool is_padding_packet(const std::vector<uint8_t> &packet);

OggPagePackets packets_of(const OggPage &page);

/// Number of lacing values a packet of `packet_size` bytes needs.
inline size_t lacing_entries(size_t packet_size) { return packet_size / kOggMaxSegmentSize + 1; }

/// Lace a complete packet onto the end of the page.
void append_packet(OggPage &page, const std::vector<uint8_t> &packet);

/// Build a page from complete packets.
OggPage page_from_packets(const std::vector<std::vector<uint8_t>> &packets,
                          uint32_t stream_serial, uint32_t sequence_number,
                          uint64_t granule_position, uint8_t flags = 0);

}  // namespace tonieforge
