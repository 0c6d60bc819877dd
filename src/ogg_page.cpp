//
//  ogg_page.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "ogg_page.hpp"

#include <ogg/ogg.h>

#include <algorithm>
#include <cstring>

#include "byte_io.hpp"
#include "logging.hpp"

namespace tonieforge {

namespace {

constexpr uint8_t kCapturePattern[4] = {'O', 'g', 'g', 'S'};
constexpr size_t kCrcFieldOffset = 22;
// Largest page libogg can frame: full header, 255 lacing values, 255 * 255 payload bytes.
constexpr size_t kOggMaxPageSize = kOggPageHeaderSize + kOggMaxSegments +
                                   kOggMaxSegments * kOggMaxSegmentSize;

// Owns a libogg sync state fed with one contiguous window of bytes.
class OggSync {
   public:
    OggSync(const uint8_t *data, size_t size) {
        ogg_sync_init(&state_);
        if (size > 0) {
            char *buffer = ogg_sync_buffer(&state_, static_cast<long>(size));
            std::memcpy(buffer, data, size);
            ogg_sync_wrote(&state_, static_cast<long>(size));
        }
    }
    ~OggSync() { ogg_sync_clear(&state_); }
    OggSync(const OggSync &) = delete;
    OggSync &operator=(const OggSync &) = delete;

    /// >0: page of that many bytes; 0: incomplete page; <0: bytes libogg could not frame.
    long next(ogg_page &page) { return ogg_sync_pageseek(&state_, &page); }

   private:
    ogg_sync_state state_;
};

std::vector<uint8_t> header_bytes(const OggPage &page) {
    std::vector<uint8_t> out;
    out.reserve(kOggPageHeaderSize + page.segments.size());
    out.insert(out.end(), kCapturePattern, kCapturePattern + 4);
    write_u8(out, page.version);
    write_u8(out, page.flags);
    write_u64_le(out, page.granule_position);
    write_u32_le(out, page.stream_serial);
    write_u32_le(out, page.sequence_number);
    write_u32_le(out, 0);
    write_u8(out, static_cast<uint8_t>(page.segments.size()));
    for (const auto &seg : page.segments) {
        write_u8(out, static_cast<uint8_t>(seg.size()));
    }
    return out;
}

std::vector<uint8_t> body_bytes(const OggPage &page) {
    std::vector<uint8_t> out;
    out.reserve(ogg_payload_size(page));
    for (const auto &seg : page.segments) {
        TF_ENSURE(seg.size() <= kOggMaxSegmentSize, "segment of " << seg.size() << " bytes");
        out.insert(out.end(), seg.begin(), seg.end());
    }
    return out;
}

// Let libogg checksum the header and body in place; returns the stored CRC.
uint32_t set_checksum(std::vector<uint8_t> &header, std::vector<uint8_t> &body) {
    ogg_page og{};
    og.header = header.data();
    og.header_len = static_cast<long>(header.size());
    og.body = body.data();
    og.body_len = static_cast<long>(body.size());
    ogg_page_checksum_set(&og);
    return read_u32_le(header.data() + kCrcFieldOffset);
}

OggPage from_libogg(const ogg_page &og) {
    OggPage page;
    page.version = static_cast<uint8_t>(ogg_page_version(&og));
    page.flags = og.header[5];
    page.granule_position = static_cast<uint64_t>(ogg_page_granulepos(&og));
    page.stream_serial = static_cast<uint32_t>(ogg_page_serialno(&og));
    page.sequence_number = static_cast<uint32_t>(ogg_page_pageno(&og));
    page.crc32 = read_u32_le(og.header + kCrcFieldOffset);
    const size_t segment_count = og.header[26];
    page.segments.reserve(segment_count);
    const uint8_t *body = og.body;
    for (size_t i = 0; i < segment_count; ++i) {
        const size_t n = og.header[kOggPageHeaderSize + i];
        page.segments.emplace_back(body, body + n);
        body += n;
    }
    return page;
}

// Header checks libogg does not report precisely; the framing itself is left to libogg.
TonieStatus check_page_start(const std::vector<uint8_t> &buffer, size_t offset) {
    if (offset + kOggPageHeaderSize > buffer.size()) {
        TF_LOG("error", "truncated Ogg page header at offset " << offset);
        return make_error(ErrorKind::Format,
                          "truncated Ogg page header at offset " + std::to_string(offset));
    }
    const uint8_t *p = buffer.data() + offset;
    if (!std::equal(kCapturePattern, kCapturePattern + 4, p)) {
        const std::vector<uint8_t> found(p, p + 4);
        TF_LOG("error", "missing OggS capture pattern at offset " << offset << " (found "
                                                                   << hex_prefix(found) << ")");
        return make_error(ErrorKind::Format,
                          "missing OggS capture pattern at offset " + std::to_string(offset));
    }
    if (p[4] != 0) {
        TF_LOG("error", "unsupported Ogg stream version " << int(p[4]) << " at offset "
                                                          << offset);
        return make_error(ErrorKind::Format,
                          "unsupported Ogg stream version " + std::to_string(p[4]));
    }
    return make_ok();
}

// Turn a libogg pageseek result at `offset` into a page or a Format error.
TonieResult<OggPage> take_page(const std::vector<uint8_t> &buffer, size_t offset, long seek,
                               const ogg_page &og, size_t &page_size) {
    if (seek == 0) {
        const size_t segment_count = buffer[offset + 26];
        if (offset + kOggPageHeaderSize + segment_count > buffer.size()) {
            TF_LOG("error", "truncated segment table at offset " << offset);
            return make_error(ErrorKind::Format,
                              "truncated segment table at offset " + std::to_string(offset));
        }
        TF_LOG("error", "segment table at offset " << offset << " claims more bytes than the "
                                                   << (buffer.size() - offset) << " remaining");
        return make_error(ErrorKind::Format, "segment table claims more bytes than remain at "
                                             "offset " + std::to_string(offset));
    }
    if (seek < 0) {
        TF_LOG("error", "Ogg page at offset " << offset << " fails its checksum");
        return make_error(ErrorKind::Format,
                          "Ogg page checksum mismatch at offset " + std::to_string(offset));
    }
    page_size = static_cast<size_t>(seek);
    return from_libogg(og);
}

}  // namespace

// -----------------------------------------------------------------------------
// Parsing
// -----------------------------------------------------------------------------
TonieResult<OggPage> parse_ogg_page(const std::vector<uint8_t> &buffer, size_t offset,
                                    size_t &page_size) {
    auto start = check_page_start(buffer, offset);
    if (!start.ok) {
        return start;
    }
    // Hand libogg no more than the page its lacing table describes.
    size_t window = std::min(buffer.size() - offset, kOggMaxPageSize);
    const size_t segment_count = buffer[offset + 26];
    if (offset + kOggPageHeaderSize + segment_count <= buffer.size()) {
        const uint8_t *lacing = buffer.data() + offset + kOggPageHeaderSize;
        size_t framed = kOggPageHeaderSize + segment_count;
        for (size_t i = 0; i < segment_count; ++i) {
            framed += lacing[i];
        }
        window = std::min(window, framed);
    }
    OggSync sync(buffer.data() + offset, window);
    ogg_page og{};
    const long seek = sync.next(og);
    return take_page(buffer, offset, seek, og, page_size);
}

TonieResult<std::vector<OggPage>> parse_ogg_pages(const std::vector<uint8_t> &buffer) {
    std::vector<OggPage> pages;
    OggSync sync(buffer.data(), buffer.size());
    size_t offset = 0;
    while (offset < buffer.size()) {
        auto start = check_page_start(buffer, offset);
        if (!start.ok) {
            return start;
        }
        ogg_page og{};
        const long seek = sync.next(og);
        size_t page_size = 0;
        auto page = take_page(buffer, offset, seek, og, page_size);
        if (!page) {
            return page.status;
        }
        pages.push_back(std::move(*page));
        offset += page_size;
    }
    TF_LOG("ogg", "parsed " << pages.size() << " pages from " << buffer.size() << " bytes");
    return pages;
}

// -----------------------------------------------------------------------------
// Serialization
// -----------------------------------------------------------------------------
uint32_t compute_ogg_page_crc(const OggPage &page) {
    TF_ENSURE(page.segments.size() <= kOggMaxSegments,
              "page " << page.sequence_number << " has " << page.segments.size()
                      << " segments");
    auto header = header_bytes(page);
    auto body = body_bytes(page);
    return set_checksum(header, body);
}

std::vector<uint8_t> serialize_ogg_page(OggPage &page) {
    TF_ENSURE(page.segments.size() <= kOggMaxSegments,
              "page " << page.sequence_number << " has " << page.segments.size()
                      << " segments");
    auto bytes = header_bytes(page);
    auto body = body_bytes(page);
    page.crc32 = set_checksum(bytes, body);
    bytes.insert(bytes.end(), body.begin(), body.end());
    return bytes;
}

void append_ogg_page(std::vector<uint8_t> &out, OggPage &page) {
    auto bytes = serialize_ogg_page(page);
    out.insert(out.end(), bytes.begin(), bytes.end());
}

size_t ogg_payload_size(const OggPage &page) {
    size_t total = 0;
    for (const auto &seg : page.segments) {
        total += seg.size();
    }
    return total;
}

size_t ogg_page_size(const OggPage &page) {
    return kOggPageHeaderSize + page.segments.size() + ogg_payload_size(page);
}

// -----------------------------------------------------------------------------
// Boundary padding
// -----------------------------------------------------------------------------
std::vector<size_t> padding_layout(size_t space) {
    std::vector<size_t> sizes;
    if (space == 0) {
        return sizes;
    }
    auto entries = [](size_t bytes) {
        return (bytes + kOggMaxPaddingSegment - 1) / kOggMaxPaddingSegment;
    };

    // Largest payload whose payload + lacing entries does not exceed the space.
    size_t bytes = space * kOggMaxPaddingSegment / (kOggMaxPaddingSegment + 1);
    while (bytes > 0 && bytes + entries(bytes) > space) {
        --bytes;
    }
    while (bytes + 1 + entries(bytes + 1) <= space) {
        ++bytes;
    }

    size_t count = entries(bytes);
    if (bytes + count == space) {
        while (bytes > 0) {
            size_t n = std::min(bytes, kOggMaxPaddingSegment);
            sizes.push_back(n);
            bytes -= n;
        }
        return sizes;
    }

    // One byte short: add a lacing entry and spread the payload evenly.
    ++count;
    bytes = space - count;
    const size_t base = bytes / count;
    const size_t extra = bytes % count;
    for (size_t i = 0; i < count; ++i) {
        sizes.push_back(base + (i < extra ? 1 : 0));
    }
    return sizes;
}

size_t pad_to_boundary(OggPage &page, uint64_t current_file_offset, uint64_t boundary) {
    TF_ENSURE(boundary > 0, "zero boundary");
    TF_ENSURE(page.segments.empty() || page.segments.back().size() < kOggMaxSegmentSize,
              "page " << page.sequence_number << " ends inside a packet");
    const uint64_t size = ogg_page_size(page);
    const uint64_t room = boundary - (current_file_offset % boundary);
    TF_ENSURE(size <= room, "page " << page.sequence_number << " of " << size
                                    << " bytes at offset " << current_file_offset
                                    << " crosses a " << boundary << "-byte boundary");

    const auto layout = padding_layout(static_cast<size_t>(room - size));
    TF_ENSURE(page.segments.size() + layout.size() <= kOggMaxSegments,
              "padding page " << page.sequence_number << " needs " << layout.size()
                              << " segments, " << page.segments.size() << " in use");
    for (size_t n : layout) {
        page.segments.emplace_back(n, 0);
    }
    if (!layout.empty()) {
        TF_LOG("ogg", "padded page " << page.sequence_number << " with " << layout.size()
                                     << " segments (" << (room - size) << " bytes)");
    }
    return layout.size();
}

bool is_padding_packet(const std::vector<uint8_t> &packet) {
    return packet.size() <= kOggMaxPaddingSegment &&
           std::all_of(packet.begin(), packet.end(), [](uint8_t b) { return b == 0; });
}

size_t strip_padding(OggPage &page) {
    size_t removed = 0;
    while (page.segments.size() > 1) {
        const auto &last = page.segments.back();
        const auto &prev = page.segments[page.segments.size() - 2];
        // A segment after a 255-byte one belongs to that packet.
        if (prev.size() == kOggMaxSegmentSize || !is_padding_packet(last)) {
            break;
        }
        page.segments.pop_back();
        ++removed;
    }
    return removed;
}

// -----------------------------------------------------------------------------
// Packets
// -----------------------------------------------------------------------------
OggPagePackets packets_of(const OggPage &page) {
    OggPagePackets result;
    result.first_is_continuation = page.continued();
    std::vector<uint8_t> current;
    bool open = false;
    for (const auto &seg : page.segments) {
        current.insert(current.end(), seg.begin(), seg.end());
        open = true;
        if (seg.size() < kOggMaxSegmentSize) {
            result.packets.push_back(std::move(current));
            current.clear();
            open = false;
        }
    }
    if (open) {
        result.packets.push_back(std::move(current));
        result.last_is_open = true;
    }
    return result;
}

void append_packet(OggPage &page, const std::vector<uint8_t> &packet) {
    size_t pos = 0;
    for (;;) {
        const size_t n = std::min(kOggMaxSegmentSize, packet.size() - pos);
        page.segments.emplace_back(packet.begin() + pos, packet.begin() + pos + n);
        pos += n;
        if (n < kOggMaxSegmentSize) {
            break;
        }
    }
    TF_ENSURE(page.segments.size() <= kOggMaxSegments,
              "page " << page.sequence_number << " overflows its segment table");
}

OggPage page_from_packets(const std::vector<std::vector<uint8_t>> &packets,
                          uint32_t stream_serial, uint32_t sequence_number,
                          uint64_t granule_position, uint8_t flags) {
    OggPage page;
    page.flags = flags;
    page.stream_serial = stream_serial;
    page.sequence_number = sequence_number;
    page.granule_position = granule_position;
    for (const auto &packet : packets) {
        append_packet(page, packet);
    }
    return page;
}

}  // namespace tonieforge
