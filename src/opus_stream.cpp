//
//  opus_stream.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "opus_stream.hpp"

#include <opus/opus.h>

#include <algorithm>
#include <cctype>
#include <cstring>

#include "byte_io.hpp"
#include "logging.hpp"

namespace tonieforge {

namespace {

constexpr char kOpusHeadMagic[] = "OpusHead";
constexpr char kOpusTagsMagic[] = "OpusTags";
constexpr size_t kMagicSize = 8;
constexpr size_t kOpusHeadSize = 19;
constexpr char kPadKey[] = "pad=";
constexpr size_t kPadKeySize = 4;

bool has_magic(const std::vector<uint8_t> &packet, const char *magic) {
    return packet.size() >= kMagicSize && std::memcmp(packet.data(), magic, kMagicSize) == 0;
}

bool is_pad_comment(const std::string &comment) {
    if (comment.size() < kPadKeySize) {
        return false;
    }
    std::string key = comment.substr(0, kPadKeySize);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return key == kPadKey;
}

// Serialized size of a page carrying one packet of `packet_size` bytes.
size_t single_packet_page_size(size_t packet_size) {
    return kOggPageHeaderSize + lacing_entries(packet_size) + packet_size;
}

}  // namespace

bool is_opus_head(const std::vector<uint8_t> &packet) { return has_magic(packet, kOpusHeadMagic); }

bool is_opus_tags(const std::vector<uint8_t> &packet) { return has_magic(packet, kOpusTagsMagic); }

bool is_preamble_page(const OggPage &page) {
    if (page.segments.empty() || page.continued()) {
        return false;
    }
    const auto &first = page.segments.front();
    return is_opus_head(first) || is_opus_tags(first);
}

// -----------------------------------------------------------------------------
// OpusHead
// -----------------------------------------------------------------------------
std::vector<uint8_t> build_opus_head(const OpusHeadInfo &head) {
    std::vector<uint8_t> p;
    p.reserve(kOpusHeadSize + head.mapping_table.size());
    p.insert(p.end(), kOpusHeadMagic, kOpusHeadMagic + kMagicSize);
    write_u8(p, head.version);
    write_u8(p, head.channels);
    write_u16_le(p, head.pre_skip);
    write_u32_le(p, head.input_sample_rate);
    write_u16_le(p, static_cast<uint16_t>(head.output_gain));
    write_u8(p, head.mapping_family);
    if (head.mapping_family != 0) {
        p.insert(p.end(), head.mapping_table.begin(), head.mapping_table.end());
    }
    return p;
}

std::optional<OpusHeadInfo> parse_opus_head(const std::vector<uint8_t> &packet) {
    if (!is_opus_head(packet) || packet.size() < kOpusHeadSize) {
        return std::nullopt;
    }
    const uint8_t *p = packet.data();
    OpusHeadInfo head;
    head.version = p[8];
    head.channels = p[9];
    head.pre_skip = read_u16_le(p + 10);
    head.input_sample_rate = read_u32_le(p + 12);
    head.output_gain = static_cast<int16_t>(read_u16_le(p + 16));
    head.mapping_family = p[18];
    if (head.mapping_family != 0) {
        head.mapping_table.assign(packet.begin() + kOpusHeadSize, packet.end());
    }
    return head;
}

// -----------------------------------------------------------------------------
// OpusTags
// -----------------------------------------------------------------------------
std::vector<uint8_t> build_opus_tags(const OpusTagsInfo &tags) {
    std::vector<uint8_t> p;
    p.insert(p.end(), kOpusTagsMagic, kOpusTagsMagic + kMagicSize);
    write_u32_le(p, static_cast<uint32_t>(tags.vendor.size()));
    write_string(p, tags.vendor);
    write_u32_le(p, static_cast<uint32_t>(tags.comments.size()));
    for (const auto &comment : tags.comments) {
        write_u32_le(p, static_cast<uint32_t>(comment.size()));
        write_string(p, comment);
    }
    return p;
}

std::optional<OpusTagsInfo> parse_opus_tags(const std::vector<uint8_t> &packet) {
    if (!is_opus_tags(packet)) {
        return std::nullopt;
    }
    size_t pos = kMagicSize;
    auto read_string = [&](std::string &out) {
        if (pos + 4 > packet.size()) {
            return false;
        }
        const uint32_t len = read_u32_le(packet.data() + pos);
        pos += 4;
        if (len > packet.size() - pos) {
            return false;
        }
        out.assign(packet.begin() + pos, packet.begin() + pos + len);
        pos += len;
        return true;
    };

    OpusTagsInfo tags;
    if (!read_string(tags.vendor) || pos + 4 > packet.size()) {
        return std::nullopt;
    }
    const uint32_t count = read_u32_le(packet.data() + pos);
    pos += 4;
    for (uint32_t i = 0; i < count; ++i) {
        std::string comment;
        if (!read_string(comment)) {
            return std::nullopt;
        }
        tags.comments.push_back(std::move(comment));
    }
    return tags;
}

OpusTagsInfo default_opus_tags() {
    OpusTagsInfo tags;
    tags.vendor = opus_get_version_string();
    tags.comments.push_back("encoder=TonieForge");
    return tags;
}

std::optional<OpusPreamble> find_opus_preamble(const std::vector<OggPage> &pages) {
    std::optional<OpusHeadInfo> head;
    std::optional<OpusTagsInfo> tags;
    for (const auto &page : pages) {
        if (!is_preamble_page(page)) {
            break;
        }
        // An OpusTags packet continued onto a later page is not picked up.
        const auto packets = packets_of(page);
        if (packets.packets.empty()) {
            continue;
        }
        const auto &packet = packets.packets.front();
        if (!head && is_opus_head(packet)) {
            head = parse_opus_head(packet);
        } else if (!tags && is_opus_tags(packet) && !packets.last_is_open) {
            tags = parse_opus_tags(packet);
        }
    }
    if (!head || !tags) {
        return std::nullopt;
    }
    return OpusPreamble{*head, *tags};
}

// -----------------------------------------------------------------------------
// Preamble fitting
// -----------------------------------------------------------------------------
TonieResult<std::vector<OggPage>> build_preamble_pages(const OpusPreamble &preamble,
                                                       uint32_t stream_serial,
                                                       size_t total_size) {
    OpusTagsInfo tags = preamble.tags;
    tags.comments.erase(std::remove_if(tags.comments.begin(), tags.comments.end(), is_pad_comment),
                        tags.comments.end());

    const auto head_packet = build_opus_head(preamble.head);
    std::vector<OggPage> pages;
    pages.push_back(page_from_packets({head_packet}, stream_serial, 0, 0, kOggFlagBos));

    if (total_size == 0) {
        pages.push_back(page_from_packets({build_opus_tags(tags)}, stream_serial, 1, 0));
        return pages;
    }

    const size_t head_page = single_packet_page_size(head_packet.size());
    const size_t base_tags = build_opus_tags(tags).size();
    // A pad comment costs its 4-byte length, the key and the filler.
    const size_t min_tags = base_tags + 4 + kPadKeySize;
    if (head_page + single_packet_page_size(min_tags) > total_size) {
        TF_LOG("error", "Opus comments do not fit into a " << total_size << "-byte preamble");
        return make_error(ErrorKind::InvalidArgument,
                          "Opus comments do not fit into the preamble");
    }

    // Largest tags packet whose page lands exactly on total_size.
    size_t tags_size = total_size - head_page - kOggPageHeaderSize;
    while (tags_size >= min_tags &&
           head_page + single_packet_page_size(tags_size) > total_size) {
        --tags_size;
    }
    if (tags_size < min_tags || head_page + single_packet_page_size(tags_size) != total_size) {
        TF_LOG("error", "no OpusTags size fills a " << total_size << "-byte preamble");
        return make_error(ErrorKind::InvalidArgument,
                          "preamble size " + std::to_string(total_size) + " cannot be filled");
    }

    tags.comments.push_back(std::string(kPadKey) + std::string(tags_size - min_tags, '0'));
    const auto tags_packet = build_opus_tags(tags);
    TF_ENSURE(tags_packet.size() == tags_size,
              "OpusTags packet is " << tags_packet.size() << " bytes, expected " << tags_size);
    pages.push_back(page_from_packets({tags_packet}, stream_serial, 1, 0));

    TF_LOG("ogg", "built " << total_size << "-byte preamble, pre-skip "
                           << preamble.head.pre_skip << ", " << tags.comments.size()
                           << " comments");
    return pages;
}

// -----------------------------------------------------------------------------
// Sample counting
// -----------------------------------------------------------------------------
uint32_t opus_packet_samples(const std::vector<uint8_t> &packet) {
    if (packet.empty()) {
        return 0;
    }
    const int n = opus_packet_get_nb_samples(packet.data(), static_cast<opus_int32>(packet.size()),
                                             static_cast<opus_int32>(kOpusSampleRate));
    return n > 0 ? static_cast<uint32_t>(n) : 0;
}

uint64_t page_completed_samples(const OggPage &page) {
    const auto split = packets_of(page);
    uint64_t samples = 0;
    for (size_t i = 0; i < split.packets.size(); ++i) {
        // The TOC of a continued packet lives on the previous page.
        if (i == 0 && split.first_is_continuation) {
            continue;
        }
        if (i + 1 == split.packets.size() && split.last_is_open) {
            continue;
        }
        if (is_padding_packet(split.packets[i])) {
            continue;
        }
        samples += opus_packet_samples(split.packets[i]);
    }
    return samples;
}

}  // namespace tonieforge
