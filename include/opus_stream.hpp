//
//  opus_stream.hpp
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

#include "ogg_page.hpp"
#include "tonie_status.hpp"

namespace tonieforge {

inline constexpr uint32_t kOpusSampleRate = 48000;
inline constexpr int kOpusChannels = 2;
// OpusHead + OpusTags pages together.
inline constexpr size_t kOpusPreambleSize = 0x200;
// libopus encoder delay at 48 kHz; used when no OpusHead is available.
inline constexpr uint16_t kDefaultPreSkip = 312;

/// OpusHead identification header (RFC 7845 section 5.1).
struct OpusHeadInfo {
    uint8_t version{1};
    uint8_t channels{kOpusChannels};
    uint16_t pre_skip{0};
    uint32_t input_sample_rate{kOpusSampleRate};
    int16_t output_gain{0};
    uint8_t mapping_family{0};
    std::vector<uint8_t> mapping_table;  ///< Present only for mapping_family != 0.
};

/// OpusTags comment header: vendor string plus "KEY=value" comments.
struct OpusTagsInfo {
    std::string vendor;
    std::vector<std::string> comments;
};

struct OpusPreamble {
    OpusHeadInfo head;
    OpusTagsInfo tags;
};

bool is_opus_head(const std::vector<uint8_t> &packet);
bool is_opus_tags(const std::vector<uint8_t> &packet);

/// True for pages whose first segment starts an OpusHead or OpusTags packet.
bool is_preamble_page(const OggPage &page);

std::vector<uint8_t> build_opus_head(const OpusHeadInfo &head);
std::optional<OpusHeadInfo> parse_opus_head(const std::vector<uint8_t> &packet);

std::vector<uint8_t> build_opus_tags(const OpusTagsInfo &tags);
std::optional<OpusTagsInfo> parse_opus_tags(const std::vector<uint8_t> &packet);

OpusTagsInfo default_opus_tags();

/// Locate OpusHead and OpusTags among the leading pages.
std::optional<OpusPreamble> find_opus_preamble(const std::vector<OggPage> &pages);

/**
 * @brief Build the OpusHead page (sequence 0, BOS) and the OpusTags page (sequence 1).
 *
 * Existing `pad=` comments are dropped. With a non-zero `total_size` a fresh `pad=000...`
 * comment is fitted so both pages together serialize to exactly `total_size` bytes; fails
 * with `InvalidArgument` when the comments leave no room for that.
 */
TonieResult<std::vector<OggPage>> build_preamble_pages(const OpusPreamble &preamble,
                                                       uint32_t stream_serial,
                                                       size_t total_size = kOpusPreambleSize);

/// Samples at 48 kHz described by the packet's TOC; 0 for an invalid packet.
uint32_t opus_packet_samples(const std::vector<uint8_t> &packet);

/// Samples of the real (non-padding) packets that complete on the page.
uint64_t page_completed_samples(const OggPage &page);

}  // namespace tonieforge
