//
//  lossless_splicer.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "encode_callback.hpp"
#include "ogg_page.hpp"
#include "tonie_encoder.hpp"
#include "tonie_header.hpp"
#include "tonie_status.hpp"
#include "track_source.hpp"

namespace tonieforge {

/// Output of combine_tracks_lossless: audio region, its SHA1 and the chapter markers.
using CombinedAudio = EncodedAudio;

/**
 * @brief Slice an audio region into per-chapter byte ranges at chapter page boundaries.
 *
 * Chapter 0 starts at page 0 and therefore carries the Opus preamble. Without chapters the
 * whole region is one chapter. A marker that names no page fails with `Format`.
 */
TonieResult<std::vector<std::vector<uint8_t>>> extract_raw_chapter_data(
    const TonieHeader &header, const std::vector<uint8_t> &audio);

/**
 * @brief Rewrite the stream serial of every page and recompute the checksums.
 *
 * With `reset_granule` the data pages are re-based so the chapter's audio starts at zero;
 * preamble pages and pages without a granule are left alone. Segment bytes never change.
 */
TonieResult<std::vector<uint8_t>> update_stream_serial_number(const std::vector<uint8_t> &raw,
                                                              uint32_t new_serial,
                                                              bool reset_granule);

/// Granule position just before the first data page's audio, derived from packet TOCs.
std::optional<uint64_t> granule_base(const std::vector<OggPage> &pages);

/**
 * @brief Concatenate already-encoded buffers into one Tonie audio region without decoding.
 *
 * The preamble comes from the first buffer carrying OpusHead and OpusTags (a default one is
 * built otherwise) and is refitted to 0x200 bytes. Data pages are renumbered from 2, their
 * granules made cumulative and re-padded to 4096-byte blocks; a page that no longer fits its
 * block is split between packets. Exactly the first page carries BOS and the last EOS.
 */
TonieResult<CombinedAudio> combine_tracks_lossless(
    const std::vector<std::vector<uint8_t>> &buffers, uint32_t audio_id,
    EncodeCallback *callback = nullptr, FailurePolicy policy = FailurePolicy::Abort);

/**
 * @brief Build an audio region from a mix of reused chapters and new files.
 *
 * Raw chapters are re-serialized with `audio_id`, new files are encoded as one-track streams
 * with the same id, then everything is combined losslessly. When every source is a new file
 * the regular encoder runs directly so the result stays gapless.
 */
TonieResult<CombinedAudio> encode_hybrid(const std::vector<TrackSource> &sources,
                                         uint32_t audio_id, const EncodeOptions &options,
                                         EncodeCallback *callback = nullptr);

}  // namespace tonieforge
