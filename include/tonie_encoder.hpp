//
//  tonie_encoder.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "audio_id.hpp"
#include "audio_source.hpp"
#include "encode_callback.hpp"
#include "tonie_status.hpp"

namespace tonieforge {

// Hard ceiling on the audio stream; a warning is raised at half of it.
inline constexpr uint64_t kMaxAudioSize = 0x77359400;

/// What to do when a single source track cannot be decoded or encoded.
enum class FailurePolicy {
    Abort,  ///< Fail the whole run.
    Skip,   ///< Drop the track; it contributes no chapter.
};

struct EncodeOptions {
    int bitrate_kbps = 96;
    bool vbr = false;
    FailurePolicy on_track_failure = FailurePolicy::Abort;
    /// When set, `<prefix_directory>/NNNN.wav` (1-based track number) is prepended to each track.
    std::string prefix_directory;
    /// Used when the audio id passed in is 0.
    bool custom_audio_id = false;

    DecoderFactory decoder_factory;        ///< Defaults to default_decoder_factory().
    std::shared_ptr<Resampler> resampler;  ///< Defaults to SoxrResampler.
    AudioIdGenerator *id_generator = nullptr;  ///< Defaults to AudioIdGenerator::shared().
};

/// A finished audio region plus the values its header is built from.
struct EncodedAudio {
    std::vector<uint8_t> audio;
    std::vector<uint8_t> hash;
    std::vector<uint32_t> chapters;
    uint32_t audio_id = 0;
};

/// Draw an id from the options' generator when `audio_id` is 0.
uint32_t resolve_audio_id(uint32_t audio_id, const EncodeOptions &options);

/**
 * @brief Encode source files into one continuous Opus stream with Tonie page layout.
 *
 * Each file becomes a chapter starting on a fresh page. Every page after the 0x200-byte
 * preamble ends on a 4096-byte boundary and carries `stream_serial == audio_id`.
 */
TonieResult<EncodedAudio> encode_tracks(const std::vector<std::string> &files, uint32_t audio_id,
                                        const EncodeOptions &options,
                                        EncodeCallback *callback = nullptr);

}  // namespace tonieforge
