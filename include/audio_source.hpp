//
//  audio_source.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "tonie_status.hpp"

namespace tonieforge {

/// Interleaved signed 16-bit PCM.
struct PcmBuffer {
    std::vector<int16_t> samples;
    uint32_t sample_rate = 0;
    uint16_t channels = 0;

    size_t frames() const { return channels == 0 ? 0 : samples.size() / channels; }
};

/// Decodes one source file to PCM.
class AudioDecoder {
   public:
    virtual ~AudioDecoder() = default;
    virtual TonieResult<PcmBuffer> decode(const std::string &path) = 0;
};

/// Converts PCM to another sample rate and channel count.
class Resampler {
   public:
    virtual ~Resampler() = default;
    virtual TonieResult<PcmBuffer> convert(const PcmBuffer &input, uint32_t sample_rate,
                                           uint16_t channels) = 0;
};

/// Picks a decoder for a path; returns nullptr when the format is not supported.
using DecoderFactory = std::function<std::unique_ptr<AudioDecoder>(const std::string &path)>;

/// Maps `.wav` to WavDecoder.
DecoderFactory default_decoder_factory();

/// Change the channel count: mono is duplicated, a mono target averages, otherwise channels
/// are dropped from the end or the last one is repeated.
PcmBuffer remix_channels(const PcmBuffer &input, uint16_t channels);

}  // namespace tonieforge
