//
//  wav_decoder.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "audio_source.hpp"

namespace tonieforge {

/// RIFF/WAVE reader for integer PCM (8/16/24/32 bit) and 32-bit float, converted to int16.
class WavDecoder : public AudioDecoder {
   public:
    TonieResult<PcmBuffer> decode(const std::string &path) override;
};

/// Decode an in-memory RIFF/WAVE image.
TonieResult<PcmBuffer> decode_wav(const std::vector<uint8_t> &bytes);

/// Build a 16-bit PCM RIFF/WAVE image.
std::vector<uint8_t> encode_wav(const PcmBuffer &pcm);

}  // namespace tonieforge
