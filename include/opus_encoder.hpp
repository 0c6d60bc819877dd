//
//  opus_encoder.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "tonie_status.hpp"

struct OpusEncoder;

namespace tonieforge {

// 20 ms at 48 kHz.
inline constexpr size_t kOpusFrameSamples = 960;

/// libopus encoder fixed to 48 kHz stereo, OPUS_APPLICATION_AUDIO.
class OpusEncoder {
   public:
    /// `bitrate` in bits per second.
    static TonieResult<std::unique_ptr<OpusEncoder>> create(int bitrate, bool vbr);

    /// Encode one frame of kOpusFrameSamples interleaved stereo samples.
    TonieResult<std::vector<uint8_t>> encode(const int16_t *frame);

    /// Encoder delay in 48 kHz samples; used as the stream pre-skip.
    int lookahead() const { return lookahead_; }

   private:
    struct EncoderDeleter {
        void operator()(::OpusEncoder *encoder) const;
    };

    explicit OpusEncoder(::OpusEncoder *encoder, int lookahead);

    std::unique_ptr<::OpusEncoder, EncoderDeleter> encoder_;
    int lookahead_ = 0;
};

}  // namespace tonieforge
