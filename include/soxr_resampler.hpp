//
//  soxr_resampler.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include "audio_source.hpp"

namespace tonieforge {

/// Resampler backed by libsoxr (medium quality, interleaved int16 in and out).
class SoxrResampler : public Resampler {
   public:
    TonieResult<PcmBuffer> convert(const PcmBuffer &input, uint32_t sample_rate,
                                   uint16_t channels) override;
};

}  // namespace tonieforge
