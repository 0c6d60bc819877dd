//
//  audio_source.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_source.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include "logging.hpp"
#include "wav_decoder.hpp"

namespace tonieforge {

DecoderFactory default_decoder_factory() {
    return [](const std::string &path) -> std::unique_ptr<AudioDecoder> {
        auto ext = std::filesystem::path(path).extension().string();
        for (auto &c : ext) {
            c = static_cast<char>(::tolower(c));
        }
        if (ext == ".wav" || ext == ".wave") {
            return std::make_unique<WavDecoder>();
        }
        TF_LOG("debug", "no decoder for extension '" << ext << "'");
        return nullptr;
    };
}

PcmBuffer remix_channels(const PcmBuffer &input, uint16_t channels) {
    if (input.channels == channels || input.channels == 0 || channels == 0) {
        return input;
    }
    PcmBuffer out;
    out.sample_rate = input.sample_rate;
    out.channels = channels;
    const size_t frames = input.frames();
    out.samples.resize(frames * channels);
    for (size_t f = 0; f < frames; ++f) {
        const int16_t *src = input.samples.data() + f * input.channels;
        int16_t *dst = out.samples.data() + f * channels;
        if (channels == 1) {
            int32_t sum = 0;
            for (uint16_t c = 0; c < input.channels; ++c) {
                sum += src[c];
            }
            dst[0] = static_cast<int16_t>(sum / input.channels);
            continue;
        }
        for (uint16_t c = 0; c < channels; ++c) {
            dst[c] = src[std::min<uint16_t>(c, input.channels - 1)];
        }
    }
    return out;
}

}  // namespace tonieforge
