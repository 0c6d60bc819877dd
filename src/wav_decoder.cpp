//
//  wav_decoder.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "wav_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>

#include "byte_io.hpp"
#include "file_io.hpp"
#include "logging.hpp"

namespace tonieforge {

namespace {

constexpr uint16_t kWaveFormatPcm = 0x0001;
constexpr uint16_t kWaveFormatFloat = 0x0003;
constexpr uint16_t kWaveFormatExtensible = 0xFFFE;
constexpr size_t kRiffHeaderSize = 12;
constexpr size_t kChunkHeaderSize = 8;
constexpr size_t kFmtMinSize = 16;

struct WavFormat {
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits_per_sample = 0;
};

TonieStatus format_error(const std::string &msg) {
    TF_LOG("error", "wav: " << msg);
    return make_error(ErrorKind::Format, "wav: " + msg);
}

bool fourcc_is(const uint8_t *p, const char *tag) { return std::memcmp(p, tag, 4) == 0; }

int16_t sample_to_int16(const uint8_t *p, const WavFormat &fmt) {
    if (fmt.format == kWaveFormatFloat) {
        float f;
        uint32_t raw = read_u32_le(p);
        std::memcpy(&f, &raw, sizeof(f));
        f = std::max(-1.0f, std::min(1.0f, f));
        return static_cast<int16_t>(std::lround(f * 32767.0f));
    }
    switch (fmt.bits_per_sample) {
    case 8:
        return static_cast<int16_t>((int(p[0]) - 128) << 8);
    case 16:
        return static_cast<int16_t>(read_u16_le(p));
    case 24:
        return static_cast<int16_t>(p[1] | (p[2] << 8));
    default:
        return static_cast<int16_t>(p[2] | (p[3] << 8));
    }
}

}  // namespace

TonieResult<PcmBuffer> decode_wav(const std::vector<uint8_t> &bytes) {
    if (bytes.size() < kRiffHeaderSize || !fourcc_is(bytes.data(), "RIFF") ||
        !fourcc_is(bytes.data() + 8, "WAVE")) {
        return format_error("missing RIFF/WAVE signature");
    }

    WavFormat fmt;
    bool have_fmt = false;
    size_t pos = kRiffHeaderSize;
    while (pos + kChunkHeaderSize <= bytes.size()) {
        const uint8_t *chunk = bytes.data() + pos;
        const uint32_t chunk_size = read_u32_le(chunk + 4);
        const size_t body = pos + kChunkHeaderSize;
        const size_t available = bytes.size() - body;

        if (fourcc_is(chunk, "fmt ")) {
            if (chunk_size < kFmtMinSize || chunk_size > available) {
                return format_error("truncated fmt chunk");
            }
            const uint8_t *f = bytes.data() + body;
            fmt.format = read_u16_le(f);
            fmt.channels = read_u16_le(f + 2);
            fmt.sample_rate = read_u32_le(f + 4);
            fmt.block_align = read_u16_le(f + 12);
            fmt.bits_per_sample = read_u16_le(f + 14);
            if (fmt.format == kWaveFormatExtensible && chunk_size >= 26) {
                // Sub-format GUID starts with the plain format code.
                fmt.format = read_u16_le(f + 24);
            }
            have_fmt = true;
        } else if (fourcc_is(chunk, "data")) {
            if (!have_fmt) {
                return format_error("data chunk before fmt chunk");
            }
            const bool is_pcm = fmt.format == kWaveFormatPcm &&
                                (fmt.bits_per_sample == 8 || fmt.bits_per_sample == 16 ||
                                 fmt.bits_per_sample == 24 || fmt.bits_per_sample == 32);
            const bool is_float = fmt.format == kWaveFormatFloat && fmt.bits_per_sample == 32;
            if (!is_pcm && !is_float) {
                return format_error("unsupported sample format " + std::to_string(fmt.format) +
                                    "/" + std::to_string(fmt.bits_per_sample) + " bit");
            }
            const size_t bytes_per_sample = fmt.bits_per_sample / 8;
            if (fmt.channels == 0 || fmt.sample_rate == 0 ||
                fmt.block_align != bytes_per_sample * fmt.channels) {
                return format_error("inconsistent fmt chunk");
            }
            // Some writers leave the data size at 0 or oversized while streaming.
            const size_t data_size = std::min<size_t>(chunk_size, available);
            const size_t frames = data_size / fmt.block_align;

            PcmBuffer pcm;
            pcm.sample_rate = fmt.sample_rate;
            pcm.channels = fmt.channels;
            pcm.samples.reserve(frames * fmt.channels);
            const uint8_t *p = bytes.data() + body;
            for (size_t i = 0; i < frames * fmt.channels; ++i) {
                pcm.samples.push_back(sample_to_int16(p + i * bytes_per_sample, fmt));
            }
            TF_LOG("debug", "wav: " << frames << " frames, " << fmt.channels << " ch, "
                                    << fmt.sample_rate << " Hz, " << fmt.bits_per_sample
                                    << " bit");
            return pcm;
        }

        // Chunks are word aligned.
        const size_t advance = static_cast<size_t>(chunk_size) + (chunk_size & 1);
        if (advance > available) {
            break;
        }
        pos = body + advance;
    }
    return format_error("no data chunk");
}

std::vector<uint8_t> encode_wav(const PcmBuffer &pcm) {
    const uint32_t data_size = static_cast<uint32_t>(pcm.samples.size() * 2);
    std::vector<uint8_t> out;
    out.reserve(44 + data_size);
    write_string(out, "RIFF");
    write_u32_le(out, 36 + data_size);
    write_string(out, "WAVE");
    write_string(out, "fmt ");
    write_u32_le(out, 16);
    write_u16_le(out, kWaveFormatPcm);
    write_u16_le(out, pcm.channels);
    write_u32_le(out, pcm.sample_rate);
    write_u32_le(out, pcm.sample_rate * pcm.channels * 2);
    write_u16_le(out, static_cast<uint16_t>(pcm.channels * 2));
    write_u16_le(out, 16);
    write_string(out, "data");
    write_u32_le(out, data_size);
    for (int16_t s : pcm.samples) {
        write_u16_le(out, static_cast<uint16_t>(s));
    }
    return out;
}

TonieResult<PcmBuffer> WavDecoder::decode(const std::string &path) {
    auto bytes = read_file(path);
    if (!bytes) {
        return bytes.status;
    }
    auto pcm = decode_wav(*bytes);
    if (!pcm) {
        return make_error(pcm.status.kind, path + ": " + pcm.status.message);
    }
    return pcm;
}

}  // namespace tonieforge
