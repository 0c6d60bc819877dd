//
//  opus_encoder.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "opus_encoder.hpp"

#include <opus/opus.h>

#include <string>

#include "logging.hpp"
#include "opus_stream.hpp"

namespace tonieforge {

namespace {

// Upper bound recommended by the libopus documentation.
constexpr int kMaxPacketSize = 4000;

TonieStatus opus_failure(const char *what, int code) {
    TF_LOG("error", what << " failed: " << opus_strerror(code));
    return make_error(ErrorKind::PerTrackEncode, std::string(what) + ": " + opus_strerror(code));
}

}  // namespace

void OpusEncoder::EncoderDeleter::operator()(::OpusEncoder *encoder) const {
    opus_encoder_destroy(encoder);
}

OpusEncoder::OpusEncoder(::OpusEncoder *encoder, int lookahead)
    : encoder_(encoder), lookahead_(lookahead) {}

TonieResult<std::unique_ptr<OpusEncoder>> OpusEncoder::create(int bitrate, bool vbr) {
    int error = OPUS_OK;
    std::unique_ptr<::OpusEncoder, EncoderDeleter> encoder(
        opus_encoder_create(static_cast<opus_int32>(kOpusSampleRate), kOpusChannels,
                            OPUS_APPLICATION_AUDIO, &error));
    if (error != OPUS_OK || !encoder) {
        return opus_failure("opus_encoder_create", error);
    }
    error = opus_encoder_ctl(encoder.get(), OPUS_SET_BITRATE(bitrate));
    if (error != OPUS_OK) {
        return opus_failure("OPUS_SET_BITRATE", error);
    }
    error = opus_encoder_ctl(encoder.get(), OPUS_SET_VBR(vbr ? 1 : 0));
    if (error != OPUS_OK) {
        return opus_failure("OPUS_SET_VBR", error);
    }
    opus_int32 lookahead = 0;
    error = opus_encoder_ctl(encoder.get(), OPUS_GET_LOOKAHEAD(&lookahead));
    if (error != OPUS_OK) {
        return opus_failure("OPUS_GET_LOOKAHEAD", error);
    }
    TF_LOG("debug", "opus encoder: " << bitrate << " bps, " << (vbr ? "vbr" : "cbr")
                                     << ", lookahead " << lookahead);
    return std::unique_ptr<OpusEncoder>(new OpusEncoder(encoder.release(), lookahead));
}

TonieResult<std::vector<uint8_t>> OpusEncoder::encode(const int16_t *frame) {
    std::vector<uint8_t> packet(kMaxPacketSize);
    const opus_int32 n =
        opus_encode(encoder_.get(), frame, static_cast<int>(kOpusFrameSamples), packet.data(),
                    static_cast<opus_int32>(packet.size()));
    if (n < 0) {
        return opus_failure("opus_encode", n);
    }
    packet.resize(static_cast<size_t>(n));
    return packet;
}

}  // namespace tonieforge
