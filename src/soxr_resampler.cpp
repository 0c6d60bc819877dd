//
//  soxr_resampler.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "soxr_resampler.hpp"

#include <soxr.h>

#include <memory>
#include <string>
#include <type_traits>

#include "logging.hpp"

namespace tonieforge {

namespace {

struct SoxrDeleter {
    void operator()(soxr_t s) const { soxr_delete(s); }
};

using SoxrHandle = std::unique_ptr<std::remove_pointer_t<soxr_t>, SoxrDeleter>;

TonieStatus soxr_failure(const char *what, soxr_error_t error) {
    TF_LOG("error", what << " failed: " << (error ? error : "unknown"));
    return make_error(ErrorKind::PerTrackEncode, std::string(what) + " failed");
}

}  // namespace

TonieResult<PcmBuffer> SoxrResampler::convert(const PcmBuffer &input, uint32_t sample_rate,
                                              uint16_t channels) {
    if (input.channels == 0 || input.sample_rate == 0 || sample_rate == 0) {
        return make_error(ErrorKind::InvalidArgument, "resampler: empty format");
    }
    PcmBuffer remixed = remix_channels(input, channels);
    if (remixed.sample_rate == sample_rate || remixed.samples.empty()) {
        remixed.sample_rate = sample_rate;
        return remixed;
    }

    soxr_io_spec_t io_spec = soxr_io_spec(SOXR_INT16_I, SOXR_INT16_I);
    soxr_quality_spec_t q_spec = soxr_quality_spec(SOXR_MQ, 0);
    soxr_error_t error = nullptr;
    SoxrHandle soxr(soxr_create(remixed.sample_rate, sample_rate, channels, &error, &io_spec,
                                &q_spec, nullptr));
    if (error != nullptr || !soxr) {
        return soxr_failure("soxr_create", error);
    }

    const size_t in_frames = remixed.frames();
    const size_t out_capacity =
        static_cast<size_t>(uint64_t(in_frames) * sample_rate / remixed.sample_rate) + 1024;
    PcmBuffer out;
    out.sample_rate = sample_rate;
    out.channels = channels;
    out.samples.resize(out_capacity * channels);

    size_t idone = 0;
    size_t odone = 0;
    error = soxr_process(soxr.get(), remixed.samples.data(), in_frames, &idone,
                         out.samples.data(), out_capacity, &odone);
    if (error != nullptr) {
        return soxr_failure("soxr_process", error);
    }
    size_t total = odone;

    // Drain the filter delay.
    while (total < out_capacity) {
        error = soxr_process(soxr.get(), nullptr, 0, nullptr,
                             out.samples.data() + total * channels, out_capacity - total, &odone);
        if (error != nullptr) {
            return soxr_failure("soxr_process", error);
        }
        if (odone == 0) {
            break;
        }
        total += odone;
    }
    out.samples.resize(total * channels);
    TF_LOG("debug", "resampled " << in_frames << " frames " << remixed.sample_rate << " -> "
                                 << sample_rate << " Hz (" << total << " frames)");
    return out;
}

}  // namespace tonieforge
