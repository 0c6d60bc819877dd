//
//  tonie_encoder.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tonie_encoder.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <optional>

#include "logging.hpp"
#include "ogg_page.hpp"
#include "opus_encoder.hpp"
#include "opus_stream.hpp"
#include "sha1.hpp"
#include "soxr_resampler.hpp"

namespace tonieforge {

namespace {

// Bytes kept free on a page so padding can always close it.
constexpr uint64_t kMinSpare = 2;
constexpr size_t kFramesPerCancelPoll = 50;
constexpr int kProgressSteps = 20;

// Pages packets into a single logical stream laid out on 4096-byte blocks.
class OggStreamWriter {
   public:
    explicit OggStreamWriter(uint32_t serial) : serial_(serial) {}

    TonieStatus begin(const OpusPreamble &preamble) {
        auto pages = build_preamble_pages(preamble, serial_);
        if (!pages) {
            return pages.status;
        }
        for (auto &page : *pages) {
            append_ogg_page(out_, page);
        }
        sequence_ = static_cast<uint32_t>(pages->size());
        return make_ok();
    }

    // Close the open page so the next packet starts a fresh one. Returns its sequence number.
    uint32_t start_track() {
        if (!page_.segments.empty()) {
            flush_page();
        }
        return sequence_;
    }

    void add_packet(const std::vector<uint8_t> &packet, uint32_t samples) {
        if (!page_.segments.empty() && !fits(packet)) {
            flush_page();
        }
        TF_ENSURE(fits(packet), "packet of " << packet.size() << " bytes fits no page at offset "
                                             << out_.size());
        append_packet(page_, packet);
        granule_ += samples;
    }

    // Flush the last page with EOS and an end-trimmed granule.
    void finish(uint64_t final_granule) {
        TF_ENSURE(!page_.segments.empty(), "stream ends without an open page");
        granule_ = std::max(final_granule, last_granule_);
        flush_page(kOggFlagEos);
    }

    uint64_t granule() const { return granule_; }
    size_t size() const { return out_.size() + ogg_page_size(page_); }
    std::vector<uint8_t> take() { return std::move(out_); }

   private:
    bool fits(const std::vector<uint8_t> &packet) const {
        const uint64_t room = kTonieBlockSize - (out_.size() % kTonieBlockSize);
        const uint64_t size = ogg_page_size(page_) + lacing_entries(packet.size()) + packet.size();
        if (size + kMinSpare > room) {
            return false;
        }
        const size_t segments = page_.segments.size() + lacing_entries(packet.size());
        return segments + padding_layout(static_cast<size_t>(room - size)).size() <=
               kOggMaxSegments;
    }

    void flush_page(uint8_t flags = 0) {
        page_.stream_serial = serial_;
        page_.sequence_number = sequence_++;
        page_.granule_position = granule_;
        page_.flags = flags;
        pad_to_boundary(page_, out_.size());
        append_ogg_page(out_, page_);
        TF_ENSURE(out_.size() % kTonieBlockSize == 0,
                  "page " << page_.sequence_number << " ends at " << out_.size());
        last_granule_ = granule_;
        page_ = OggPage{};
    }

    uint32_t serial_;
    uint32_t sequence_ = 0;
    uint64_t granule_ = 0;
    uint64_t last_granule_ = 0;
    OggPage page_;
    std::vector<uint8_t> out_;
};

// Decode (and convert) one file to 48 kHz stereo.
TonieResult<PcmBuffer> load_pcm(const std::string &path, const EncodeOptions &options,
                                Resampler &resampler) {
    auto factory = options.decoder_factory ? options.decoder_factory : default_decoder_factory();
    auto decoder = factory(path);
    if (!decoder) {
        const auto ext = std::filesystem::path(path).extension().string();
        return make_error(ErrorKind::PerTrackEncode, "Unsupported file type: " + ext);
    }
    auto pcm = decoder->decode(path);
    if (!pcm) {
        if (pcm.status.kind == ErrorKind::Io) {
            return pcm.status;
        }
        return make_error(ErrorKind::PerTrackEncode, pcm.status.message);
    }
    if (pcm->sample_rate == kOpusSampleRate && pcm->channels == kOpusChannels) {
        return pcm;
    }
    auto converted = resampler.convert(*pcm, kOpusSampleRate, kOpusChannels);
    if (!converted) {
        return make_error(ErrorKind::PerTrackEncode, converted.status.message);
    }
    return converted;
}

std::string prefix_path(const std::string &directory, int track) {
    char name[16];
    std::snprintf(name, sizeof(name), "%04d.wav", track);
    return (std::filesystem::path(directory) / name).string();
}

struct EncodedTrack {
    std::vector<std::vector<uint8_t>> packets;
    uint64_t input_samples = 0;  // per channel, including frame fill
};

// Encode one track's PCM into whole frames; the final frame is filled with silence.
TonieResult<EncodedTrack> encode_pcm(OpusEncoder &encoder, const PcmBuffer &pcm, int track,
                                     EncodeCallback &cb) {
    EncodedTrack result;
    const size_t frame_values = kOpusFrameSamples * kOpusChannels;
    const size_t frames = std::max<size_t>(1, (pcm.frames() + kOpusFrameSamples - 1) /
                                                  kOpusFrameSamples);
    std::vector<int16_t> frame(frame_values);
    int last_step = -1;
    for (size_t f = 0; f < frames; ++f) {
        if (f % kFramesPerCancelPoll == 0 && cb.cancelled()) {
            return make_error(ErrorKind::Cancelled, "cancelled during track " +
                                                        std::to_string(track));
        }
        const size_t begin = f * frame_values;
        const size_t count = begin < pcm.samples.size()
                                 ? std::min(frame_values, pcm.samples.size() - begin)
                                 : 0;
        std::fill(frame.begin(), frame.end(), 0);
        if (count > 0) {
            std::copy_n(pcm.samples.begin() + static_cast<std::ptrdiff_t>(begin), count,
                        frame.begin());
        }
        auto packet = encoder.encode(frame.data());
        if (!packet) {
            return packet.status;
        }
        result.packets.push_back(std::move(*packet));

        const int step = static_cast<int>((f + 1) * kProgressSteps / frames);
        if (step != last_step) {
            last_step = step;
            cb.progress(step * 100 / kProgressSteps);
        }
    }
    result.input_samples = frames * kOpusFrameSamples;
    return result;
}

}  // namespace

uint32_t resolve_audio_id(uint32_t audio_id, const EncodeOptions &options) {
    if (audio_id != 0) {
        return audio_id;
    }
    AudioIdGenerator &generator =
        options.id_generator ? *options.id_generator : AudioIdGenerator::shared();
    return generator.next(options.custom_audio_id);
}

TonieResult<EncodedAudio> encode_tracks(const std::vector<std::string> &files, uint32_t audio_id,
                                        const EncodeOptions &options, EncodeCallback *callback) {
    EncodeCallback fallback;
    EncodeCallback &cb = callback ? *callback : fallback;
    if (files.empty()) {
        TF_LOG("error", "no source tracks given");
        return make_error(ErrorKind::InvalidArgument, "no source tracks given");
    }
    if (options.bitrate_kbps <= 0) {
        return make_error(ErrorKind::InvalidArgument,
                          "invalid bitrate " + std::to_string(options.bitrate_kbps));
    }
    const auto t_start = std::chrono::steady_clock::now();

    EncodedAudio result;
    result.audio_id = resolve_audio_id(audio_id, options);

    auto encoder = OpusEncoder::create(options.bitrate_kbps * 1000, options.vbr);
    if (!encoder) {
        cb.failed(encoder.status.message);
        return encoder.status;
    }
    std::shared_ptr<Resampler> resampler =
        options.resampler ? options.resampler : std::make_shared<SoxrResampler>();

    OpusPreamble preamble;
    preamble.head.pre_skip = static_cast<uint16_t>((*encoder)->lookahead());
    preamble.tags = default_opus_tags();
    preamble.tags.comments.push_back("encoder_options=--bitrate " +
                                     std::to_string(options.bitrate_kbps) +
                                     (options.vbr ? " --vbr" : " --hard-cbr"));

    OggStreamWriter writer(result.audio_id);
    auto begun = writer.begin(preamble);
    if (!begun.ok) {
        cb.failed(begun.message);
        return begun;
    }

    uint64_t input_samples = 0;
    uint64_t last_track_fill = 0;
    bool warned = false;
    int track = 0;
    for (const auto &file : files) {
        ++track;
        if (cb.cancelled()) {
            TF_LOG("info", "encode cancelled before track " << track);
            return make_error(ErrorKind::Cancelled, "cancelled");
        }
        if (writer.size() + kTonieBlockSize >= kMaxAudioSize) {
            cb.warning("Close to 2 GiB, stopping");
            break;
        }
        cb.file_start(track, file);

        auto fail_track = [&](const TonieStatus &status) -> std::optional<TonieStatus> {
            if (status.kind == ErrorKind::Cancelled) {
                return status;
            }
            if (status.kind == ErrorKind::Io) {
                cb.failed(status.message);
                return status;
            }
            const std::string msg = "Failed processing " + file + ": " + status.message;
            cb.file_failed(msg);
            if (options.on_track_failure == FailurePolicy::Abort) {
                cb.failed(msg);
                return make_error(ErrorKind::PerTrackEncode, msg);
            }
            TF_LOG("warn", "skipping track " << track << " (" << file << ")");
            return std::nullopt;
        };

        PcmBuffer pcm;
        pcm.sample_rate = kOpusSampleRate;
        pcm.channels = kOpusChannels;
        if (!options.prefix_directory.empty()) {
            const auto prefix = prefix_path(options.prefix_directory, track);
            if (!std::filesystem::exists(prefix)) {
                auto fatal = fail_track(make_error(ErrorKind::PerTrackEncode,
                                                   "Missing prefix file '" + prefix + "'"));
                if (fatal) {
                    return *fatal;
                }
                continue;
            }
            auto prefix_pcm = load_pcm(prefix, options, *resampler);
            if (!prefix_pcm) {
                auto fatal = fail_track(prefix_pcm.status);
                if (fatal) {
                    return *fatal;
                }
                continue;
            }
            pcm.samples = std::move(prefix_pcm->samples);
        }

        auto source = load_pcm(file, options, *resampler);
        if (!source) {
            auto fatal = fail_track(source.status);
            if (fatal) {
                return *fatal;
            }
            continue;
        }
        pcm.samples.insert(pcm.samples.end(), source->samples.begin(), source->samples.end());

        auto encoded = encode_pcm(**encoder, pcm, track, cb);
        if (!encoded) {
            auto fatal = fail_track(encoded.status);
            if (fatal) {
                return *fatal;
            }
            continue;
        }

        const uint32_t first_page = writer.start_track();
        result.chapters.push_back(result.chapters.empty() ? 0 : first_page);
        for (const auto &packet : encoded->packets) {
            writer.add_packet(packet, static_cast<uint32_t>(kOpusFrameSamples));
        }
        input_samples += encoded->input_samples;
        last_track_fill = encoded->input_samples - pcm.frames();
        TF_LOG("debug", "track " << track << ": " << encoded->packets.size() << " packets, "
                                 << "chapter page " << result.chapters.back());
        cb.file_done();

        if (!warned && writer.size() >= kMaxAudioSize / 2) {
            cb.warning("Approaching 2 GiB, please reduce the bitrate");
            warned = true;
        }
    }

    if (result.chapters.empty()) {
        const std::string msg = "no track could be encoded";
        cb.failed(msg);
        TF_LOG("error", msg);
        return make_error(ErrorKind::PerTrackEncode, msg);
    }

    // Push the encoder delay out with silence, then trim the end back to the real input.
    const uint16_t pre_skip = preamble.head.pre_skip;
    std::vector<int16_t> silence(kOpusFrameSamples * kOpusChannels, 0);
    const uint64_t target = pre_skip + input_samples;
    while (writer.granule() < target) {
        auto packet = (*encoder)->encode(silence.data());
        if (!packet) {
            cb.failed(packet.status.message);
            return packet.status;
        }
        writer.add_packet(*packet, static_cast<uint32_t>(kOpusFrameSamples));
    }
    writer.finish(target - last_track_fill);

    cb.post_processing("Finalizing audio stream...");
    result.audio = writer.take();
    cb.post_processing("Computing file hash...");
    result.hash = sha1(result.audio);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                             std::chrono::steady_clock::now() - t_start)
                             .count();
    TF_LOG("info", "encoded " << result.chapters.size() << " tracks into " << result.audio.size()
                              << " bytes, audio id 0x" << std::hex << result.audio_id << std::dec
                              << " (" << elapsed << " ms)");
    return result;
}

}  // namespace tonieforge
