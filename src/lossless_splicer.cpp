//
//  lossless_splicer.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "lossless_splicer.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <string>

#include "logging.hpp"
#include "opus_stream.hpp"
#include "sha1.hpp"

namespace tonieforge {

namespace {

struct LocatedPage {
    OggPage page;
    size_t offset = 0;
};

TonieResult<std::vector<LocatedPage>> locate_pages(const std::vector<uint8_t> &buffer) {
    std::vector<LocatedPage> pages;
    size_t offset = 0;
    while (offset < buffer.size()) {
        size_t page_size = 0;
        auto page = parse_ogg_page(buffer, offset, page_size);
        if (!page) {
            return page.status;
        }
        pages.push_back(LocatedPage{std::move(*page), offset});
        offset += page_size;
    }
    return pages;
}

// Lacing runs of a page: [first, last) segment ranges, one per packet or packet part.
struct SegmentRun {
    size_t first = 0;
    size_t last = 0;
    size_t bytes = 0;
};

std::vector<SegmentRun> segment_runs(const OggPage &page) {
    std::vector<SegmentRun> runs;
    SegmentRun run;
    for (size_t i = 0; i < page.segments.size(); ++i) {
        run.bytes += page.segments[i].size();
        if (page.segments[i].size() < kOggMaxSegmentSize) {
            run.last = i + 1;
            runs.push_back(run);
            run = SegmentRun{i + 1, i + 1, 0};
        }
    }
    if (run.first < page.segments.size()) {
        run.last = page.segments.size();
        runs.push_back(run);
    }
    return runs;
}

// Places pages back to back so that every page ends exactly on a block boundary.
// A packet left open at the end of a page is carried over to the page that completes it,
// so padding is only ever appended after a finished packet.
class AlignedPageSink {
   public:
    AlignedPageSink(uint64_t start_offset, uint32_t first_sequence)
        : offset_(start_offset), sequence_(first_sequence) {}

    TonieStatus place(OggPage page) {
        if (!carry_.empty()) {
            if (!page.continued()) {
                TF_LOG("error", "page " << page.sequence_number
                                        << " does not continue the open packet before it");
                return make_error(ErrorKind::Format, "open packet is not continued");
            }
            page.segments.insert(page.segments.begin(), std::make_move_iterator(carry_.begin()),
                                 std::make_move_iterator(carry_.end()));
            page.set_flag(kOggFlagContinued, carry_continued_);
            carry_.clear();
        }
        hold_open_packet(page);
        if (page.segments.empty()) {
            return make_ok();
        }

        bool stripped = false;
        for (;;) {
            if (fits(page.segments.size(), ogg_payload_size(page))) {
                emit(std::move(page));
                return make_ok();
            }
            if (!stripped) {
                stripped = true;
                if (strip_padding(page) > 0) {
                    TF_LOG("splice", "stripped padding from page " << page.sequence_number);
                    continue;
                }
            }
            auto tail = split_off_tail(page);
            if (!tail) {
                return tail.status;
            }
            emit(std::move(page));
            page = std::move(*tail);
            stripped = false;
        }
    }

    /// A packet is still waiting for the page that completes it.
    bool has_open_packet() const { return !carry_.empty(); }
    uint32_t next_sequence() const { return sequence_; }
    uint64_t offset() const { return offset_; }
    std::vector<OggPage> &pages() { return pages_; }

   private:
    // Move the segments of a packet that does not finish on `page` into the carry.
    void hold_open_packet(OggPage &page) {
        if (page.segments.empty() || page.segments.back().size() < kOggMaxSegmentSize) {
            return;
        }
        const auto runs = segment_runs(page);
        const SegmentRun &open = runs.back();
        carry_continued_ = open.first == 0 && page.continued();
        carry_.assign(std::make_move_iterator(page.segments.begin() +
                                              static_cast<std::ptrdiff_t>(open.first)),
                      std::make_move_iterator(page.segments.end()));
        page.segments.resize(open.first);
        TF_LOG("splice", "page " << page.sequence_number << " carries " << open.bytes
                                 << " bytes of an open packet forward");
    }

    bool fits(size_t segments, size_t payload) const {
        const uint64_t room = kTonieBlockSize - (offset_ % kTonieBlockSize);
        const uint64_t size = kOggPageHeaderSize + segments + payload;
        if (size > room || segments > kOggMaxSegments) {
            return false;
        }
        return segments + padding_layout(static_cast<size_t>(room - size)).size() <=
               kOggMaxSegments;
    }

    // Keep the leading packets that fit the current block in `page`; return the rest.
    // Open packets are held back before a page gets here, so every run is complete.
    TonieResult<OggPage> split_off_tail(OggPage &page) {
        const auto runs = segment_runs(page);
        size_t segments = 0;
        size_t payload = 0;
        size_t kept = 0;
        for (const auto &run : runs) {
            const size_t run_segments = run.last - run.first;
            if (!fits(segments + run_segments, payload + run.bytes)) {
                break;
            }
            segments += run_segments;
            payload += run.bytes;
            ++kept;
        }
        if (kept == 0) {
            TF_LOG("error", "packet of page " << page.sequence_number << " does not fit a "
                                              << kTonieBlockSize << "-byte block at offset "
                                              << offset_);
            return make_error(ErrorKind::Format, "packet too large for a block");
        }
        TF_ENSURE(kept < runs.size(), "split of a page that fits");

        OggPage tail;
        tail.version = page.version;
        tail.flags = static_cast<uint8_t>(page.flags & ~kOggFlagContinued);
        tail.stream_serial = page.stream_serial;
        tail.segments.assign(page.segments.begin() + static_cast<std::ptrdiff_t>(segments),
                             page.segments.end());
        page.segments.resize(segments);

        if (page.granule_position == kOggNoGranule) {
            tail.granule_position = kOggNoGranule;
        } else {
            const uint64_t tail_samples = page_completed_samples(tail);
            tail.granule_position = page.granule_position;
            page.granule_position = page.granule_position >= tail_samples
                                        ? page.granule_position - tail_samples
                                        : 0;
        }
        TF_LOG("splice", "split page " << page.sequence_number << " after " << kept << " of "
                                       << runs.size() << " packets");
        return tail;
    }

    void emit(OggPage page) {
        page.sequence_number = sequence_++;
        pad_to_boundary(page, offset_);
        offset_ += ogg_page_size(page);
        TF_ENSURE(offset_ % kTonieBlockSize == 0,
                  "page " << page.sequence_number << " ends at " << offset_);
        pages_.push_back(std::move(page));
    }

    uint64_t offset_;
    uint32_t sequence_;
    std::vector<OggPage> pages_;
    std::vector<std::vector<uint8_t>> carry_;
    bool carry_continued_{false};
};

}  // namespace

// -----------------------------------------------------------------------------
// Chapter extraction
// -----------------------------------------------------------------------------
TonieResult<std::vector<std::vector<uint8_t>>> extract_raw_chapter_data(
    const TonieHeader &header, const std::vector<uint8_t> &audio) {
    auto located = locate_pages(audio);
    if (!located) {
        return located.status;
    }
    std::vector<std::vector<uint8_t>> chapters;
    if (header.audio_chapters.empty()) {
        chapters.push_back(audio);
        return chapters;
    }

    std::map<uint32_t, size_t> offset_of;
    for (const auto &lp : *located) {
        offset_of.emplace(lp.page.sequence_number, lp.offset);
    }

    std::vector<size_t> starts;
    for (size_t i = 0; i < header.audio_chapters.size(); ++i) {
        const uint32_t marker = header.audio_chapters[i];
        if (i == 0 && marker == 0) {
            starts.push_back(0);
            continue;
        }
        auto it = offset_of.find(marker);
        if (it == offset_of.end()) {
            TF_LOG("error", "chapter " << i << " marker " << marker << " names no page");
            return make_error(ErrorKind::Format, "chapter marker " + std::to_string(marker) +
                                                     " names no page");
        }
        if (!starts.empty() && it->second <= starts.back()) {
            TF_LOG("error", "chapter " << i << " marker " << marker << " is out of order");
            return make_error(ErrorKind::Format, "chapter markers out of order");
        }
        starts.push_back(it->second);
    }

    for (size_t i = 0; i < starts.size(); ++i) {
        const size_t end = i + 1 < starts.size() ? starts[i + 1] : audio.size();
        chapters.emplace_back(audio.begin() + static_cast<std::ptrdiff_t>(starts[i]),
                              audio.begin() + static_cast<std::ptrdiff_t>(end));
    }
    TF_LOG("splice", "extracted " << chapters.size() << " chapters from " << audio.size()
                                  << " bytes");
    return chapters;
}

// -----------------------------------------------------------------------------
// Serial rewrite
// -----------------------------------------------------------------------------
std::optional<uint64_t> granule_base(const std::vector<OggPage> &pages) {
    uint64_t samples = 0;
    std::vector<uint8_t> carry;
    bool first_data_page = true;
    for (const auto &page : pages) {
        if (is_preamble_page(page)) {
            continue;
        }
        const auto split = packets_of(page);
        for (size_t i = 0; i < split.packets.size(); ++i) {
            std::vector<uint8_t> packet = split.packets[i];
            if (i == 0 && split.first_is_continuation) {
                if (first_data_page) {
                    // Tail of a packet that began before this range; its TOC is unknown.
                    continue;
                }
                packet.insert(packet.begin(), carry.begin(), carry.end());
                carry.clear();
            }
            if (i + 1 == split.packets.size() && split.last_is_open) {
                carry = std::move(packet);
                continue;
            }
            if (!is_padding_packet(packet)) {
                samples += opus_packet_samples(packet);
            }
        }
        first_data_page = false;
        if (page.granule_position != kOggNoGranule) {
            return page.granule_position >= samples ? page.granule_position - samples : 0;
        }
    }
    return std::nullopt;
}

TonieResult<std::vector<uint8_t>> update_stream_serial_number(const std::vector<uint8_t> &raw,
                                                              uint32_t new_serial,
                                                              bool reset_granule) {
    auto pages = parse_ogg_pages(raw);
    if (!pages) {
        return pages.status;
    }
    uint64_t base = 0;
    if (reset_granule) {
        base = granule_base(*pages).value_or(0);
    }

    std::vector<uint8_t> out;
    out.reserve(raw.size());
    for (auto &page : *pages) {
        page.stream_serial = new_serial;
        if (reset_granule && !is_preamble_page(page) &&
            page.granule_position != kOggNoGranule) {
            if (page.granule_position < base) {
                TF_LOG("error", "granule " << page.granule_position << " of page "
                                           << page.sequence_number << " precedes base " << base);
                return make_error(ErrorKind::Format, "granule position precedes chapter start");
            }
            page.granule_position -= base;
        }
        append_ogg_page(out, page);
    }
    TF_ENSURE(out.size() == raw.size(), "re-serialized " << out.size() << " of " << raw.size()
                                                         << " bytes");
    TF_LOG("splice", "rewrote " << pages->size() << " pages to serial 0x" << std::hex
                                << new_serial << std::dec
                                << (reset_granule ? ", granule base " : "")
                                << (reset_granule ? std::to_string(base) : ""));
    return out;
}

// -----------------------------------------------------------------------------
// Combining
// -----------------------------------------------------------------------------
TonieResult<CombinedAudio> combine_tracks_lossless(
    const std::vector<std::vector<uint8_t>> &buffers, uint32_t audio_id,
    EncodeCallback *callback, FailurePolicy policy) {
    EncodeCallback fallback;
    EncodeCallback &cb = callback ? *callback : fallback;
    if (buffers.empty()) {
        TF_LOG("error", "nothing to combine");
        return make_error(ErrorKind::InvalidArgument, "nothing to combine");
    }

    std::vector<std::vector<OggPage>> parsed;
    parsed.reserve(buffers.size());
    for (size_t i = 0; i < buffers.size(); ++i) {
        auto pages = parse_ogg_pages(buffers[i]);
        if (!pages) {
            cb.failed("track " + std::to_string(i + 1) + ": " + pages.status.message);
            return pages.status;
        }
        for (const auto &page : *pages) {
            if (page.stream_serial != pages->front().stream_serial) {
                TF_LOG("error", "track " << (i + 1) << " mixes stream serials 0x" << std::hex
                                         << pages->front().stream_serial << " and 0x"
                                         << page.stream_serial << std::dec);
                return make_error(ErrorKind::Format, "track " + std::to_string(i + 1) +
                                                         " mixes stream serials");
            }
        }
        parsed.push_back(std::move(*pages));
    }

    std::optional<OpusPreamble> preamble;
    for (const auto &pages : parsed) {
        preamble = find_opus_preamble(pages);
        if (preamble) {
            break;
        }
    }
    if (!preamble) {
        TF_LOG("info", "no Opus preamble in any input, using defaults");
        preamble = OpusPreamble{};
        preamble->head.pre_skip = kDefaultPreSkip;
        preamble->tags = default_opus_tags();
    }
    auto head_pages = build_preamble_pages(*preamble, audio_id);
    if (!head_pages) {
        return head_pages.status;
    }
    uint64_t preamble_size = 0;
    for (const auto &page : *head_pages) {
        preamble_size += ogg_page_size(page);
    }

    CombinedAudio result;
    result.audio_id = audio_id;
    AlignedPageSink sink(preamble_size, static_cast<uint32_t>(head_pages->size()));
    // Granules count the decoder's pre-skip, so the timeline starts there.
    uint64_t cumulative = preamble->head.pre_skip;

    for (size_t i = 0; i < parsed.size(); ++i) {
        const int track = static_cast<int>(i + 1);
        if (cb.cancelled()) {
            TF_LOG("info", "combine cancelled before track " << track);
            return make_error(ErrorKind::Cancelled, "cancelled");
        }
        cb.file_start(track, "track " + std::to_string(track));

        std::vector<OggPage> data_pages;
        for (const auto &page : parsed[i]) {
            if (!is_preamble_page(page)) {
                data_pages.push_back(page);
            }
        }
        if (data_pages.empty()) {
            const std::string msg = "track " + std::to_string(track) + " has no audio pages";
            cb.file_failed(msg);
            if (policy == FailurePolicy::Abort) {
                cb.failed(msg);
                return make_error(ErrorKind::Format, msg);
            }
            continue;
        }

        const uint64_t base = granule_base(parsed[i]).value_or(0);
        const uint32_t marker = result.chapters.empty() ? 0 : sink.next_sequence();
        uint64_t last_rel = 0;
        for (auto &page : data_pages) {
            page.stream_serial = audio_id;
            page.flags &= kOggFlagContinued;
            if (page.granule_position != kOggNoGranule) {
                if (page.granule_position < base) {
                    TF_LOG("error", "track " << track << " granule " << page.granule_position
                                             << " precedes base " << base);
                    return make_error(ErrorKind::Format,
                                      "granule position precedes chapter start");
                }
                const uint64_t rel = page.granule_position - base;
                page.granule_position = cumulative + rel;
                last_rel = std::max(last_rel, rel);
            }
            auto placed = sink.place(std::move(page));
            if (!placed.ok) {
                cb.failed(placed.message);
                return placed;
            }
        }
        if (sink.has_open_packet()) {
            const std::string msg = "track " + std::to_string(track) + " ends inside a packet";
            TF_LOG("error", msg);
            cb.failed(msg);
            return make_error(ErrorKind::Format, msg);
        }
        cumulative += last_rel;
        result.chapters.push_back(marker);
        TF_LOG("debug", "track " << track << ": " << data_pages.size() << " pages, chapter page "
                                 << marker << ", granule base " << base);
        cb.file_done();
        cb.progress(static_cast<int>((i + 1) * 100 / parsed.size()));
    }

    if (result.chapters.empty()) {
        const std::string msg = "no track contains audio pages";
        cb.failed(msg);
        return make_error(ErrorKind::Format, msg);
    }

    cb.post_processing("Finalizing audio stream...");
    std::vector<OggPage> all = std::move(*head_pages);
    for (auto &page : sink.pages()) {
        all.push_back(std::move(page));
    }
    for (size_t i = 0; i < all.size(); ++i) {
        all[i].set_flag(kOggFlagBos, i == 0);
        all[i].set_flag(kOggFlagEos, i + 1 == all.size());
    }
    result.audio.reserve(static_cast<size_t>(sink.offset()));
    for (auto &page : all) {
        append_ogg_page(result.audio, page);
    }
    TF_ENSURE(result.audio.size() == sink.offset(),
              "combined stream is " << result.audio.size() << " bytes, expected "
                                    << sink.offset());

    cb.post_processing("Computing file hash...");
    result.hash = sha1(result.audio);
    TF_LOG("info", "combined " << result.chapters.size() << " tracks into "
                               << result.audio.size() << " bytes, audio id 0x" << std::hex
                               << audio_id << std::dec);
    return result;
}

// -----------------------------------------------------------------------------
// Hybrid encode
// -----------------------------------------------------------------------------
TonieResult<CombinedAudio> encode_hybrid(const std::vector<TrackSource> &sources,
                                         uint32_t audio_id, const EncodeOptions &options,
                                         EncodeCallback *callback) {
    EncodeCallback fallback;
    EncodeCallback &cb = callback ? *callback : fallback;
    if (sources.empty()) {
        TF_LOG("error", "no track sources given");
        return make_error(ErrorKind::InvalidArgument, "no track sources given");
    }
    audio_id = resolve_audio_id(audio_id, options);

    const bool all_new = std::all_of(sources.begin(), sources.end(), [](const TrackSource &s) {
        return std::holds_alternative<NewFile>(s);
    });
    if (all_new) {
        std::vector<std::string> files;
        for (const auto &s : sources) {
            files.push_back(std::get<NewFile>(s).path);
        }
        return encode_tracks(files, audio_id, options, &cb);
    }

    std::vector<std::vector<uint8_t>> buffers;
    int track = 0;
    for (const auto &source : sources) {
        ++track;
        if (cb.cancelled()) {
            return make_error(ErrorKind::Cancelled, "cancelled");
        }
        if (const auto *raw = std::get_if<RawChapter>(&source)) {
            auto rewritten = update_stream_serial_number(raw->data, audio_id, true);
            if (!rewritten) {
                cb.failed("track " + std::to_string(track) + ": " + rewritten.status.message);
                return rewritten.status;
            }
            buffers.push_back(std::move(*rewritten));
            continue;
        }
        const auto &file = std::get<NewFile>(source).path;
        auto encoded = encode_tracks({file}, audio_id, options, &cb);
        if (!encoded) {
            if (encoded.status.kind == ErrorKind::PerTrackEncode &&
                options.on_track_failure == FailurePolicy::Skip) {
                TF_LOG("warn", "skipping track " << track << " (" << file << ")");
                continue;
            }
            return encoded.status;
        }
        buffers.push_back(std::move(encoded->audio));
    }
    return combine_tracks_lossless(buffers, audio_id, &cb, options.on_track_failure);
}

}  // namespace tonieforge
