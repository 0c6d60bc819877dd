// Lossless splicing: chapter extraction, serial rewrite and recombination without decoding.
#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

#include "encode_callback.hpp"
#include "logging.hpp"
#include "lossless_splicer.hpp"
#include "ogg_page.hpp"
#include "sha1.hpp"
#include "stream_fixtures.hpp"
#include "test_utils.hpp"

using namespace tonieforge;
using test_utils::PageInfo;

namespace {

constexpr uint32_t kSerial = 0x5A5A0001;
constexpr uint32_t kOtherSerial = 0x12345678;
constexpr uint32_t kTargetId = 0xCAFEBABE;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[splicer_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

class RecordingCallback : public EncodeCallback {
   public:
    void file_start(int, const std::string &) override { ++starts; }
    void file_done() override { ++done; }
    void file_failed(const std::string &) override { ++failures; }

    int starts = 0;
    int done = 0;
    int failures = 0;
};

TonieHeader header_for(const fixtures::Stream &s) {
    TonieHeader h;
    h.hash = sha1(s.audio);
    h.audio_length = static_cast<int32_t>(s.audio.size());
    h.audio_id = kSerial;
    h.audio_chapters = s.chapters;
    return h;
}

// Layout rules every produced stream must satisfy.
bool check_stream_rules(const std::vector<uint8_t> &audio, uint32_t serial,
                        const std::string &what) {
    bool ok = true;
    auto pages = test_utils::walk_pages(audio);
    if (!check(pages.has_value() && pages->size() > 2, what + ": pages parse")) {
        return false;
    }
    ok &= check((*pages)[1].offset + (*pages)[1].size == 0x200, what + ": preamble is 0x200");
    ok &= check(test_utils::pages_end_on_blocks(*pages, 0x200),
                what + ": data pages end on 4096 boundaries");
    ok &= check(test_utils::pages_aligned(*pages), what + ": no page crosses a boundary");
    ok &= check(test_utils::count_flag(*pages, kOggFlagBos) == 1 &&
                    (pages->front().flags & kOggFlagBos),
                what + ": single BOS on the first page");
    ok &= check(test_utils::count_flag(*pages, kOggFlagEos) == 1 &&
                    (pages->back().flags & kOggFlagEos),
                what + ": single EOS on the last page");
    uint64_t last_granule = 0;
    for (size_t i = 0; i < pages->size(); ++i) {
        const auto &p = (*pages)[i];
        ok &= check(p.serial == serial, what + ": serial on page " + std::to_string(i));
        ok &= check(p.sequence == i, what + ": sequence " + std::to_string(i));
        ok &= check(test_utils::crc_ok(audio, p), what + ": CRC on page " + std::to_string(i));
        if (p.granule != ~0ULL) {
            ok &= check(p.granule >= last_granule, what + ": granule monotonic at page " +
                                                       std::to_string(i));
            last_granule = p.granule;
        }
    }
    return ok;
}

std::vector<std::vector<uint8_t>> packets_of_buffers(
    const std::vector<std::vector<uint8_t>> &buffers) {
    std::vector<std::vector<uint8_t>> out;
    for (const auto &b : buffers) {
        auto pages = test_utils::walk_pages(b);
        if (!pages) {
            continue;
        }
        auto packets = test_utils::audio_packets(*pages);
        out.insert(out.end(), packets.begin(), packets.end());
    }
    return out;
}

bool test_extract_chapters() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    ok &= check(stream.chapters == std::vector<uint32_t>({0, 3, 5}), "fixture chapter layout");
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    ok &= check(chapters.ok() && chapters->size() == 3, "three chapters extracted");
    if (!chapters) {
        return false;
    }
    std::vector<uint8_t> joined;
    for (const auto &c : *chapters) {
        joined.insert(joined.end(), c.begin(), c.end());
    }
    ok &= check(joined == stream.audio, "chapters concatenate to the audio region");

    auto first = test_utils::walk_pages((*chapters)[0]);
    ok &= check(first && first->size() == 3 && (*first)[0].sequence == 0,
                "chapter 0 carries the preamble and its data page");
    auto second = test_utils::walk_pages((*chapters)[1]);
    ok &= check(second && second->front().sequence == 3, "chapter 1 starts at its marker page");

    auto bad_header = header_for(stream);
    bad_header.audio_chapters = {0, 3, 42};
    auto bad = extract_raw_chapter_data(bad_header, stream.audio);
    ok &= check(!bad.ok() && bad.status.kind == ErrorKind::Format,
                "marker naming no page is Format");

    auto no_chapters = header_for(stream);
    no_chapters.audio_chapters.clear();
    auto whole = extract_raw_chapter_data(no_chapters, stream.audio);
    ok &= check(whole.ok() && whole->size() == 1 && whole->front() == stream.audio,
                "no chapters yields the whole region");
    return ok;
}

bool test_update_serial_is_lossless() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    if (!chapters) {
        return check(false, "fixture chapters extract");
    }
    const auto &raw = (*chapters)[1];
    auto rewritten = update_stream_serial_number(raw, kTargetId, false);
    ok &= check(rewritten.ok() && rewritten->size() == raw.size(), "rewrite keeps the size");
    if (!rewritten) {
        return false;
    }
    auto before = test_utils::walk_pages(raw);
    auto after = test_utils::walk_pages(*rewritten);
    ok &= check(before && after && before->size() == after->size(), "same page count");
    if (!before || !after) {
        return false;
    }
    for (size_t i = 0; i < before->size(); ++i) {
        const auto &b = (*before)[i];
        const auto &a = (*after)[i];
        ok &= check(a.serial == kTargetId, "serial rewritten on page " + std::to_string(i));
        ok &= check(a.lacing == b.lacing && a.payload == b.payload,
                    "segments byte identical on page " + std::to_string(i));
        ok &= check(a.granule == b.granule && a.sequence == b.sequence && a.flags == b.flags,
                    "other fields unchanged on page " + std::to_string(i));
        ok &= check(test_utils::crc_ok(*rewritten, a), "CRC recomputed on page " +
                                                           std::to_string(i));
    }

    auto pages = parse_ogg_pages(raw);
    auto base = granule_base(*pages);
    ok &= check(base && *base == kDefaultPreSkip + 17 * 960, "base is the previous chapter end");

    auto rebased = update_stream_serial_number(raw, kTargetId, true);
    auto rebased_pages = test_utils::walk_pages(*rebased);
    ok &= check(rebased_pages && rebased_pages->front().granule == 20 * 960 &&
                    rebased_pages->back().granule == 25 * 960,
                "granules re-based to the chapter start");
    return ok;
}

// Two reused chapters plus one chapter from another stream.
bool test_combine_reused_and_foreign_chapters() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    const auto fresh = fixtures::make_stream(kOtherSerial, {12}, 150, 99);
    const std::vector<std::vector<uint8_t>> buffers = {(*chapters)[0], (*chapters)[2],
                                                       fresh.audio};
    RecordingCallback cb;
    auto combined = combine_tracks_lossless(buffers, kTargetId, &cb);
    ok &= check(combined.ok(), "combine succeeds");
    if (!combined) {
        return false;
    }
    ok &= check_stream_rules(combined->audio, kTargetId, "reused chapters");
    ok &= check(combined->chapters.size() == 3 && combined->chapters[0] == 0 &&
                    combined->chapters[1] < combined->chapters[2],
                "one strictly increasing marker per buffer");
    ok &= check(combined->hash == sha1(combined->audio), "hash covers the audio");
    ok &= check(combined->audio_id == kTargetId, "audio id reported");
    ok &= check(cb.starts == 3 && cb.done == 3 && cb.failures == 0, "callback saw every track");

    auto pages = test_utils::walk_pages(combined->audio);
    for (size_t k = 1; k < combined->chapters.size(); ++k) {
        bool found = false;
        for (const auto &p : *pages) {
            found |= p.sequence == combined->chapters[k];
        }
        ok &= check(found, "marker " + std::to_string(k) + " names a page");
    }
    ok &= check(test_utils::audio_packets(*pages) == packets_of_buffers(buffers),
                "every Opus packet carried over byte for byte");
    return ok;
}

bool test_recombine_reproduces_stream() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    auto combined = combine_tracks_lossless(*chapters, kSerial);
    ok &= check(combined.ok(), "recombine succeeds");
    if (!combined) {
        return false;
    }
    ok &= check(combined->audio == stream.audio, "recombined stream is byte identical");
    ok &= check(combined->chapters == stream.chapters, "chapter markers reproduced");
    return ok;
}

bool test_hash_determinism() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    auto a = combine_tracks_lossless(*chapters, kTargetId);
    auto b = combine_tracks_lossless(*chapters, kTargetId);
    auto c = combine_tracks_lossless(*chapters, kTargetId + 1);
    ok &= check(a.ok() && b.ok() && c.ok(), "three combines succeed");
    if (a && b && c) {
        ok &= check(a->hash == b->hash, "same input and id give the same hash");
        ok &= check(a->hash != c->hash, "changing only the id changes the hash");
    }
    return ok;
}

// A full-block page moved into the shorter first block has to be split between packets.
bool test_combine_splits_oversized_page() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    const std::vector<std::vector<uint8_t>> buffers = {(*chapters)[1]};
    auto combined = combine_tracks_lossless(buffers, kTargetId);
    ok &= check(combined.ok(), "combine of a full-block chapter succeeds");
    if (!combined) {
        return false;
    }
    ok &= check_stream_rules(combined->audio, kTargetId, "split");
    auto pages = test_utils::walk_pages(combined->audio);
    // Preamble, 17 packets, 3 packets, 5 packets.
    ok &= check(pages->size() == 5, "first data page split in two");
    ok &= check(test_utils::page_packets((*pages)[2]).size() >= 17,
                "head page keeps the packets that fit");
    ok &= check(test_utils::audio_packets(*pages) == packets_of_buffers(buffers),
                "split keeps every packet in order");
    ok &= check((*pages)[2].granule == kDefaultPreSkip + 17 * 960 &&
                    (*pages)[3].granule == kDefaultPreSkip + 20 * 960 &&
                    (*pages)[4].granule == kDefaultPreSkip + 25 * 960,
                "split granules follow the packets");
    return ok;
}

// Chapter whose second packet starts on one page and finishes on the next.
std::vector<uint8_t> spanning_packet_chapter(const std::vector<std::vector<uint8_t>> &packets) {
    OggPage first;
    first.stream_serial = kOtherSerial;
    first.sequence_number = 2;
    first.granule_position = 1000 + 960;
    append_packet(first, packets[0]);
    const auto &spanning = packets[1];
    first.segments.emplace_back(spanning.begin(), spanning.begin() + 255);
    first.segments.emplace_back(spanning.begin() + 255, spanning.begin() + 510);

    OggPage second;
    second.flags = kOggFlagContinued;
    second.stream_serial = kOtherSerial;
    second.sequence_number = 3;
    second.granule_position = 1000 + 3 * 960;
    second.segments.emplace_back(spanning.begin() + 510, spanning.end());
    append_packet(second, packets[2]);

    std::vector<uint8_t> raw;
    append_ogg_page(raw, first);
    append_ogg_page(raw, second);
    return raw;
}

bool test_combine_keeps_spanning_packet_whole() {
    bool ok = true;
    const std::vector<std::vector<uint8_t>> packets = {test_utils::fake_opus_packet(100, 1),
                                                       test_utils::fake_opus_packet(600, 2),
                                                       test_utils::fake_opus_packet(50, 3)};
    auto combined = combine_tracks_lossless({spanning_packet_chapter(packets)}, kTargetId);
    ok &= check(combined.ok(), "combine of a chapter with a spanning packet succeeds");
    if (!combined) {
        return false;
    }
    ok &= check_stream_rules(combined->audio, kTargetId, "spanning packet");
    auto pages = test_utils::walk_pages(combined->audio);
    ok &= check(test_utils::stream_packets(*pages) == packets,
                "spanning packet reassembles byte for byte");
    for (const auto &p : *pages) {
        ok &= check(p.lacing.empty() || p.lacing.back() < 255,
                    "page " + std::to_string(p.sequence) + " ends on a packet boundary");
    }
    ok &= check(pages->size() == 4 && (*pages)[2].granule == kDefaultPreSkip + 960 &&
                    (*pages)[3].granule == kDefaultPreSkip + 3 * 960,
                "granules follow the completed packets");

    OggPage open;
    open.stream_serial = kOtherSerial;
    open.sequence_number = 2;
    open.granule_position = 960;
    append_packet(open, packets[0]);
    open.segments.emplace_back(packets[1].begin(), packets[1].begin() + 255);
    std::vector<uint8_t> unfinished;
    append_ogg_page(unfinished, open);
    RecordingCallback cb;
    auto broken = combine_tracks_lossless({unfinished}, kTargetId, &cb);
    ok &= check(!broken.ok() && broken.status.kind == ErrorKind::Format,
                "chapter ending inside a packet is Format");
    return ok;
}

bool test_combine_errors() {
    bool ok = true;
    auto none = combine_tracks_lossless({}, kTargetId);
    ok &= check(!none.ok() && none.status.kind == ErrorKind::InvalidArgument,
                "empty buffer list is InvalidArgument");

    const auto a = fixtures::make_stream(kSerial, {5});
    const auto b = fixtures::make_stream(kOtherSerial, {5});
    auto mixed_buffer = a.audio;
    // Append b's data page (past its 0x200 preamble) to a's buffer.
    mixed_buffer.insert(mixed_buffer.end(), b.audio.begin() + 0x200, b.audio.end());
    auto mixed = combine_tracks_lossless({mixed_buffer}, kTargetId);
    ok &= check(!mixed.ok() && mixed.status.kind == ErrorKind::Format,
                "mixed serials in one buffer are Format");

    std::vector<uint8_t> preamble_only(a.audio.begin(), a.audio.begin() + 0x200);
    RecordingCallback cb;
    auto aborted = combine_tracks_lossless({a.audio, preamble_only}, kTargetId, &cb);
    ok &= check(!aborted.ok() && aborted.status.kind == ErrorKind::Format && cb.failures == 1,
                "buffer without audio pages aborts by default");

    auto skipped =
        combine_tracks_lossless({a.audio, preamble_only}, kTargetId, nullptr, FailurePolicy::Skip);
    ok &= check(skipped.ok() && skipped->chapters.size() == 1,
                "buffer without audio pages is skipped on request");

    std::vector<uint8_t> garbage = a.audio;
    garbage[0x200] = 'X';
    auto broken = combine_tracks_lossless({garbage}, kTargetId);
    ok &= check(!broken.ok() && broken.status.kind == ErrorKind::Format,
                "broken capture pattern is Format");

    RecordingCallback cancelled;
    cancelled.cancel();
    auto stopped = combine_tracks_lossless({a.audio}, kTargetId, &cancelled);
    ok &= check(!stopped.ok() && stopped.status.kind == ErrorKind::Cancelled,
                "cancel is honoured");
    return ok;
}

bool test_hybrid_with_raw_chapters() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto chapters = extract_raw_chapter_data(header_for(stream), stream.audio);
    std::vector<TrackSource> sources = {RawChapter{(*chapters)[2]}, RawChapter{(*chapters)[0]}};
    EncodeOptions options;
    auto hybrid = encode_hybrid(sources, kTargetId, options);
    ok &= check(hybrid.ok(), "hybrid of raw chapters succeeds");
    if (!hybrid) {
        return false;
    }
    ok &= check_stream_rules(hybrid->audio, kTargetId, "hybrid");
    ok &= check(hybrid->chapters.size() == 2, "two chapters");
    auto pages = test_utils::walk_pages(hybrid->audio);
    ok &= check(pages->back().granule == kDefaultPreSkip + 30 * 960 + 17 * 960,
                "granules accumulate over reordered chapters");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_extract_chapters();
    ok &= test_update_serial_is_lossless();
    ok &= test_combine_reused_and_foreign_chapters();
    ok &= test_recombine_reproduces_stream();
    ok &= test_hash_determinism();
    ok &= test_combine_splits_oversized_page();
    ok &= test_combine_keeps_spanning_packet_whole();
    ok &= test_combine_errors();
    ok &= test_hybrid_with_raw_chapters();
    return ok ? 0 : 1;
}
