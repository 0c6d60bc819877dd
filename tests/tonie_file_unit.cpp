// TonieFile: container round trip, hash flag, re-keying, positions, statistics and Ogg export.
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "file_io.hpp"
#include "logging.hpp"
#include "ogg_page.hpp"
#include "opus_stream.hpp"
#include "sha1.hpp"
#include "stream_fixtures.hpp"
#include "test_utils.hpp"
#include "tonie_file.hpp"

using namespace tonieforge;

namespace {

constexpr uint32_t kSerial = 0x5A5A0002;

bool check(bool cond, const std::string &msg) {
    if (!cond) {
        fprintf(stderr, "[tonie_file_unit] FAIL: %s\n", msg.c_str());
    }
    return cond;
}

TonieHeader header_for(const fixtures::Stream &s, uint32_t audio_id = kSerial) {
    TonieHeader h;
    h.hash = sha1(s.audio);
    h.audio_length = static_cast<int32_t>(s.audio.size());
    h.audio_id = audio_id;
    h.audio_chapters = s.chapters;
    return h;
}

TonieFile make_file(const fixtures::Stream &s) {
    auto file = TonieFile::build(header_for(s), s.audio);
    return std::move(*file);
}

bool test_roundtrip() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto built = TonieFile::build(header_for(stream), stream.audio);
    ok &= check(built.ok() && built->hash_correct(), "build with a matching hash");
    if (!built) {
        return false;
    }
    const auto bytes = built->to_bytes();
    ok &= check(bytes.size() == kHeaderRegionSize + stream.audio.size(), "header plus audio");

    const auto path = fixtures::temp_path("tf_file_roundtrip.taf").string();
    ok &= check(built->write(path).ok, "write succeeds");
    auto read = TonieFile::from_file(path);
    ok &= check(read.ok() && read->hash_correct() && read->has_audio(), "read back with hash ok");
    if (read) {
        ok &= check(read->to_bytes() == bytes, "unmodified container is byte identical");
        ok &= check(read->header().audio_chapters == stream.chapters, "chapters read");
        ok &= check(read->validate().ok, "fixture stream validates");
    }

    auto header_only = TonieFile::from_file(path, false);
    ok &= check(header_only.ok() && !header_only->has_audio() &&
                    header_only->header().audio_id == kSerial,
                "header-only read");
    if (header_only) {
        auto refused = header_only->write(fixtures::temp_path("tf_file_refused.taf").string());
        ok &= check(!refused.ok && refused.kind == ErrorKind::InvalidArgument,
                    "header-only container is not written");
    }
    return ok;
}

bool test_bad_containers() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17});
    auto stale = header_for(stream);
    stale.hash[0] ^= 0xFF;
    auto file = TonieFile::build(stale, stream.audio);
    ok &= check(file.ok() && !file->hash_correct(), "stale hash detected");
    if (file) {
        auto reread = TonieFile::from_bytes(file->to_bytes());
        ok &= check(reread.ok() && !reread->hash_correct(), "stale hash detected on read");
        auto v = file->validate();
        ok &= check(!v.ok && v.kind == ErrorKind::HashMismatch, "validate reports HashMismatch");
        ok &= check(file->update_file_content().ok && file->hash_correct() &&
                        file->validate().ok,
                    "update_file_content refreshes the hash");
    }

    auto short_file = TonieFile::from_bytes(std::vector<uint8_t>(0x1800, 0));
    ok &= check(!short_file.ok() && short_file.status.kind == ErrorKind::CorruptHeader,
                "file shorter than two blocks is CorruptHeader");

    auto missing = TonieFile::from_file(fixtures::temp_path("tf_file_missing.taf").string());
    ok &= check(!missing.ok() && missing.status.kind == ErrorKind::Io, "missing file is Io");

    auto foreign = TonieFile::build(header_for(stream, kSerial + 1), stream.audio);
    if (foreign) {
        auto stats = foreign->statistics();
        ok &= check(stats.ok() && !stats->first_violation.empty(),
                    "serial differing from the audio id is a violation");
        auto v = foreign->validate();
        ok &= check(!v.ok && v.kind == ErrorKind::Format, "validate reports Format");
    }
    return ok;
}

bool test_atomic_write_failure() {
    bool ok = true;
    const auto target = fixtures::temp_path("tf_file_dir_target");
    std::filesystem::create_directories(target);
    fixtures::write_bytes(target / "keep", {1, 2, 3});

    auto file = make_file(fixtures::make_stream(kSerial, {5}));
    auto status = file.write(target.string());
    ok &= check(!status.ok && status.kind == ErrorKind::Io, "replacing a directory is Io");
    ok &= check(std::filesystem::is_directory(target) &&
                    std::filesystem::exists(target / "keep"),
                "existing target left untouched");
    auto tmp = target;
    tmp += ".tmp";
    ok &= check(!std::filesystem::exists(tmp), "temporary removed");
    return ok;
}

bool test_rekey() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25});
    auto file = make_file(stream);
    ok &= check(file.rekey(0x0BADF00D).ok, "rekey succeeds");
    ok &= check(file.header().audio_id == 0x0BADF00D && file.hash_correct(),
                "header follows the new id");
    ok &= check(file.audio().size() == stream.audio.size(), "audio size unchanged");
    ok &= check(test_utils::layout_problem(file.audio(), 0x0BADF00D).empty(),
                "every page carries the new serial");
    ok &= check(file.validate().ok, "rekeyed container validates");
    auto reread = TonieFile::from_bytes(file.to_bytes());
    ok &= check(reread.ok() && reread->hash_correct() &&
                    reread->header().audio_chapters == stream.chapters,
                "rekeyed container reads back");
    return ok;
}

bool test_positions_and_statistics() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto file = make_file(stream);

    auto positions = file.parse_positions();
    const std::vector<uint64_t> expected = {0, kDefaultPreSkip + 17 * 960,
                                            kDefaultPreSkip + 42 * 960,
                                            kDefaultPreSkip + 72 * 960};
    ok &= check(positions.ok() && *positions == expected, "chapter start granules plus the end");

    auto stats = file.statistics();
    ok &= check(stats.ok(), "statistics succeed");
    if (stats) {
        ok &= check(stats->pages == 7, "page count");
        ok &= check(stats->bos_pages == 1 && stats->eos_pages == 1, "BOS and EOS counted");
        ok &= check(stats->first_violation.empty(), "no violation");
        ok &= check(stats->highest_granule == kDefaultPreSkip + 72 * 960, "highest granule");
        ok &= check(stats->min_granule_delta == 5 * 960 && stats->max_granule_delta == 20 * 960,
                    "granule deltas of interior pages");
        ok &= check(stats->min_segments_per_page > 0 &&
                        stats->min_segments_per_page <= stats->max_segments_per_page,
                    "segment range");
        ok &= check(stats->payload_bytes > 72 * 200, "payload covers every packet");
    }

    file.header().audio_chapters = {0, 5};
    ok &= check(file.update_file_content().ok, "chapter edit re-encodes the header");
    auto reread = TonieFile::from_bytes(file.to_bytes());
    ok &= check(reread.ok() && reread->header().audio_chapters == std::vector<uint32_t>({0, 5}),
                "edited chapters read back");
    return ok;
}

bool test_write_chapter_to_ogg() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto file = make_file(stream);
    const auto path = fixtures::temp_path("tf_chapter_1.ogg").string();
    ok &= check(file.write_chapter_to_ogg(1, path, "Second").ok, "chapter export succeeds");

    auto bytes = read_file(path);
    if (!bytes) {
        return check(false, "exported file readable");
    }
    auto pages = test_utils::walk_pages(*bytes);
    ok &= check(pages && pages->size() == 4, "preamble plus two audio pages");
    if (!pages || pages->size() != 4) {
        return false;
    }
    ok &= check((*pages)[0].flags == kOggFlagBos && (*pages)[3].flags == kOggFlagEos,
                "BOS first, EOS last");
    ok &= check((*pages)[2].sequence == 2 && (*pages)[3].sequence == 3, "pages renumbered");
    ok &= check((*pages)[2].granule == 20 * 960 && (*pages)[3].granule == 25 * 960,
                "granules start at zero");
    ok &= check(bytes->size() < 2 * kTonieBlockSize, "block padding stripped");

    auto parsed = parse_ogg_pages(*bytes);
    auto preamble = find_opus_preamble(*parsed);
    bool titled = false;
    if (preamble) {
        for (const auto &c : preamble->tags.comments) {
            titled |= c == "TITLE=Second";
        }
    }
    ok &= check(titled, "title written to OpusTags");

    auto out_of_range = file.write_chapter_to_ogg(3, path);
    ok &= check(!out_of_range.ok && out_of_range.kind == ErrorKind::InvalidArgument,
                "chapter index out of range");
    return ok;
}

std::vector<std::string> exported_comments(const std::string &path) {
    auto bytes = read_file(path);
    if (!bytes) {
        return {};
    }
    auto pages = parse_ogg_pages(*bytes);
    if (!pages) {
        return {};
    }
    auto preamble = find_opus_preamble(*pages);
    return preamble ? preamble->tags.comments : std::vector<std::string>{};
}

bool has_comment(const std::vector<std::string> &comments, const std::string &comment) {
    for (const auto &c : comments) {
        if (c == comment) {
            return true;
        }
    }
    return false;
}

bool test_dump_audio_files() {
    bool ok = true;
    const auto stream = fixtures::make_stream(kSerial, {17, 25, 30});
    auto file = make_file(stream);
    const auto dir = fixtures::temp_path("tf_dump");
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);

    auto tracks =
        file.dump_audio_files(dir.string(), "Story", false, {"ARTIST=Box"}, {"One", ""});
    ok &= check(tracks.ok() && tracks->size() == 3, "one file per chapter");
    if (!tracks || tracks->size() != 3) {
        return false;
    }
    ok &= check((*tracks)[0] == (dir / "Story - Track #01.ogg").string() &&
                    (*tracks)[2] == (dir / "Story - Track #03.ogg").string(),
                "track files numbered from 01");
    for (size_t i = 0; i < tracks->size(); ++i) {
        const auto comments = exported_comments((*tracks)[i]);
        ok &= check(has_comment(comments, "ARTIST=Box"),
                    "extra tag on track " + std::to_string(i));
        ok &= check(has_comment(comments, "TITLE=One") == (i == 0),
                    "title only where one is given, track " + std::to_string(i));
    }
    auto last = read_file((*tracks)[2]);
    auto last_pages = last ? test_utils::walk_pages(*last) : std::nullopt;
    ok &= check(last_pages && last_pages->size() == 4 &&
                    last_pages->back().granule == 30 * 960 &&
                    test_utils::count_flag(*last_pages, kOggFlagEos) == 1,
                "last track re-based with EOS");

    auto whole = file.dump_audio_files(dir.string(), "Story", true, {"ARTIST=Box"});
    ok &= check(whole.ok() && whole->size() == 1 &&
                    whole->front() == (dir / "Story.ogg").string(),
                "single file export");
    if (whole && whole->size() == 1) {
        auto bytes = read_file(whole->front());
        auto pages = bytes ? test_utils::walk_pages(*bytes) : std::nullopt;
        auto source = test_utils::walk_pages(stream.audio);
        ok &= check(pages && pages->size() == 7, "every page exported");
        if (pages && pages->size() == 7) {
            ok &= check(pages->back().granule == kDefaultPreSkip + 72 * 960,
                        "timeline kept");
            ok &= check(test_utils::count_flag(*pages, kOggFlagBos) == 1 &&
                            test_utils::count_flag(*pages, kOggFlagEos) == 1 &&
                            (pages->back().flags & kOggFlagEos),
                        "single BOS and EOS");
            ok &= check(test_utils::audio_packets(*pages) == test_utils::audio_packets(*source),
                        "audio packets unchanged");
            ok &= check(bytes->size() < stream.audio.size(), "block padding stripped");
        }
        ok &= check(has_comment(exported_comments(whole->front()), "ARTIST=Box"),
                    "extra tag on the single file");
    }

    auto missing = file.dump_audio_files((dir / "absent").string(), "Story", false);
    ok &= check(!missing.ok() && missing.status.kind == ErrorKind::InvalidArgument,
                "missing directory is InvalidArgument");
    auto bad_tag = file.dump_audio_files(dir.string(), "Story", true, {"no separator"});
    ok &= check(!bad_tag.ok() && bad_tag.status.kind == ErrorKind::InvalidArgument,
                "tag without '=' is InvalidArgument");
    return ok;
}

bool test_format_granule() {
    bool ok = true;
    ok &= check(format_granule(0) == "00:00:00.00", "zero");
    ok &= check(format_granule(48000ULL * 3661 + 24000) == "01:01:01.50", "hours to hundredths");
    ok &= check(format_granule(479) == "00:00:00.00", "below one hundredth");
    return ok;
}

}  // namespace

int main() {
    set_log_verbosity(LogVerbosity::Error);
    bool ok = true;
    ok &= test_roundtrip();
    ok &= test_bad_containers();
    ok &= test_atomic_write_failure();
    ok &= test_rekey();
    ok &= test_positions_and_statistics();
    ok &= test_write_chapter_to_ogg();
    ok &= test_dump_audio_files();
    ok &= test_format_granule();
    return ok ? 0 : 1;
}
