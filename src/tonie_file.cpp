//
//  tonie_file.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tonie_file.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "file_io.hpp"
#include "logging.hpp"
#include "lossless_splicer.hpp"
#include "ogg_page.hpp"
#include "opus_stream.hpp"
#include "sha1.hpp"

namespace tonieforge {

namespace {

// Smallest file with a header and at least one audio block.
constexpr size_t kMinimumFileSize = 0x2000;

bool starts_with_title(const std::string &comment) {
    static const std::string kTitle = "title=";
    if (comment.size() < kTitle.size()) {
        return false;
    }
    for (size_t i = 0; i < kTitle.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(comment[i])) != kTitle[i]) {
            return false;
        }
    }
    return true;
}

void apply_title(OpusTagsInfo &tags, const std::string &title) {
    if (title.empty()) {
        return;
    }
    auto &comments = tags.comments;
    comments.erase(std::remove_if(comments.begin(), comments.end(), starts_with_title),
                   comments.end());
    comments.push_back("TITLE=" + title);
}

// Serialize a standalone Ogg Opus file: preamble pages, then `pages` without block padding.
std::vector<uint8_t> standalone_ogg(std::vector<OggPage> head_pages,
                                    std::vector<OggPage> &pages) {
    std::vector<uint8_t> bytes;
    for (auto &page : head_pages) {
        append_ogg_page(bytes, page);
    }
    uint32_t sequence = static_cast<uint32_t>(head_pages.size());
    for (size_t i = 0; i < pages.size(); ++i) {
        auto &page = pages[i];
        strip_padding(page);
        page.flags &= kOggFlagContinued;
        page.set_flag(kOggFlagEos, i + 1 == pages.size());
        page.sequence_number = sequence++;
        append_ogg_page(bytes, page);
    }
    return bytes;
}

}  // namespace

// ---- Reading
TonieResult<TonieFile> TonieFile::from_file(const std::string &path, bool read_audio) {
    auto bytes = read_audio ? read_file(path) : read_file(path, kHeaderRegionSize);
    if (!bytes) {
        return bytes.status;
    }
    TF_LOG("debug", "read " << bytes->size() << " bytes from " << path);
    return from_bytes(*bytes, read_audio);
}

TonieResult<TonieFile> TonieFile::from_bytes(const std::vector<uint8_t> &bytes,
                                             bool read_audio) {
    if (bytes.size() < kHeaderRegionSize || (read_audio && bytes.size() < kMinimumFileSize)) {
        TF_LOG("error", "file too short for a Tonie container (" << bytes.size() << " bytes)");
        return make_error(ErrorKind::CorruptHeader, "file too short");
    }
    TonieFile file;
    file.header_bytes_.assign(bytes.begin(),
                              bytes.begin() + static_cast<std::ptrdiff_t>(kHeaderRegionSize));
    auto header = decode_tonie_header(file.header_bytes_);
    if (!header) {
        return header.status;
    }
    file.header_ = std::move(*header);

    if (read_audio) {
        file.audio_.assign(bytes.begin() + static_cast<std::ptrdiff_t>(kHeaderRegionSize),
                           bytes.end());
        file.has_audio_ = true;
        file.hash_correct_ = sha1(file.audio_) == file.header_.hash;
        if (!file.hash_correct_) {
            TF_LOG("warn", "stored hash " << to_hex(file.header_.hash)
                                          << " does not match audio hash "
                                          << to_hex(sha1(file.audio_)));
        }
        if (file.header_.audio_length < 0 ||
            static_cast<size_t>(file.header_.audio_length) != file.audio_.size()) {
            TF_LOG("warn", "header declares " << file.header_.audio_length
                                              << " audio bytes, file carries "
                                              << file.audio_.size());
        }
    }
    TF_LOG("debug", "audio id 0x" << std::hex << file.header_.audio_id << std::dec << ", "
                                  << file.header_.audio_chapters.size() << " chapters");
    return file;
}

TonieResult<TonieFile> TonieFile::build(const TonieHeader &header, std::vector<uint8_t> audio) {
    TonieFile file;
    file.header_ = header;
    file.audio_ = std::move(audio);
    file.has_audio_ = true;
    auto encoded = encode_tonie_header(file.header_);
    if (!encoded) {
        return encoded.status;
    }
    file.header_bytes_ = std::move(*encoded);
    file.hash_correct_ = sha1(file.audio_) == file.header_.hash;
    return file;
}

TonieResult<TonieFile> TonieFile::build(EncodedAudio encoded) {
    if (encoded.audio.size() > static_cast<size_t>(INT32_MAX)) {
        TF_LOG("error", "audio of " << encoded.audio.size() << " bytes exceeds the header range");
        return make_error(ErrorKind::InvalidArgument, "audio too large");
    }
    TonieHeader header;
    header.hash = std::move(encoded.hash);
    header.audio_length = static_cast<int32_t>(encoded.audio.size());
    header.audio_id = encoded.audio_id;
    header.audio_chapters = std::move(encoded.chapters);
    return build(header, std::move(encoded.audio));
}

// ---- Writing
std::vector<uint8_t> TonieFile::to_bytes() const {
    std::vector<uint8_t> out;
    out.reserve(header_bytes_.size() + audio_.size());
    out.insert(out.end(), header_bytes_.begin(), header_bytes_.end());
    out.insert(out.end(), audio_.begin(), audio_.end());
    return out;
}

TonieStatus TonieFile::write(const std::string &path) const {
    if (!has_audio_) {
        TF_LOG("error", "refusing to write header-only container to " << path);
        return make_error(ErrorKind::InvalidArgument, "container has no audio loaded");
    }
    if (header_bytes_.size() != kHeaderRegionSize) {
        TF_LOG("error", "header region is " << header_bytes_.size() << " bytes");
        return make_error(ErrorKind::Internal, "header region not encoded");
    }
    return write_file_atomic(path, to_bytes());
}

TonieStatus TonieFile::update_file_content() {
    if (has_audio_) {
        if (audio_.size() > static_cast<size_t>(INT32_MAX)) {
            TF_LOG("error", "audio of " << audio_.size() << " bytes exceeds the header range");
            return make_error(ErrorKind::InvalidArgument, "audio too large");
        }
        header_.audio_length = static_cast<int32_t>(audio_.size());
        header_.hash = sha1(audio_);
        hash_correct_ = true;
    }
    auto encoded = encode_tonie_header(header_);
    if (!encoded) {
        return encoded.status;
    }
    header_bytes_ = std::move(*encoded);
    return make_ok();
}

TonieStatus TonieFile::rekey(uint32_t new_audio_id) {
    if (!has_audio_) {
        TF_LOG("error", "rekey needs the audio region");
        return make_error(ErrorKind::InvalidArgument, "container has no audio loaded");
    }
    auto rewritten = update_stream_serial_number(audio_, new_audio_id, false);
    if (!rewritten) {
        return rewritten.status;
    }
    TF_LOG("info", "audio id 0x" << std::hex << header_.audio_id << " -> 0x" << new_audio_id
                                 << std::dec);
    audio_ = std::move(*rewritten);
    header_.audio_id = new_audio_id;
    return update_file_content();
}

// ---- Inspection
TonieResult<std::vector<uint64_t>> TonieFile::parse_positions() const {
    auto pages = parse_ogg_pages(audio_);
    if (!pages) {
        return pages.status;
    }
    std::vector<uint64_t> positions;
    size_t chapter = 0;
    uint64_t last = 0;
    for (const auto &page : *pages) {
        while (chapter < header_.audio_chapters.size() &&
               page.sequence_number >= header_.audio_chapters[chapter]) {
            positions.push_back(last);
            ++chapter;
        }
        if (page.granule_position != kOggNoGranule && !is_preamble_page(page)) {
            last = page.granule_position;
        }
    }
    if (positions.empty()) {
        positions.push_back(0);
    }
    positions.push_back(last);
    return positions;
}

TonieResult<StreamStatistics> TonieFile::statistics() const {
    if (!has_audio_) {
        TF_LOG("error", "statistics need the audio region");
        return make_error(ErrorKind::InvalidArgument, "container has no audio loaded");
    }
    StreamStatistics stats;
    stats.min_segments_per_page = kOggMaxSegments;
    stats.min_granule_delta = UINT64_MAX;
    auto violation = [&stats](const std::string &message) {
        if (stats.first_violation.empty()) {
            stats.first_violation = message;
            TF_LOG("warn", message);
        }
    };

    size_t offset = 0;
    uint64_t last_granule = 0;
    while (offset < audio_.size()) {
        size_t page_size = 0;
        auto page = parse_ogg_page(audio_, offset, page_size);
        if (!page) {
            std::ostringstream os;
            os << "no Ogg page at audio offset 0x" << std::hex << offset << ": "
               << page.status.message;
            violation(os.str());
            break;
        }
        const size_t end = offset + page_size;
        const size_t segments = page->segments.size();
        ++stats.pages;
        stats.total_segments += segments;
        stats.payload_bytes += ogg_payload_size(*page);
        if (offset / kTonieBlockSize != (end - 1) / kTonieBlockSize) {
            violation("page " + std::to_string(page->sequence_number) +
                      " crosses a block boundary");
        }
        if (page->stream_serial != header_.audio_id) {
            violation("page " + std::to_string(page->sequence_number) + " has serial " +
                      std::to_string(page->stream_serial));
        }
        stats.bos_pages += page->bos() ? 1 : 0;
        stats.eos_pages += page->eos() ? 1 : 0;

        const uint64_t granule = page->granule_position;
        if (!is_preamble_page(*page) && granule != kOggNoGranule) {
            if (granule < last_granule) {
                violation("granule of page " + std::to_string(page->sequence_number) +
                          " decreases");
            } else if (offset >= kTonieBlockSize && end < audio_.size()) {
                // Interior pages only; the first block and the last page are short.
                stats.min_segments_per_page = std::min(stats.min_segments_per_page, segments);
                stats.max_segments_per_page = std::max(stats.max_segments_per_page, segments);
                stats.min_granule_delta = std::min(stats.min_granule_delta, granule - last_granule);
                stats.max_granule_delta = std::max(stats.max_granule_delta, granule - last_granule);
            }
            stats.highest_granule = std::max(stats.highest_granule, granule);
            last_granule = granule;
        }
        offset = end;
    }
    if (stats.bos_pages != 1 || stats.eos_pages != 1) {
        violation("stream carries " + std::to_string(stats.bos_pages) + " BOS and " +
                  std::to_string(stats.eos_pages) + " EOS pages");
    }
    if (stats.max_segments_per_page == 0) {
        stats.min_segments_per_page = 0;
    }
    if (stats.min_granule_delta == UINT64_MAX) {
        stats.min_granule_delta = 0;
    }
    TF_LOG("debug", "stats: pages=" << stats.pages << " segments=" << stats.total_segments
                                    << " bytes=" << stats.payload_bytes << " highest granule="
                                    << stats.highest_granule);
    return stats;
}

TonieStatus TonieFile::validate() const {
    auto stats = statistics();
    if (!stats) {
        return stats.status;
    }
    if (!stats->first_violation.empty()) {
        TF_LOG("error", "invalid stream: " << stats->first_violation);
        return make_error(ErrorKind::Format, stats->first_violation);
    }
    if (!hash_correct_) {
        TF_LOG("error", "stored hash does not match the audio");
        return make_error(ErrorKind::HashMismatch, "stored hash does not match the audio");
    }
    return make_ok();
}

// ---- Chapter export
TonieResult<std::vector<std::vector<uint8_t>>> TonieFile::extract_raw_chapter_data() const {
    if (!has_audio_) {
        TF_LOG("error", "chapter extraction needs the audio region");
        return make_error(ErrorKind::InvalidArgument, "container has no audio loaded");
    }
    return tonieforge::extract_raw_chapter_data(header_, audio_);
}

TonieResult<OpusPreamble> TonieFile::export_preamble(
    const std::vector<std::string> &tags) const {
    if (!has_audio_) {
        TF_LOG("error", "export needs the audio region");
        return make_error(ErrorKind::InvalidArgument, "container has no audio loaded");
    }
    auto stream = parse_ogg_pages(audio_);
    if (!stream) {
        return stream.status;
    }
    auto preamble = find_opus_preamble(*stream);
    if (!preamble) {
        TF_LOG("error", "container has no Opus preamble");
        return make_error(ErrorKind::Format, "missing OpusHead/OpusTags");
    }
    for (const auto &tag : tags) {
        if (tag.find('=') == std::string::npos) {
            TF_LOG("error", "tag \"" << tag << "\" is not KEY=value");
            return make_error(ErrorKind::InvalidArgument, "tag without '='");
        }
        preamble->tags.comments.push_back(tag);
    }
    return *preamble;
}

TonieStatus TonieFile::write_chapter(const std::vector<std::vector<uint8_t>> &chapters,
                                     size_t index, const std::string &path,
                                     const OpusPreamble &preamble) const {
    if (index >= chapters.size()) {
        TF_LOG("error", "chapter " << index << " of " << chapters.size() << " requested");
        return make_error(ErrorKind::InvalidArgument, "chapter index out of range");
    }
    auto head_pages = build_preamble_pages(preamble, header_.audio_id, 0);
    if (!head_pages) {
        return head_pages.status;
    }
    auto pages = parse_ogg_pages(chapters[index]);
    if (!pages) {
        return pages.status;
    }
    const uint64_t base = granule_base(*pages).value_or(0);
    std::vector<OggPage> data_pages;
    for (auto &page : *pages) {
        if (is_preamble_page(page)) {
            continue;
        }
        if (page.granule_position != kOggNoGranule) {
            page.granule_position =
                page.granule_position >= base ? page.granule_position - base : 0;
        }
        data_pages.push_back(std::move(page));
    }
    if (data_pages.empty()) {
        TF_LOG("error", "chapter " << index << " has no audio pages");
        return make_error(ErrorKind::Format, "chapter has no audio pages");
    }
    const auto bytes = standalone_ogg(std::move(*head_pages), data_pages);
    TF_LOG("info", "chapter " << index << ": " << data_pages.size() << " pages, "
                              << format_granule(data_pages.back().granule_position) << " -> "
                              << path);
    return write_file_atomic(path, bytes);
}

TonieStatus TonieFile::write_chapter_to_ogg(size_t index, const std::string &path,
                                            const std::string &title) const {
    auto chapters = extract_raw_chapter_data();
    if (!chapters) {
        return chapters.status;
    }
    auto preamble = export_preamble({});
    if (!preamble) {
        return preamble.status;
    }
    apply_title(preamble->tags, title);
    return write_chapter(*chapters, index, path, *preamble);
}

TonieResult<std::vector<std::string>> TonieFile::dump_audio_files(
    const std::string &directory, const std::string &name, bool single_ogg,
    const std::vector<std::string> &tags, const std::vector<std::string> &titles) const {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec)) {
        TF_LOG("error", "export directory " << directory << " does not exist");
        return make_error(ErrorKind::InvalidArgument, "export directory does not exist");
    }
    auto preamble = export_preamble(tags);
    if (!preamble) {
        return preamble.status;
    }
    const std::filesystem::path dir(directory);
    std::vector<std::string> written;

    if (single_ogg) {
        auto head_pages = build_preamble_pages(*preamble, header_.audio_id, 0);
        if (!head_pages) {
            return head_pages.status;
        }
        auto pages = parse_ogg_pages(audio_);
        if (!pages) {
            return pages.status;
        }
        std::vector<OggPage> data_pages;
        for (auto &page : *pages) {
            if (!is_preamble_page(page)) {
                data_pages.push_back(std::move(page));
            }
        }
        if (data_pages.empty()) {
            TF_LOG("error", "stream has no audio pages");
            return make_error(ErrorKind::Format, "stream has no audio pages");
        }
        const auto path = (dir / (name + ".ogg")).string();
        auto status = write_file_atomic(path, standalone_ogg(std::move(*head_pages), data_pages));
        if (!status.ok) {
            return status;
        }
        TF_LOG("info", "stream of " << data_pages.size() << " pages -> " << path);
        written.push_back(path);
        return written;
    }

    auto chapters = extract_raw_chapter_data();
    if (!chapters) {
        return chapters.status;
    }
    for (size_t i = 0; i < chapters->size(); ++i) {
        std::ostringstream file_name;
        file_name << name << " - Track #" << std::setfill('0') << std::setw(2) << (i + 1)
                  << ".ogg";
        OpusPreamble track = *preamble;
        if (i < titles.size()) {
            apply_title(track.tags, titles[i]);
        }
        const auto path = (dir / file_name.str()).string();
        auto status = write_chapter(*chapters, i, path, track);
        if (!status.ok) {
            return status;
        }
        written.push_back(path);
    }
    return written;
}

std::string format_granule(uint64_t granule) {
    const uint64_t time = granule / (kOpusSampleRate / 100);
    std::ostringstream os;
    os << std::setfill('0') << std::setw(2) << time / 100 / 3600 << ':' << std::setw(2)
       << (time / 100 / 60) % 60 << ':' << std::setw(2) << (time / 100) % 60 << '.'
       << std::setw(2) << time % 100;
    return os.str();
}

}  // namespace tonieforge
