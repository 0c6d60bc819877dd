//
//  tonie_file.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "opus_stream.hpp"
#include "tonie_encoder.hpp"
#include "tonie_header.hpp"
#include "tonie_status.hpp"

namespace tonieforge {

/// Page statistics of an audio region plus the first layout violation found.
struct StreamStatistics {
    size_t pages{0};
    uint64_t total_segments{0};
    uint64_t payload_bytes{0};
    size_t min_segments_per_page{0};
    size_t max_segments_per_page{0};
    uint64_t min_granule_delta{0};
    uint64_t max_granule_delta{0};
    uint64_t highest_granule{0};
    size_t bos_pages{0};
    size_t eos_pages{0};
    std::string first_violation;  ///< Empty when the stream is well formed.
};

/**
 * @brief A Tonie container: the 4096-byte header region followed by the Ogg Opus audio.
 *
 * Files read from disk keep their original header bytes so an unmodified file serializes
 * back to the identical bytes. Any header edit must be followed by update_file_content().
 */
class TonieFile {
   public:
    TonieFile() = default;

    /// Read a container. Without `read_audio` only the header region is loaded.
    static TonieResult<TonieFile> from_file(const std::string &path, bool read_audio = true);
    static TonieResult<TonieFile> from_bytes(const std::vector<uint8_t> &bytes,
                                             bool read_audio = true);

    /// Assemble a container from a header and the audio region it describes.
    static TonieResult<TonieFile> build(const TonieHeader &header, std::vector<uint8_t> audio);
    /// @overload building the header from an encoder or splicer result.
    static TonieResult<TonieFile> build(EncodedAudio encoded);

    const TonieHeader &header() const { return header_; }
    TonieHeader &header() { return header_; }
    const std::vector<uint8_t> &audio() const { return audio_; }
    bool has_audio() const { return has_audio_; }
    /// sha1(audio) matches the stored hash. Only meaningful when the audio was read.
    bool hash_correct() const { return hash_correct_; }

    std::vector<uint8_t> to_bytes() const;
    /// Atomically replace `path` with this container.
    TonieStatus write(const std::string &path) const;

    /// Re-encode the header region from header(); refreshes length and hash from the audio.
    TonieStatus update_file_content();

    /// Move the whole stream to a new audio id (every page serial, header, hash).
    TonieStatus rekey(uint32_t new_audio_id);

    /// Start granule of every chapter followed by the last granule of the stream.
    TonieResult<std::vector<uint64_t>> parse_positions() const;

    TonieResult<StreamStatistics> statistics() const;
    /// `Format` on the first layout violation, `HashMismatch` when the hash is stale.
    TonieStatus validate() const;

    TonieResult<std::vector<std::vector<uint8_t>>> extract_raw_chapter_data() const;

    /**
     * @brief Write one chapter as a standalone Ogg Opus file.
     *
     * The file gets this container's preamble (with `TITLE=` when `title` is not empty),
     * pages renumbered from 2, granules re-based to zero and EOS on the last page.
     */
    TonieStatus write_chapter_to_ogg(size_t index, const std::string &path,
                                     const std::string &title = {}) const;

    /**
     * @brief Export the audio into `directory` as Ogg Opus files; returns the written paths.
     *
     * Each chapter goes to `<name> - Track #NN.ogg` with `titles[i]` as its title, or with
     * `single_ogg` the whole stream to `<name>.ogg` keeping its timeline. `tags` are
     * `KEY=value` comments added to every file's OpusTags.
     */
    TonieResult<std::vector<std::string>> dump_audio_files(
        const std::string &directory, const std::string &name, bool single_ogg,
        const std::vector<std::string> &tags = {},
        const std::vector<std::string> &titles = {}) const;

   private:
    TonieResult<OpusPreamble> export_preamble(const std::vector<std::string> &tags) const;
    TonieStatus write_chapter(const std::vector<std::vector<uint8_t>> &chapters, size_t index,
                              const std::string &path, const OpusPreamble &preamble) const;

    TonieHeader header_;
    std::vector<uint8_t> header_bytes_;
    std::vector<uint8_t> audio_;
    bool has_audio_{false};
    bool hash_correct_{false};
};

/// Granule (48 kHz samples) as `HH:MM:SS.ff` with hundredths.
std::string format_granule(uint64_t granule);

}  // namespace tonieforge
