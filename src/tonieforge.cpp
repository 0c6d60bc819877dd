//
//  tonieforge.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//
#include "tonieforge.hpp"
#include "tonieforge_version.hpp"

#include <cerrno>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>
#include <utility>

#include "logging.hpp"
#include "track_source.hpp"

using json = nlohmann::json;

namespace tonieforge {

std::string version_string() { return TONIEFORGE_VERSION_DISPLAY; }

namespace {

// Accepts a number or a hex string such as "500304E0" / "0x500304E0".
bool read_audio_id(const json &value, uint32_t &out) {
    if (value.is_number_unsigned()) {
        const auto v = value.get<uint64_t>();
        if (v > UINT32_MAX) {
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text.empty()) {
            return false;
        }
        size_t used = 0;
        unsigned long long v = 0;
        try {
            v = std::stoull(text, &used, 16);
        } catch (const std::exception &) {
            return false;
        }
        if (used != text.size() || v > UINT32_MAX) {
            return false;
        }
        out = static_cast<uint32_t>(v);
        return true;
    }
    return false;
}

TonieStatus job_error(const std::string &job_path, const std::string &what) {
    const std::string msg = "job " + job_path + ": " + what;
    TF_LOG("error", msg);
    return make_error(ErrorKind::InvalidArgument, msg);
}

}  // namespace

TonieResult<EncodeJob> load_encode_job(const std::string &job_path) {
    std::ifstream f(job_path);
    if (!f.is_open()) {
        TF_LOG("error", "open failed for " << job_path << " errno=" << errno << " ("
                                           << std::generic_category().message(errno) << ")");
        return make_error(ErrorKind::Io, "cannot open " + job_path);
    }
    const json j = json::parse(f, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return job_error(job_path, "not a JSON object");
    }
    auto resolve_path = [&](const std::string &p) {
        auto base = std::filesystem::path(job_path).parent_path();
        return (p.empty() ? std::filesystem::path() : base / p).string();
    };

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return job_error(job_path, "log_level must be a string");
        }
        set_log_verbosity(parse_log_verbosity(j["log_level"].get<std::string>()));
    }

    EncodeJob job;
    if (j.contains("audio_id") && !read_audio_id(j["audio_id"], job.audio_id)) {
        return job_error(job_path, "audio_id must be a 32-bit number or hex string");
    }
    if (j.contains("bitrate")) {
        if (!j["bitrate"].is_number_integer() || j["bitrate"].get<int>() <= 0) {
            return job_error(job_path, "bitrate must be a positive integer (kbit/s)");
        }
        job.options.bitrate_kbps = j["bitrate"].get<int>();
    }
    if (j.contains("vbr") && !j["vbr"].is_boolean()) {
        return job_error(job_path, "vbr must be a boolean");
    }
    job.options.vbr = j.value("vbr", false);
    if (j.contains("custom_audio_id") && !j["custom_audio_id"].is_boolean()) {
        return job_error(job_path, "custom_audio_id must be a boolean");
    }
    job.options.custom_audio_id = j.value("custom_audio_id", false);

    const std::string policy = j.value("on_track_failure", std::string("abort"));
    if (policy == "abort") {
        job.options.on_track_failure = FailurePolicy::Abort;
    } else if (policy == "skip") {
        job.options.on_track_failure = FailurePolicy::Skip;
    } else {
        return job_error(job_path, "on_track_failure must be \"abort\" or \"skip\"");
    }
    job.options.prefix_directory = resolve_path(j.value("prefix_directory", std::string()));
    job.source_tonie = resolve_path(j.value("source_tonie", std::string()));

    if (!j.contains("tracks") || !j["tracks"].is_array() || j["tracks"].empty()) {
        return job_error(job_path, "tracks must be a non-empty array");
    }
    job.tracks.reserve(j["tracks"].size());
    for (const auto &t : j["tracks"]) {
        JobTrack track;
        if (t.is_object() && t.contains("chapter") && t["chapter"].is_number_unsigned()) {
            track.chapter = t["chapter"].get<size_t>();
        } else if (t.is_object() && t.contains("file") && t["file"].is_string() &&
                   !t["file"].get<std::string>().empty()) {
            track.file = resolve_path(t["file"].get<std::string>());
        } else {
            return job_error(job_path, "track " + std::to_string(job.tracks.size() + 1) +
                                           " needs \"chapter\" or \"file\"");
        }
        if (track.chapter && job.source_tonie.empty()) {
            return job_error(job_path, "chapter tracks need source_tonie");
        }
        job.tracks.push_back(std::move(track));
    }
    TF_LOG("debug", "job: tracks=" << job.tracks.size() << " bitrate="
                                   << job.options.bitrate_kbps << " vbr=" << job.options.vbr
                                   << " policy=" << policy);
    return job;
}

TonieStatus run_encode_job(const EncodeJob &job, const std::string &output_path,
                           EncodeCallback *callback) {
    std::optional<std::vector<std::vector<uint8_t>>> chapters;
    std::vector<TrackSource> sources;
    sources.reserve(job.tracks.size());
    for (const auto &track : job.tracks) {
        if (!track.chapter) {
            sources.emplace_back(NewFile{track.file});
            continue;
        }
        if (!chapters) {
            auto source = TonieFile::from_file(job.source_tonie, true);
            if (!source) {
                return source.status;
            }
            if (!source->hash_correct()) {
                TF_LOG("warn", "source " << job.source_tonie << " has a stale hash");
            }
            auto extracted = source->extract_raw_chapter_data();
            if (!extracted) {
                return extracted.status;
            }
            chapters = std::move(*extracted);
        }
        if (*track.chapter >= chapters->size()) {
            TF_LOG("error", "chapter " << *track.chapter << " requested, source has "
                                       << chapters->size());
            return make_error(ErrorKind::InvalidArgument,
                              "chapter " + std::to_string(*track.chapter) + " out of range");
        }
        sources.emplace_back(RawChapter{(*chapters)[*track.chapter]});
    }

    auto audio = encode_hybrid(sources, job.audio_id, job.options, callback);
    if (!audio) {
        return audio.status;
    }
    auto file = TonieFile::build(std::move(*audio));
    if (!file) {
        return file.status;
    }
    auto written = file->write(output_path);
    if (!written.ok) {
        return written;
    }
    TF_LOG("info", "wrote " << output_path << " (" << file->audio().size()
                            << " audio bytes, audio id 0x" << std::hex
                            << file->header().audio_id << std::dec << ")");
    return make_ok();
}

TonieStatus encode_from_json(const std::string &job_path, const std::string &output_path,
                             EncodeCallback *callback) {
    auto job = load_encode_job(job_path);
    if (!job) {
        return job.status;
    }
    return run_encode_job(*job, output_path, callback);
}

}  // namespace tonieforge
