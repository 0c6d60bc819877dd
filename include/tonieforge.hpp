//
//  tonieforge.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "encode_callback.hpp"
#include "lossless_splicer.hpp"
#include "tonie_encoder.hpp"
#include "tonie_file.hpp"
#include "tonie_status.hpp"

namespace tonieforge {

/// @defgroup api TonieForge Public API
/// Public, supported C++ interfaces for building and modifying Tonie files.
/// @{

/**
 * @brief Return the TonieForge library version string.
 *
 * Follows the same formatting as the build banner (e.g. `v0.3` or `v0.3+abcd123`).
 */
std::string version_string();  ///< @ingroup api

/// One entry of a job's `tracks` array: a chapter of the source file or a new audio file.
struct JobTrack {
    std::optional<size_t> chapter;
    std::string file;  ///< Resolved against the job file's directory.
};

/// Parsed encode job.
struct EncodeJob {
    uint32_t audio_id{0};  ///< 0 draws a fresh id.
    EncodeOptions options;
    std::string source_tonie;  ///< Resolved path; required when any track names a chapter.
    std::vector<JobTrack> tracks;
};

/**
 * @brief Load an encode job from JSON.
 *
 * Keys: `audio_id`, `custom_audio_id`, `bitrate` (kbit/s), `vbr`, `on_track_failure`
 * ("abort" or "skip"), `prefix_directory`, `log_level`, `source_tonie` and `tracks`
 * (`{"chapter": n}` or `{"file": path}`). A present `log_level` is applied immediately.
 */
TonieResult<EncodeJob> load_encode_job(const std::string &job_path);  ///< @ingroup api

/// Run a loaded job and atomically write the resulting Tonie file.
TonieStatus run_encode_job(const EncodeJob &job, const std::string &output_path,
                           EncodeCallback *callback = nullptr);  ///< @ingroup api

/// load_encode_job() followed by run_encode_job().
TonieStatus encode_from_json(const std::string &job_path, const std::string &output_path,
                             EncodeCallback *callback = nullptr);  ///< @ingroup api

/// @}

}  // namespace tonieforge
