//
//  logging.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include <cstdint>

namespace tonieforge {

enum class LogVerbosity { Error = 0, Warn = 1, Info = 2, Debug = 3 };

// Set/get global logging verbosity.
void set_log_verbosity(LogVerbosity level);
LogVerbosity get_log_verbosity();

// Parse "error"/"warn"/"info"/"debug" (as used in job files); unknown strings map to Info.
LogVerbosity parse_log_verbosity(std::string_view level);

// Hex-preview helper used in debug logs to dump a short prefix of binary blobs (page headers,
// hashes).
inline constexpr size_t kHexPreviewBytes = 8;
inline std::string hex_prefix(const std::vector<uint8_t>& data,
                              size_t max_len = kHexPreviewBytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    const size_t limit = std::min(max_len, data.size());
    for (size_t i = 0; i < limit; ++i) {
        oss << std::setw(2) << static_cast<unsigned int>(data[i]);
        if (i + 1 != limit) {
            oss << ' ';
        }
    }
    return oss.str();
}

}  // namespace tonieforge

inline constexpr tonieforge::LogVerbosity tf_severity_for_tag(std::string_view tag) {
    if (tag == "error") {
        return tonieforge::LogVerbosity::Error;
    }
    if (tag == "warn" || tag == "warning") {
        return tonieforge::LogVerbosity::Warn;
    }
    if (tag == "info") {
        return tonieforge::LogVerbosity::Info;
    }
    // Everything else (ogg/header/splice/etc.) treated as debug-level.
    return tonieforge::LogVerbosity::Debug;
}

inline bool tf_should_log(const char* level) {
    const auto current = tonieforge::get_log_verbosity();
    const auto sev = tf_severity_for_tag(level ? level : "");
    return static_cast<int>(sev) <= static_cast<int>(current);
}

inline void tf_log_impl(const char* level, const std::string& msg, const char* file, int line,
                        const char* func) {
    std::string lvl(level ? level : "");
    if (lvl == "error") {
        std::cerr << "[TonieForge][" << level << "][" << file << ":" << line << " " << func
                  << "] " << msg << std::endl;
    } else {
        std::cerr << "[TonieForge][" << level << "] " << msg << std::endl;
    }
}

#define TF_LOG(level, message)                                              \
    do {                                                                    \
        if (tf_should_log(level)) {                                         \
            std::ostringstream _tf_log_ss;                                  \
            _tf_log_ss << message;                                          \
            tf_log_impl(level, _tf_log_ss.str(), __FILE__, __LINE__,        \
                        __func__);                                          \
        }                                                                   \
    } while (0)

// Internal invariant check. A failure means the library itself produced an inconsistent
// stream; it is logged and raised as std::logic_error, never returned as a user error.
#define TF_ENSURE(cond, message)                                            \
    do {                                                                    \
        if (!(cond)) {                                                      \
            std::ostringstream _tf_ensure_ss;                               \
            _tf_ensure_ss << "invariant violated: " #cond " (" << message   \
                          << ")";                                           \
            tf_log_impl("error", _tf_ensure_ss.str(), __FILE__, __LINE__,   \
                        __func__);                                          \
            throw std::logic_error(_tf_ensure_ss.str());                    \
        }                                                                   \
    } while (0)
