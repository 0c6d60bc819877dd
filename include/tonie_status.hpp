//
//  tonie_status.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace tonieforge {

/// @ingroup api
/// Failure classes reported by the library.
enum class ErrorKind {
    None = 0,
    Format,           ///< Ogg capture pattern missing, truncated segment table, bad chapter map.
    CorruptHeader,    ///< Declared header length is not 0xFFC or the header is malformed.
    HashMismatch,     ///< Stored SHA1 does not match the audio bytes.
    PerTrackEncode,   ///< One source track failed to decode/resample/encode.
    Io,               ///< Open/read/write/rename failure.
    Cancelled,        ///< EncodeCallback::cancelled() returned true.
    InvalidArgument,  ///< Bad caller input.
    Internal,         ///< Library invariant violated.
};

const char *error_kind_name(ErrorKind kind);

/**
 * @brief Result object with success flag, failure class and optional error message.
 *
 * When `ok == true`, `kind` is `ErrorKind::None` and `message` is empty.
 */
struct TonieStatus {
    bool ok{false};
    ErrorKind kind{ErrorKind::None};
    std::string message;
};

inline TonieStatus make_ok() { return TonieStatus{true, ErrorKind::None, {}}; }

inline TonieStatus make_error(ErrorKind kind, std::string msg) {
    return TonieStatus{false, kind, std::move(msg)};
}

/// Status plus value; `value` is engaged exactly when `status.ok`.
template <typename T>
struct TonieResult {
    TonieStatus status;
    std::optional<T> value;

    TonieResult(T v) : status(make_ok()), value(std::move(v)) {}
    TonieResult(TonieStatus s) : status(std::move(s)) {}

    bool ok() const { return status.ok; }
    explicit operator bool() const { return status.ok; }

    T &operator*() { return *value; }
    const T &operator*() const { return *value; }
    T *operator->() { return &*value; }
    const T *operator->() const { return &*value; }
};

}  // namespace tonieforge
