//
//  tonie_status.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "tonie_status.hpp"

namespace tonieforge {

const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Format:
        return "format";
    case ErrorKind::CorruptHeader:
        return "corrupt-header";
    case ErrorKind::HashMismatch:
        return "hash-mismatch";
    case ErrorKind::PerTrackEncode:
        return "per-track-encode";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::InvalidArgument:
        return "invalid-argument";
    case ErrorKind::Internal:
        return "internal";
    }
    return "unknown";
}

}  // namespace tonieforge
