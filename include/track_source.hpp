//
//  track_source.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace tonieforge {

/// Already-encoded Ogg pages of one chapter, reused without decoding.
struct RawChapter {
    std::vector<uint8_t> data;
};

/// Audio file to be freshly encoded.
struct NewFile {
    std::string path;
};

using TrackSource = std::variant<RawChapter, NewFile>;

}  // namespace tonieforge
