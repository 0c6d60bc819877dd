//
//  audio_id.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <cstdint>
#include <functional>
#include <mutex>

namespace tonieforge {

// Offset subtracted from the timestamp for custom (user-recorded) figurines.
inline constexpr uint32_t kCustomAudioIdOffset = 0x50000000;

/**
 * @brief Issues audio ids derived from the wall clock.
 *
 * Each call returns `max(now, last + 1)`, so ids are strictly increasing even when several
 * are requested within the same second. Safe to share between threads.
 */
class AudioIdGenerator {
   public:
    using Clock = std::function<uint32_t()>;

    AudioIdGenerator();
    explicit AudioIdGenerator(Clock clock);

    /// Next id; with `custom` the custom-figurine offset is subtracted.
    uint32_t next(bool custom = false);

    /// Process-wide instance using the system clock.
    static AudioIdGenerator &shared();

   private:
    Clock clock_;
    std::mutex mutex_;
    uint32_t last_{0};
    bool issued_{false};
};

/// Unix time in seconds, truncated to 32 bits.
uint32_t unix_time_seconds();

}  // namespace tonieforge
