//
//  audio_id.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "audio_id.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

#include "logging.hpp"

namespace tonieforge {

uint32_t unix_time_seconds() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

AudioIdGenerator::AudioIdGenerator() : clock_(unix_time_seconds) {}

AudioIdGenerator::AudioIdGenerator(Clock clock) : clock_(std::move(clock)) {}

uint32_t AudioIdGenerator::next(bool custom) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint32_t id = clock_();
    if (issued_) {
        id = std::max(id, last_ + 1);
    }
    last_ = id;
    issued_ = true;
    if (custom) {
        id -= kCustomAudioIdOffset;
    }
    TF_LOG("debug", "issued audio id 0x" << std::hex << id << std::dec
                                          << (custom ? " (custom)" : ""));
    return id;
}

AudioIdGenerator &AudioIdGenerator::shared() {
    static AudioIdGenerator generator;
    return generator;
}

}  // namespace tonieforge
