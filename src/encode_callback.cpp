//
//  encode_callback.cpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "encode_callback.hpp"

#include "logging.hpp"

namespace tonieforge {

void EncodeCallback::file_start(int track, const std::string &name) {
    TF_LOG("info", "track " << track << ": " << name);
}

void EncodeCallback::progress(int percent) { TF_LOG("debug", "progress " << percent << "%"); }

void EncodeCallback::file_done() { TF_LOG("debug", "track done"); }

void EncodeCallback::file_failed(const std::string &message) {
    TF_LOG("warn", "track failed: " << message);
}

void EncodeCallback::failed(const std::string &message) { TF_LOG("error", message); }

void EncodeCallback::warning(const std::string &message) { TF_LOG("warn", message); }

void EncodeCallback::post_processing(const std::string &message) { TF_LOG("info", message); }

bool EncodeCallback::cancelled() const {
    return cancel_requested_.load(std::memory_order_relaxed);
}

}  // namespace tonieforge
