//
//  encode_callback.hpp
//  TonieForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <atomic>
#include <string>

namespace tonieforge {

/**
 * @brief Progress and failure reporting for encode and splice runs.
 *
 * The default implementation logs every event through TF_LOG. `cancelled()` is polled
 * between tracks and between PCM chunks; returning true aborts the run with `Cancelled`.
 */
class EncodeCallback {
   public:
    virtual ~EncodeCallback() = default;

    /// `track` is 1-based.
    virtual void file_start(int track, const std::string &name);
    virtual void progress(int percent);
    virtual void file_done();
    virtual void file_failed(const std::string &message);
    virtual void failed(const std::string &message);
    virtual void warning(const std::string &message);
    virtual void post_processing(const std::string &message);
    virtual bool cancelled() const;

    /// Request cooperative cancellation; may be called from another thread.
    void cancel() { cancel_requested_.store(true, std::memory_order_relaxed); }

   private:
    std::atomic<bool> cancel_requested_{false};
};

}  // namespace tonieforge
