#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

#include "events/events.h"

namespace nodeward {

/**
 * Coalesces per-chunk byte counts into at most one progress event per
 * interval. Emitted `bytes_received` values are strictly increasing.
 */
class ProgressThrottle {
public:
    using Clock = std::chrono::steady_clock;
    using Sink  = std::function<void(const DownloadProgress&)>;

    ProgressThrottle(std::chrono::milliseconds interval, Sink sink)
        : interval_(interval), sink_(std::move(sink)) {}

    void update(uint64_t received, uint64_t total) {
        auto now = Clock::now();
        if (emitted_ && now - last_emit_ < interval_) return;
        emit(received, total, now);
    }

    /// Always reports the final count unless it was already the last one sent.
    void finish(uint64_t received, uint64_t total) { emit(received, total, Clock::now()); }

    [[nodiscard]] uint64_t last_reported() const { return last_received_; }

private:
    void emit(uint64_t received, uint64_t total, Clock::time_point now) {
        if (emitted_ && received <= last_received_) return;
        emitted_       = true;
        last_received_ = received;
        last_emit_     = now;
        if (sink_) sink_(DownloadProgress{received, total});
    }

    std::chrono::milliseconds interval_;
    Sink                      sink_;
    bool                      emitted_       = false;
    uint64_t                  last_received_ = 0;
    Clock::time_point         last_emit_{};
};

}  // namespace nodeward
