#pragma once

#include <chrono>
#include <cstdint>

// Monotonic time base shared by every capture source of a run. All chunk
// timestamps are milliseconds since the anchor was created.
class ClockAnchor {
public:
    using Clock = std::chrono::steady_clock;

    ClockAnchor() : epoch_(Clock::now()) {}

    int64_t now_ms() const {
        return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - epoch_).count();
    }

    // Absolute time point for an anchor-relative timestamp, for sleep_until.
    Clock::time_point at(int64_t ms) const {
        return epoch_ + std::chrono::milliseconds(ms);
    }

private:
    Clock::time_point epoch_;
};
