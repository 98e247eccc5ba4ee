#pragma once

#include <chrono>
#include <mutex>
#include <cstddef>

namespace console_progress {
namespace progress {

using Clock = std::chrono::steady_clock;

struct ProgressSnapshot {
    double fraction;
    Clock::time_point start_time;
};

// Latest reported fraction plus the clock and spinner counters derived from
// it. Written by host threads, read by the render thread.
class ProgressState {
public:
    ProgressState();

    // Clamps into [0, 1]; NaN counts as 0. Values at either end restart the
    // runtime clock.
    void report(double value);

    ProgressSnapshot snapshot() const;

    // Returns the current animation index and moves to the next one.
    size_t advanceAnimation();
    size_t animationIndex() const;

    static double clamp(double value);

private:
    mutable std::mutex mutex_;
    double fraction_ = 0.0;
    Clock::time_point start_time_;
    size_t animation_index_ = 0;
};

}}
