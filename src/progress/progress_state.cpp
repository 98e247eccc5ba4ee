#include "console_progress/progress/progress_state.hpp"
#include "console_progress/common/constants.hpp"
#include <algorithm>
#include <cmath>

namespace console_progress {
namespace progress {

ProgressState::ProgressState()
    : start_time_(Clock::now()) {}

double ProgressState::clamp(double value) {
    if (std::isnan(value)) {
        return 0.0;
    }
    return std::max(0.0, std::min(1.0, value));
}

void ProgressState::report(double value) {
    double clamped = clamp(value);
    bool restart = clamped < constants::render::RESTART_LOW_THRESHOLD ||
                   clamped > constants::render::RESTART_HIGH_THRESHOLD;
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    fraction_ = clamped;
    if (restart) {
        start_time_ = now;
    }
}

ProgressSnapshot ProgressState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ProgressSnapshot{fraction_, start_time_};
}

size_t ProgressState::advanceAnimation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return animation_index_++;
}

size_t ProgressState::animationIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return animation_index_;
}

}}
