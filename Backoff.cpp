#include "Backoff.h"
#include <algorithm>

Backoff::Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max,
                 double multiplier, unsigned int max_attempts)
    : initial_(std::max(std::chrono::milliseconds(1), initial)),
      max_(std::max(initial_, max)),
      multiplier_(std::max(1.0, multiplier)),
      max_attempts_(max_attempts) {}

std::chrono::milliseconds Backoff::NextDelay() {
    const double max_ms = static_cast<double>(max_.count());
    if (failures_ == 0) {
        current_ms_ = static_cast<double>(initial_.count());
    } else if (failures_ >= max_attempts_) {
        current_ms_ = max_ms;
    } else {
        current_ms_ = std::min(max_ms, current_ms_ * multiplier_);
    }
    ++failures_;
    return std::chrono::milliseconds(static_cast<long long>(current_ms_));
}

void Backoff::Reset() {
    failures_ = 0;
    current_ms_ = 0.0;
}
