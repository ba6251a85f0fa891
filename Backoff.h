#ifndef BACKOFF_H
#define BACKOFF_H

#include <chrono>

// Exponential reconnect delay. Grows by `multiplier` per failure up to `max`;
// after `max_attempts` consecutive failures it stays at `max` indefinitely.
class Backoff {
public:
    Backoff(std::chrono::milliseconds initial, std::chrono::milliseconds max,
            double multiplier = 2.0, unsigned int max_attempts = 6);

    // Delay before the next attempt; counts one failure.
    std::chrono::milliseconds NextDelay();
    void Reset();

    unsigned int Failures() const { return failures_; }
    bool Capped() const { return failures_ >= max_attempts_; }

private:
    std::chrono::milliseconds initial_;
    std::chrono::milliseconds max_;
    double multiplier_;
    unsigned int max_attempts_;
    unsigned int failures_ = 0;
    double current_ms_ = 0.0;
};

#endif // BACKOFF_H
