#pragma once

#include <algorithm>
#include <chrono>

// Doubling retry delay with a ceiling. After k failures without a success in
// between, current() == min(initial * 2^k, max).
class Backoff {
public:
    using duration = std::chrono::milliseconds;

    Backoff(duration initial, duration max)
        : initial_(initial), max_(std::max(initial, max)), current_(initial) {}

    duration current() const { return current_; }

    // Doubles the delay for the next retry and returns it.
    duration next() {
        current_ = std::min(current_ * 2, max_);
        return current_;
    }

    void reset() { current_ = initial_; }

private:
    duration initial_;
    duration max_;
    duration current_;
};
