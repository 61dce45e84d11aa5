#pragma once

#include "dxwatch/types.hpp"

#include <chrono>
#include <deque>

namespace dxwatch {
namespace spots {

// Spots per sliding window (default: spots in the last minute)
class SpotRateMeter {
public:
    explicit SpotRateMeter(std::chrono::seconds window = std::chrono::seconds(60))
        : window_(window) {}

    void record(TimePoint when) {
        arrivals_.push_back(when);
    }

    // Drops arrivals older than the window, returns how many remain
    size_t rate(TimePoint now) {
        while (!arrivals_.empty() && now - arrivals_.front() > window_) {
            arrivals_.pop_front();
        }
        return arrivals_.size();
    }

    void clear() { arrivals_.clear(); }

private:
    std::chrono::seconds window_;
    std::deque<TimePoint> arrivals_;   // oldest first
};

} // namespace spots
} // namespace dxwatch
