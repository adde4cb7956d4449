/// @file warning_throttle.cpp
/// @brief WarningThrottle implementation.

#include "cdp/pipeline/warning_throttle.hpp"

#include <utility>

namespace cdp::pipeline {

WarningThrottle::WarningThrottle(std::chrono::milliseconds interval, Clock clock)
    : interval_(interval), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

std::optional<uint64_t> WarningThrottle::Record(uint64_t events) {
    pending_ += events;

    const auto now = clock_();
    if (lastReport_ && now - *lastReport_ < interval_) {
        return std::nullopt;
    }

    lastReport_ = now;
    ++reports_;
    return std::exchange(pending_, 0);
}

std::optional<uint64_t> WarningThrottle::Flush() {
    if (pending_ == 0) {
        return std::nullopt;
    }

    const auto now = clock_();
    if (lastReport_ && now - *lastReport_ < interval_) {
        return std::nullopt;
    }

    lastReport_ = now;
    ++reports_;
    return std::exchange(pending_, 0);
}

}  // namespace cdp::pipeline
