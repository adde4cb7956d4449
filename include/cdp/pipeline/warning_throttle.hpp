#pragma once

/// @file warning_throttle.hpp
/// @brief Aggregates repeated events into at most one report per interval.

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace cdp::pipeline {

/// Interval-based log throttle.
///
/// Record() counts an event and tells the caller whether to report now;
/// when it does, it hands back the number of events aggregated since
/// the previous report.  The first event is always reported.  Flush()
/// lets a periodic caller report a held-back remainder when no further
/// event arrives.
///
/// Example:
/// @code
///   WarningThrottle throttle(std::chrono::seconds(1));
///   if (auto n = throttle.Record()) {
///       log("dropped " + std::to_string(*n) + " requests");
///   }
/// @endcode
class WarningThrottle {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /// @param clock  Time source; defaults to steady_clock::now.
    explicit WarningThrottle(std::chrono::milliseconds interval, Clock clock = nullptr);

    /// Count @p events occurrences.
    /// @return The aggregated count to report, or nullopt to stay quiet.
    [[nodiscard]] std::optional<uint64_t> Record(uint64_t events = 1);

    /// Report events held back by the interval without counting a new one.
    /// @return The pending count once the interval has passed since the
    ///         last report, or nullopt if nothing is pending or it is too soon.
    [[nodiscard]] std::optional<uint64_t> Flush();

    /// Events counted but not yet reported.
    [[nodiscard]] uint64_t Pending() const noexcept { return pending_; }

    /// Reports handed out so far.
    [[nodiscard]] uint64_t Reports() const noexcept { return reports_; }

    [[nodiscard]] std::chrono::milliseconds Interval() const noexcept { return interval_; }

private:
    std::chrono::milliseconds interval_;
    Clock clock_;
    std::optional<TimePoint> lastReport_;
    uint64_t pending_ = 0;
    uint64_t reports_ = 0;
};

}  // namespace cdp::pipeline
