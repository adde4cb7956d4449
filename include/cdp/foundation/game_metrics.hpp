#pragma once

/// @file game_metrics.hpp
/// @brief GameMetrics: named counters and gauges with Prometheus text export.
///
/// The pipeline keeps its hot-path counters as plain integers; this facade
/// is where they are published for diagnostics and capacity tuning.

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace cdp::foundation {

/// Central metrics registry.
///
/// Thread-safe: counters and gauges are atomics created under a mutex on
/// first use.  Non-copyable, movable (PIMPL).
///
/// Example:
/// @code
///   auto& metrics = GameMetrics::instance();
///   metrics.incrementCounter("cdp_ticks_total");
///   metrics.setGauge("cdp_queue_depth", 12.0);
///   std::string prom = metrics.scrape();
/// @endcode
class GameMetrics {
public:
    GameMetrics();
    ~GameMetrics();

    GameMetrics(const GameMetrics&) = delete;
    GameMetrics& operator=(const GameMetrics&) = delete;
    GameMetrics(GameMetrics&&) noexcept;
    GameMetrics& operator=(GameMetrics&&) noexcept;

    // ── Counters ────────────────────────────────────────────────────────

    /// Increment a counter by @p value (default 1), creating it on first use.
    void incrementCounter(std::string_view name, uint64_t value = 1);

    /// Current counter value, 0 if the counter does not exist.
    [[nodiscard]] uint64_t counterValue(std::string_view name) const;

    // ── Gauges ──────────────────────────────────────────────────────────

    void setGauge(std::string_view name, double value);

    /// Current gauge value, 0.0 if the gauge does not exist.
    [[nodiscard]] double gaugeValue(std::string_view name) const;

    // ── Export ──────────────────────────────────────────────────────────

    /// Serialize all metrics in Prometheus text exposition format,
    /// sorted by metric name.
    [[nodiscard]] std::string scrape() const;

    /// Clear all metrics. Intended for tests.
    void reset();

    static GameMetrics& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace cdp::foundation
