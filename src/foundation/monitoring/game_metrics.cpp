/// @file game_metrics.cpp
/// @brief In-memory implementation of GameMetrics.

#include "cdp/foundation/game_metrics.hpp"

#include <atomic>
#include <cmath>
#include <map>
#include <mutex>
#include <sstream>
#include <unordered_map>

namespace cdp::foundation {

namespace {

// Format a double for Prometheus output, removing unnecessary trailing zeros.
std::string formatDouble(double value) {
    if (std::isinf(value)) {
        return value > 0 ? "+Inf" : "-Inf";
    }
    if (std::isnan(value)) {
        return "NaN";
    }
    std::ostringstream oss;
    oss << value;
    return oss.str();
}

}  // namespace

struct GameMetrics::Impl {
    // Map insertion is mutex-guarded; updates to an existing entry are
    // lock-free once the node exists (unordered_map nodes are stable).
    mutable std::mutex counterMutex;
    std::unordered_map<std::string, std::atomic<uint64_t>> counters;

    mutable std::mutex gaugeMutex;
    std::unordered_map<std::string, std::atomic<double>> gauges;

    std::atomic<uint64_t>& counter(std::string_view name) {
        std::lock_guard lock(counterMutex);
        auto it = counters.find(std::string(name));
        if (it == counters.end()) {
            it = counters.try_emplace(std::string(name), 0).first;
        }
        return it->second;
    }

    std::atomic<double>& gauge(std::string_view name) {
        std::lock_guard lock(gaugeMutex);
        auto it = gauges.find(std::string(name));
        if (it == gauges.end()) {
            it = gauges.try_emplace(std::string(name), 0.0).first;
        }
        return it->second;
    }
};

GameMetrics::GameMetrics() : impl_(std::make_unique<Impl>()) {}

GameMetrics::~GameMetrics() = default;

GameMetrics::GameMetrics(GameMetrics&&) noexcept = default;
GameMetrics& GameMetrics::operator=(GameMetrics&&) noexcept = default;

void GameMetrics::incrementCounter(std::string_view name, uint64_t value) {
    impl_->counter(name).fetch_add(value, std::memory_order_relaxed);
}

uint64_t GameMetrics::counterValue(std::string_view name) const {
    std::lock_guard lock(impl_->counterMutex);
    auto it = impl_->counters.find(std::string(name));
    return it == impl_->counters.end()
        ? 0
        : it->second.load(std::memory_order_relaxed);
}

void GameMetrics::setGauge(std::string_view name, double value) {
    impl_->gauge(name).store(value, std::memory_order_release);
}

double GameMetrics::gaugeValue(std::string_view name) const {
    std::lock_guard lock(impl_->gaugeMutex);
    auto it = impl_->gauges.find(std::string(name));
    return it == impl_->gauges.end()
        ? 0.0
        : it->second.load(std::memory_order_acquire);
}

std::string GameMetrics::scrape() const {
    // Sorted output keeps scrapes diffable between runs.
    std::map<std::string, std::string> counters;
    std::map<std::string, std::string> gauges;
    {
        std::lock_guard lock(impl_->counterMutex);
        for (const auto& [name, value] : impl_->counters) {
            counters.emplace(name, std::to_string(value.load(std::memory_order_relaxed)));
        }
    }
    {
        std::lock_guard lock(impl_->gaugeMutex);
        for (const auto& [name, value] : impl_->gauges) {
            gauges.emplace(name, formatDouble(value.load(std::memory_order_acquire)));
        }
    }

    std::ostringstream out;
    for (const auto& [name, value] : counters) {
        out << "# TYPE " << name << " counter\n" << name << ' ' << value << '\n';
    }
    for (const auto& [name, value] : gauges) {
        out << "# TYPE " << name << " gauge\n" << name << ' ' << value << '\n';
    }
    return out.str();
}

void GameMetrics::reset() {
    {
        std::lock_guard lock(impl_->counterMutex);
        impl_->counters.clear();
    }
    std::lock_guard lock(impl_->gaugeMutex);
    impl_->gauges.clear();
}

GameMetrics& GameMetrics::instance() {
    static GameMetrics inst;
    return inst;
}

} // namespace cdp::foundation
