#pragma once

/// @file simulation_loop.hpp
/// @brief Fixed-rate simulation loop driving the damage pipeline.
///
/// SimulationLoop invokes a step callback at a fixed rate (default
/// 30 Hz) either on a dedicated thread or manually, one step at a time,
/// for headless and deterministic runs.  Every step is timed against
/// the frame budget.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "cdp/foundation/game_result.hpp"

namespace cdp::service {

/// Timing of one simulation step.
struct StepMetrics {
    /// Time spent in the step callback.
    std::chrono::microseconds updateTime{0};

    /// Ratio of updateTime to the frame budget (1.0 = full budget).
    float budgetUtilization = 0.0f;

    /// Step index, starting at 0.
    uint64_t stepNumber = 0;

    /// True when updateTime exceeded the frame budget.
    bool overrun = false;
};

/// Fixed-rate loop.
///
/// Usage:
/// @code
///   SimulationLoop loop(30);
///   loop.setStepCallback([&](uint64_t step, float dt) { pipeline.Tick(); });
///   loop.runSteps(600);   // headless
/// @endcode
///
/// Step callbacks run on exactly one thread at a time; the pipeline
/// behind them is single-threaded.
class SimulationLoop {
public:
    using StepCallback = std::function<void(uint64_t step, float deltaTime)>;
    using MetricsCallback = std::function<void(const StepMetrics&)>;

    static constexpr uint32_t kDefaultTickRate = 30;

    /// @param tickRate  Steps per second; 0 selects the default.
    explicit SimulationLoop(uint32_t tickRate = kDefaultTickRate);

    ~SimulationLoop();

    SimulationLoop(const SimulationLoop&) = delete;
    SimulationLoop& operator=(const SimulationLoop&) = delete;
    SimulationLoop(SimulationLoop&&) = delete;
    SimulationLoop& operator=(SimulationLoop&&) = delete;

    void setStepCallback(StepCallback callback);

    /// Optional observer invoked after every step.
    void setMetricsCallback(MetricsCallback callback);

    /// Run on a dedicated thread until stop().
    /// @return LoopAlreadyRunning if the thread is already active.
    foundation::GameResult<void> start();

    /// Ask the thread to finish and join it.  No-op when not running.
    void stop();

    /// Execute one step on the calling thread.
    /// @pre The loop is not running on its own thread.
    StepMetrics step();

    /// Execute @p count steps back to back on the calling thread,
    /// without sleeping.
    /// @return LoopAlreadyRunning if the thread is active.
    foundation::GameResult<void> runSteps(uint64_t count);

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }
    [[nodiscard]] std::chrono::microseconds frameBudget() const noexcept { return frameBudget_; }
    [[nodiscard]] uint64_t stepCount() const noexcept { return stepCount_.load(); }
    [[nodiscard]] uint64_t overrunCount() const noexcept { return overrunCount_.load(); }

    [[nodiscard]] StepMetrics lastMetrics() const;

private:
    void run();
    StepMetrics executeStep();

    uint32_t tickRate_;
    std::chrono::microseconds frameBudget_;

    StepCallback stepCallback_;
    MetricsCallback metricsCallback_;
    mutable std::mutex callbackMutex_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> stepCount_{0};
    std::atomic<uint64_t> overrunCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    StepMetrics lastMetrics_;
};

}  // namespace cdp::service
