/// @file simulation_loop.cpp
/// @brief SimulationLoop implementation.

#include "cdp/service/simulation_loop.hpp"

#include <string>
#include <utility>

#include "cdp/foundation/game_logger.hpp"

namespace cdp::service {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

SimulationLoop::SimulationLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      frameBudget_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

SimulationLoop::~SimulationLoop() {
    stop();
}

void SimulationLoop::setStepCallback(StepCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    stepCallback_ = std::move(callback);
}

void SimulationLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

GameResult<void> SimulationLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoopAlreadyRunning, "simulation loop already running"));
    }

    CDP_LOG_INFO(LogCategory::Simulation,
                 "simulation loop started at " + std::to_string(tickRate_) + " Hz");
    thread_ = std::thread([this] { run(); });
    return GameResult<void>::ok();
}

void SimulationLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
        CDP_LOG_INFO(LogCategory::Simulation,
                     "simulation loop stopped after " + std::to_string(stepCount()) +
                         " steps (" + std::to_string(overrunCount()) + " overruns)");
    }
}

StepMetrics SimulationLoop::step() {
    return executeStep();
}

GameResult<void> SimulationLoop::runSteps(uint64_t count) {
    if (running_.load()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoopAlreadyRunning,
                      "cannot run manual steps while the loop thread is active")
                .withTick(stepCount()));
    }
    for (uint64_t i = 0; i < count; ++i) {
        executeStep();
    }
    return GameResult<void>::ok();
}

StepMetrics SimulationLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void SimulationLoop::run() {
    auto nextStep = std::chrono::steady_clock::now();

    while (running_.load()) {
        nextStep += frameBudget_;

        executeStep();

        // Sleep until the next step; after an overrun, restart the
        // schedule instead of bursting to catch up.
        auto now = std::chrono::steady_clock::now();
        if (now < nextStep) {
            std::this_thread::sleep_until(nextStep);
        } else {
            nextStep = now;
        }
    }
}

StepMetrics SimulationLoop::executeStep() {
    const auto stepStart = std::chrono::steady_clock::now();
    const auto stepNumber = stepCount_.load();

    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (stepCallback_) {
            const auto dtSeconds = static_cast<float>(frameBudget_.count()) / 1'000'000.0f;
            stepCallback_(stepNumber, dtSeconds);
        }
    }

    const auto updateTime = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - stepStart);

    StepMetrics metrics;
    metrics.updateTime = updateTime;
    metrics.budgetUtilization =
        static_cast<float>(updateTime.count()) / static_cast<float>(frameBudget_.count());
    metrics.stepNumber = stepNumber;
    metrics.overrun = updateTime > frameBudget_;
    stepCount_.fetch_add(1);

    if (metrics.overrun) {
        overrunCount_.fetch_add(1);
        CDP_LOG_DEBUG(LogCategory::Simulation,
                      "step " + std::to_string(stepNumber) + " overran its budget (" +
                          std::to_string(updateTime.count()) + "us of " +
                          std::to_string(frameBudget_.count()) + "us)");
    }

    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        lastMetrics_ = metrics;
    }
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (metricsCallback_) {
            metricsCallback_(metrics);
        }
    }
    return metrics;
}

}  // namespace cdp::service
