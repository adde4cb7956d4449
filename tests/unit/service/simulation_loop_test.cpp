/// @file simulation_loop_test.cpp
/// @brief Unit tests for SimulationLoop.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "cdp/service/simulation_loop.hpp"
#include "mock_logger.hpp"

using namespace cdp::service;
using namespace std::chrono_literals;
using cdp::foundation::ErrorCode;

class SimulationLoopTest : public cdp::test::LoggingTest {
protected:
    SimulationLoop loop_{20};  // 20 Hz
};

TEST_F(SimulationLoopTest, TickRateAndBudget) {
    EXPECT_EQ(loop_.tickRate(), 20u);
    EXPECT_EQ(loop_.frameBudget(), 50000us);
}

TEST_F(SimulationLoopTest, DefaultIsThirtyHertz) {
    SimulationLoop defaulted;
    EXPECT_EQ(defaulted.tickRate(), 30u);
    // 1'000'000 / 30 = 33333 us
    EXPECT_EQ(defaulted.frameBudget().count(), 33333);
}

TEST_F(SimulationLoopTest, ZeroTickRateSelectsDefault) {
    SimulationLoop zeroRate(0);
    EXPECT_EQ(zeroRate.tickRate(), SimulationLoop::kDefaultTickRate);
}

TEST_F(SimulationLoopTest, InitialState) {
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_EQ(loop_.stepCount(), 0u);
    EXPECT_EQ(loop_.overrunCount(), 0u);
}

TEST_F(SimulationLoopTest, ManualStepPassesIndexAndDelta) {
    std::vector<uint64_t> steps;
    float receivedDt = 0.0f;
    loop_.setStepCallback([&](uint64_t step, float dt) {
        steps.push_back(step);
        receivedDt = dt;
    });

    auto first = loop_.step();
    auto second = loop_.step();

    EXPECT_EQ(first.stepNumber, 0u);
    EXPECT_EQ(second.stepNumber, 1u);
    EXPECT_EQ(steps, (std::vector<uint64_t>{0, 1}));
    EXPECT_NEAR(receivedDt, 0.05f, 0.001f);  // 20Hz -> 50ms
    EXPECT_EQ(loop_.stepCount(), 2u);
}

TEST_F(SimulationLoopTest, StepWithoutCallbackStillCounts) {
    auto metrics = loop_.step();
    EXPECT_EQ(metrics.stepNumber, 0u);
    EXPECT_GE(metrics.updateTime.count(), 0);
    EXPECT_EQ(loop_.stepCount(), 1u);
}

TEST_F(SimulationLoopTest, RunStepsExecutesExactCount) {
    int calls = 0;
    loop_.setStepCallback([&](uint64_t, float) { ++calls; });

    ASSERT_TRUE(loop_.runSteps(25).hasValue());
    EXPECT_EQ(calls, 25);
    EXPECT_EQ(loop_.stepCount(), 25u);
    EXPECT_EQ(loop_.lastMetrics().stepNumber, 24u);
}

TEST_F(SimulationLoopTest, RunStepsDoesNotSleep) {
    // 200 steps at 20 Hz would take 10s of wall time if paced.
    auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(loop_.runSteps(200).hasValue());
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
}

TEST_F(SimulationLoopTest, MetricsCallbackSeesEveryStep) {
    std::vector<uint64_t> observed;
    loop_.setMetricsCallback([&](const StepMetrics& m) { observed.push_back(m.stepNumber); });

    ASSERT_TRUE(loop_.runSteps(3).hasValue());
    EXPECT_EQ(observed, (std::vector<uint64_t>{0, 1, 2}));
}

TEST_F(SimulationLoopTest, OverrunDetection) {
    loop_.setStepCallback([](uint64_t, float) {
        // Exceeds the 50ms budget.
        std::this_thread::sleep_for(60ms);
    });

    auto metrics = loop_.step();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0f);
    EXPECT_EQ(loop_.overrunCount(), 1u);
}

TEST_F(SimulationLoopTest, FastStepIsNotOverrun) {
    loop_.setStepCallback([](uint64_t, float) {});

    auto metrics = loop_.step();
    EXPECT_FALSE(metrics.overrun);
    EXPECT_LT(metrics.budgetUtilization, 1.0f);
    EXPECT_EQ(loop_.overrunCount(), 0u);
}

TEST_F(SimulationLoopTest, StartAndStopLifecycle) {
    std::atomic<int> calls{0};
    loop_.setStepCallback([&](uint64_t, float) { calls.fetch_add(1); });

    ASSERT_TRUE(loop_.start().hasValue());
    EXPECT_TRUE(loop_.isRunning());

    std::this_thread::sleep_for(250ms);
    loop_.stop();

    EXPECT_FALSE(loop_.isRunning());
    // At 20Hz, ~250ms should yield at least 2 steps (generous for CI).
    EXPECT_GE(calls.load(), 2);
    EXPECT_GT(loop_.lastMetrics().stepNumber, 0u);
}

TEST_F(SimulationLoopTest, DoubleStartIsRefused) {
    ASSERT_TRUE(loop_.start().hasValue());

    auto again = loop_.start();
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::LoopAlreadyRunning);
    loop_.stop();
}

TEST_F(SimulationLoopTest, RunStepsRefusedWhileThreadActive) {
    ASSERT_TRUE(loop_.start().hasValue());

    auto result = loop_.runSteps(5);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::LoopAlreadyRunning);
    EXPECT_TRUE(result.error().tick().has_value());
    loop_.stop();
}

TEST_F(SimulationLoopTest, StopWhenNotRunningIsSafe) {
    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(SimulationLoopTest, DestructorStopsRunningLoop) {
    auto loop = std::make_unique<SimulationLoop>(20);
    loop->setStepCallback([](uint64_t, float) {});
    ASSERT_TRUE(loop->start().hasValue());
    EXPECT_TRUE(loop->isRunning());
    loop.reset();
}
