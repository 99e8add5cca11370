/// @file tick_loop_test.cpp
/// @brief Unit tests for TickLoop.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>

#include "rse/service/tick_loop.hpp"

using namespace rse::service;
using namespace std::chrono_literals;

class TickLoopTest : public ::testing::Test {
protected:
    TickLoop loop_{20};  // 20 Hz
};

TEST_F(TickLoopTest, DefaultTickRate) {
    EXPECT_EQ(loop_.tickRate(), 20u);
    EXPECT_EQ(loop_.targetFrameTime(), 50000us);
    EXPECT_DOUBLE_EQ(loop_.tickInterval(), 0.05);
}

TEST_F(TickLoopTest, CustomTickRate) {
    TickLoop custom(60);
    EXPECT_EQ(custom.tickRate(), 60u);
    // 1'000'000 / 60 = 16666 us
    EXPECT_EQ(custom.targetFrameTime().count(), 16666);
}

TEST_F(TickLoopTest, ZeroTickRateDefaultsToTwenty) {
    TickLoop zeroRate(0);
    EXPECT_EQ(zeroRate.tickRate(), 20u);
}

TEST_F(TickLoopTest, NotRunningByDefault) {
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_EQ(loop_.tickCount(), 0u);
}

TEST_F(TickLoopTest, ManualTickReturnsMetrics) {
    auto first = loop_.tick();
    auto second = loop_.tick();

    EXPECT_EQ(first.tickNumber, 0u);
    EXPECT_EQ(second.tickNumber, 1u);
    EXPECT_EQ(loop_.tickCount(), 2u);
    EXPECT_GE(first.updateTime.count(), 0);
    EXPECT_GE(first.budgetUtilization, 0.0);
}

TEST_F(TickLoopTest, TickCallbackReceivesInterval) {
    int callCount = 0;
    double receivedDt = 0.0;

    loop_.setTickCallback([&](double dt) {
        ++callCount;
        receivedDt = dt;
        return true;
    });

    (void)loop_.tick();

    EXPECT_EQ(callCount, 1);
    EXPECT_DOUBLE_EQ(receivedDt, 0.05);
}

TEST_F(TickLoopTest, MetricsCallbackNotCalledOnManualTick) {
    int metricsCount = 0;
    loop_.setMetricsCallback([&](const TickMetrics&) { ++metricsCount; });

    (void)loop_.tick();
    EXPECT_EQ(metricsCount, 0);
}

TEST_F(TickLoopTest, SlowCallbackIsAnOverrun) {
    loop_.setTickCallback([](double) {
        std::this_thread::sleep_for(60ms);
        return true;
    });
    auto metrics = loop_.tick();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0);
}

TEST_F(TickLoopTest, StartAndStopLifecycle) {
    EXPECT_TRUE(loop_.start());
    EXPECT_TRUE(loop_.isRunning());
    EXPECT_FALSE(loop_.start());  // Already running.

    std::this_thread::sleep_for(120ms);

    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_GT(loop_.tickCount(), 0u);
}

TEST_F(TickLoopTest, StopWhenNotRunningIsSafe) {
    loop_.stop();
    loop_.waitUntilFinished();
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(TickLoopTest, CallbackFinishesLoop) {
    TickLoop fast(200);
    std::atomic<int> ticks{0};
    std::atomic<int> metrics{0};
    fast.setTickCallback([&](double) { return ++ticks < 5; });
    fast.setMetricsCallback([&](const TickMetrics&) { ++metrics; });

    ASSERT_TRUE(fast.start());
    fast.waitUntilFinished();

    EXPECT_FALSE(fast.isRunning());
    EXPECT_EQ(ticks.load(), 5);
    EXPECT_EQ(metrics.load(), 5);
    EXPECT_EQ(fast.tickCount(), 5u);
    EXPECT_EQ(fast.lastMetrics().tickNumber, 4u);
}

TEST_F(TickLoopTest, RestartAfterFinishing) {
    TickLoop fast(200);
    std::atomic<int> ticks{0};
    fast.setTickCallback([&](double) {
        ++ticks;
        return false;
    });

    ASSERT_TRUE(fast.start());
    fast.waitUntilFinished();
    ASSERT_TRUE(fast.start());
    fast.waitUntilFinished();
    EXPECT_EQ(ticks.load(), 2);
}
