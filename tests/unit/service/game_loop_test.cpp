/// @file game_loop_test.cpp
/// @brief Unit tests for GameLoop.

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

#include "arc/service/game_loop.hpp"

using namespace arc::service;
using namespace std::chrono_literals;

// ============================================================================
// GameLoop Tests
// ============================================================================

class GameLoopTest : public ::testing::Test {
protected:
    GameLoop loop_{60};
};

TEST_F(GameLoopTest, DefaultTickRate) {
    GameLoop defaulted;
    EXPECT_EQ(defaulted.tickRate(), 60u);
}

TEST_F(GameLoopTest, TargetFrameTimeForSixtyHz) {
    // 1'000'000 / 60 = 16666 us
    EXPECT_EQ(loop_.targetFrameTime().count(), 16666);
}

TEST_F(GameLoopTest, CustomTickRate) {
    GameLoop custom(20);
    EXPECT_EQ(custom.tickRate(), 20u);
    EXPECT_EQ(custom.targetFrameTime(), 50000us);
}

TEST_F(GameLoopTest, ZeroTickRateDefaultsToSixty) {
    GameLoop zeroRate(0);
    EXPECT_EQ(zeroRate.tickRate(), 60u);
}

TEST_F(GameLoopTest, InitialTickCountIsZero) {
    EXPECT_EQ(loop_.tickCount(), 0u);
    EXPECT_FALSE(loop_.isRunning());
}

TEST_F(GameLoopTest, ManualTickIncreasesCount) {
    (void)loop_.tick();
    EXPECT_EQ(loop_.tickCount(), 1u);

    (void)loop_.tick();
    EXPECT_EQ(loop_.tickCount(), 2u);
}

TEST_F(GameLoopTest, ManualTickReturnsMetrics) {
    auto metrics = loop_.tick();

    EXPECT_EQ(metrics.tickNumber, 0u);
    EXPECT_GE(metrics.updateTime.count(), 0);
    EXPECT_GE(metrics.budgetUtilization, 0.0f);
    EXPECT_EQ(loop_.lastMetrics().tickNumber, 0u);
}

// ============================================================================
// Frame deltas
// ============================================================================

TEST_F(GameLoopTest, SixtyHzDeltasAlternateWithoutDrift) {
    EXPECT_EQ(loop_.frameDelta(0), 16ms);
    EXPECT_EQ(loop_.frameDelta(1), 17ms);
    EXPECT_EQ(loop_.frameDelta(2), 17ms);
    EXPECT_EQ(loop_.frameDelta(3), 16ms);

    std::chrono::milliseconds total{0};
    for (uint64_t i = 0; i < 600; ++i) {
        total += loop_.frameDelta(i);
    }
    EXPECT_EQ(total, 10000ms);
}

TEST_F(GameLoopTest, TickCallbackReceivesFrameDelta) {
    std::vector<std::chrono::milliseconds> deltas;
    loop_.setTickCallback([&](std::chrono::milliseconds dt) { deltas.push_back(dt); });

    (void)loop_.tick();
    (void)loop_.tick();
    (void)loop_.tick();

    EXPECT_EQ(deltas, (std::vector<std::chrono::milliseconds>{16ms, 17ms, 17ms}));
}

TEST_F(GameLoopTest, SimulatedTimeFollowsTickCount) {
    for (int i = 0; i < 7; ++i) {
        (void)loop_.tick();
    }
    // floor(7 * 1000 / 60)
    EXPECT_EQ(loop_.simulatedTime(), 116ms);
}

TEST_F(GameLoopTest, TwentyHzDeltaIsFiftyMs) {
    GameLoop slow(20);
    EXPECT_EQ(slow.frameDelta(0), 50ms);
    EXPECT_EQ(slow.frameDelta(7), 50ms);
}

// ============================================================================
// Threaded operation
// ============================================================================

TEST_F(GameLoopTest, MetricsCallbackNotCalledOnManualTick) {
    int metricsCount = 0;
    loop_.setMetricsCallback([&](const TickMetrics&) { ++metricsCount; });

    (void)loop_.tick();
    EXPECT_EQ(metricsCount, 0);
}

TEST_F(GameLoopTest, StartAndStopLifecycle) {
    EXPECT_TRUE(loop_.start());
    EXPECT_TRUE(loop_.isRunning());

    std::this_thread::sleep_for(120ms);

    loop_.stop();
    EXPECT_FALSE(loop_.isRunning());
    EXPECT_GT(loop_.tickCount(), 0u);
}

TEST_F(GameLoopTest, DoubleStartReturnsFalse) {
    EXPECT_TRUE(loop_.start());
    EXPECT_FALSE(loop_.start());
    loop_.stop();
}

TEST_F(GameLoopTest, StopWhenNotRunningIsSafe) {
    loop_.stop();
}

TEST_F(GameLoopTest, ThreadedTickCallbackInvocation) {
    std::atomic<int> callCount{0};
    loop_.setTickCallback([&](std::chrono::milliseconds) { callCount.fetch_add(1); });

    EXPECT_TRUE(loop_.start());
    std::this_thread::sleep_for(250ms);
    loop_.stop();

    // At 60Hz, ~250ms should yield well over 2 ticks (generous for CI).
    EXPECT_GE(callCount.load(), 2);
}

TEST_F(GameLoopTest, OverrunDetection) {
    loop_.setTickCallback([&](std::chrono::milliseconds) {
        // Exceeds the 16.6ms budget.
        std::this_thread::sleep_for(25ms);
    });

    auto metrics = loop_.tick();
    EXPECT_TRUE(metrics.overrun);
    EXPECT_GT(metrics.budgetUtilization, 1.0f);
    EXPECT_EQ(loop_.overrunCount(), 1u);
}

TEST_F(GameLoopTest, NormalTickIsNotOverrun) {
    loop_.setTickCallback([&](std::chrono::milliseconds) {});

    auto metrics = loop_.tick();
    EXPECT_FALSE(metrics.overrun);
    EXPECT_LT(metrics.budgetUtilization, 1.0f);
    EXPECT_EQ(metrics.frameTime, metrics.updateTime);
    EXPECT_EQ(loop_.overrunCount(), 0u);
}

TEST_F(GameLoopTest, CallbackSignalsCompletionToPollingThread) {
    // State owned by the callback stays on the loop thread; only the flag
    // crosses to the polling thread.
    int framesSeen = 0;
    std::atomic<bool> finished{false};
    loop_.setTickCallback([&](std::chrono::milliseconds) {
        if (++framesSeen >= 5) {
            finished.store(true);
        }
    });

    EXPECT_TRUE(loop_.start());
    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (!finished.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    loop_.stop();

    EXPECT_TRUE(finished.load());
    EXPECT_GE(framesSeen, 5);
    EXPECT_GE(loop_.tickCount(), 5u);
}
