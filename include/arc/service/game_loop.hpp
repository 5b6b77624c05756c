#pragma once

/// @file game_loop.hpp
/// @brief Fixed-rate frame driver for a combat session.
///
/// The loop calls one tick callback per frame, either from its own thread
/// (start/stop) or on demand (tick). Wall-clock cost of each frame is
/// reported through TickMetrics; the simulated time handed to the callback
/// is derived from the frame number alone.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace arc::service {

/// Wall-clock measurements of one frame.
struct TickMetrics {
    /// Time spent inside the tick callback.
    std::chrono::microseconds updateTime{0};

    /// Start-to-start interval on the loop thread; equals updateTime for
    /// manual ticks.
    std::chrono::microseconds frameTime{0};

    /// updateTime / targetFrameTime.
    float budgetUtilization = 0.0f;

    /// Zero-based frame number.
    uint64_t tickNumber = 0;

    bool overrun = false;
};

/// Fixed-rate frame driver.
///
/// Each frame advances simulated time by frameDelta(tickNumber) whole
/// milliseconds. The deltas sum to floor(ticks * 1000 / rate), so a 60 Hz
/// loop hands out 16, 17, 17, 16, 17, 17, ... and never drifts.
///
/// @code
///   GameLoop loop(settings.game.tickRate);
///   loop.setTickCallback([&](std::chrono::milliseconds dt) { session->Tick(dt); });
///   (void)loop.start();
///   signals.waitForShutdown();
///   loop.stop();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(std::chrono::milliseconds delta)>;
    using MetricsCallback = std::function<void(const TickMetrics&)>;

    /// @param tickRate  Frames per second; 0 selects 60.
    explicit GameLoop(uint32_t tickRate = 60);
    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    void setTickCallback(TickCallback callback);

    /// Called after every threaded frame; not called by tick().
    void setMetricsCallback(MetricsCallback callback);

    /// Spawn the loop thread.
    /// @return false when the loop is already running.
    [[nodiscard]] bool start();

    /// Request the loop thread to finish its frame and join it.
    void stop();

    /// Run one frame on the calling thread. Not for use while running.
    TickMetrics tick();

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept;
    [[nodiscard]] std::chrono::microseconds targetFrameTime() const noexcept;
    [[nodiscard]] uint64_t tickCount() const noexcept;

    /// Frames whose callback took longer than targetFrameTime().
    [[nodiscard]] uint64_t overrunCount() const noexcept;

    /// Sum of every delta handed out so far.
    [[nodiscard]] std::chrono::milliseconds simulatedTime() const noexcept;

    [[nodiscard]] TickMetrics lastMetrics() const;

    /// Delta handed to the callback on frame @p tickNumber.
    [[nodiscard]] std::chrono::milliseconds frameDelta(uint64_t tickNumber) const noexcept;

private:
    void run();
    TickMetrics runFrame();
    void publishMetrics(const TickMetrics& metrics);

    uint32_t tickRate_;
    std::chrono::microseconds targetFrameTime_;

    mutable std::mutex callbackMutex_;
    TickCallback tickCallback_;
    MetricsCallback metricsCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::atomic<uint64_t> overrunCount_{0};
    std::thread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;
};

} // namespace arc::service
