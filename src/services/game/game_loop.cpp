/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "arc/service/game_loop.hpp"

namespace arc::service {

using Clock = std::chrono::steady_clock;
using std::chrono::duration_cast;
using std::chrono::microseconds;
using std::chrono::milliseconds;

namespace {

constexpr uint32_t kDefaultTickRate = 60;

/// Simulated milliseconds elapsed after @p ticks frames.
constexpr uint64_t elapsedMs(uint64_t ticks, uint32_t rate) {
    return ticks * 1000 / rate;
}

} // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate == 0 ? kDefaultTickRate : tickRate),
      targetFrameTime_(microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

void GameLoop::setMetricsCallback(MetricsCallback callback) {
    std::lock_guard lock(callbackMutex_);
    metricsCallback_ = std::move(callback);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::thread(&GameLoop::run, this);
    return true;
}

void GameLoop::stop() {
    running_.store(false);
    if (thread_.joinable()) {
        thread_.join();
    }
}

TickMetrics GameLoop::tick() {
    auto metrics = runFrame();
    metrics.frameTime = metrics.updateTime;
    std::lock_guard lock(metricsMutex_);
    lastMetrics_ = metrics;
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint32_t GameLoop::tickRate() const noexcept {
    return tickRate_;
}

microseconds GameLoop::targetFrameTime() const noexcept {
    return targetFrameTime_;
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_.load();
}

uint64_t GameLoop::overrunCount() const noexcept {
    return overrunCount_.load();
}

milliseconds GameLoop::simulatedTime() const noexcept {
    return milliseconds(static_cast<int64_t>(elapsedMs(tickCount_.load(), tickRate_)));
}

TickMetrics GameLoop::lastMetrics() const {
    std::lock_guard lock(metricsMutex_);
    return lastMetrics_;
}

milliseconds GameLoop::frameDelta(uint64_t tickNumber) const noexcept {
    const uint64_t delta = elapsedMs(tickNumber + 1, tickRate_) - elapsedMs(tickNumber, tickRate_);
    return milliseconds(static_cast<int64_t>(delta));
}

void GameLoop::run() {
    auto deadline = Clock::now();
    auto previousStart = deadline;

    while (running_.load()) {
        const auto frameStart = Clock::now();
        deadline += targetFrameTime_;

        auto metrics = runFrame();
        metrics.frameTime = tickCount_.load() > 1
                                ? duration_cast<microseconds>(frameStart - previousStart)
                                : metrics.updateTime;
        previousStart = frameStart;
        publishMetrics(metrics);

        const auto now = Clock::now();
        if (now < deadline) {
            std::this_thread::sleep_until(deadline);
        } else {
            // Behind schedule: drop the backlog instead of bursting frames.
            deadline = now;
        }
    }
}

TickMetrics GameLoop::runFrame() {
    const auto start = Clock::now();
    const uint64_t tickNumber = tickCount_.fetch_add(1);

    {
        std::lock_guard lock(callbackMutex_);
        if (tickCallback_) {
            tickCallback_(frameDelta(tickNumber));
        }
    }

    TickMetrics metrics;
    metrics.tickNumber = tickNumber;
    metrics.updateTime = duration_cast<microseconds>(Clock::now() - start);
    metrics.budgetUtilization = static_cast<float>(metrics.updateTime.count()) /
                                static_cast<float>(targetFrameTime_.count());
    metrics.overrun = metrics.updateTime > targetFrameTime_;
    if (metrics.overrun) {
        overrunCount_.fetch_add(1);
    }
    return metrics;
}

void GameLoop::publishMetrics(const TickMetrics& metrics) {
    {
        std::lock_guard lock(metricsMutex_);
        lastMetrics_ = metrics;
    }
    std::lock_guard lock(callbackMutex_);
    if (metricsCallback_) {
        metricsCallback_(metrics);
    }
}

} // namespace arc::service
