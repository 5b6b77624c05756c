#pragma once

/// @file timer_queue.hpp
/// @brief Virtual-clock timer queue and the cancellable deferred action
///        built on top of it.
///
/// The queue does not read a wall clock. The frame tick advances it, and
/// every callback runs on the thread that calls Advance(), so timer
/// callbacks interleave with frame logic exactly as the game loop orders
/// them.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

namespace arc::game {

using Milliseconds = std::chrono::milliseconds;

/// Identifier of a scheduled timer.
using TimerId = uint64_t;

/// Single-threaded queue of one-shot timers on a virtual clock.
///
/// Due timers fire in (due time, scheduling order) order. A timer scheduled
/// from inside a callback fires within the same Advance() if its due time
/// does not exceed the advance target.
class TimerQueue {
public:
    TimerQueue() = default;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    /// Schedule @p callback to run @p delay after Now(). Negative delays
    /// are treated as zero.
    TimerId Schedule(Milliseconds delay, std::function<void()> callback);

    /// Cancel a pending timer.
    /// @return true if the timer was pending.
    bool Cancel(TimerId id);

    /// Move the clock forward by @p delta, running every timer that falls
    /// due on the way.
    void Advance(Milliseconds delta);

    /// Drop every pending timer without running it.
    void Clear();

    [[nodiscard]] Milliseconds Now() const noexcept { return now_; }

    [[nodiscard]] std::size_t PendingCount() const noexcept { return byId_.size(); }

    [[nodiscard]] bool IsPending(TimerId id) const { return byId_.contains(id); }

private:
    /// (due time, sequence number); the sequence keeps insertion order
    /// among timers due at the same instant.
    using Key = std::pair<Milliseconds, uint64_t>;

    struct Timer {
        TimerId id = 0;
        std::function<void()> callback;
    };

    Milliseconds now_{0};
    uint64_t nextSequence_ = 0;
    TimerId nextId_ = 1;

    std::map<Key, Timer> timers_;
    std::unordered_map<TimerId, Key> byId_;
};

/// Cancellable deferred action owned by one component.
///
/// At most one arming is outstanding: Arm() cancels the previous one.
/// Every arming carries a generation token that the callback checks before
/// running, so a callback from a superseded arming is a guaranteed no-op
/// even if the underlying timer was not removed from the queue.
///
/// Usage:
/// @code
///   DeferredAction charge(timers);
///   charge.Arm(Milliseconds(250), [this] { enter(AnimationState::Charged); });
///   charge.Cancel();  // early release
/// @endcode
class DeferredAction {
public:
    explicit DeferredAction(TimerQueue& queue) : queue_(queue) {}

    ~DeferredAction() { Cancel(); }

    DeferredAction(const DeferredAction&) = delete;
    DeferredAction& operator=(const DeferredAction&) = delete;
    DeferredAction(DeferredAction&&) = delete;
    DeferredAction& operator=(DeferredAction&&) = delete;

    /// Run @p action after @p delay, replacing any pending arming.
    void Arm(Milliseconds delay, std::function<void()> action);

    /// Cancel the pending arming, if any.
    void Cancel();

    [[nodiscard]] bool IsPending() const noexcept { return timer_.has_value(); }

    /// Token of the most recent Arm() or Cancel().
    [[nodiscard]] uint64_t Generation() const noexcept { return generation_; }

private:
    TimerQueue& queue_;
    std::optional<TimerId> timer_;
    uint64_t generation_ = 0;
};

} // namespace arc::game
