/// @file timer_queue.cpp
/// @brief Virtual-clock timer queue.

#include "arc/game/timer_queue.hpp"

#include <algorithm>

namespace arc::game {

// ═══════════════════════════════════════════════════════════════════════════
// TimerQueue
// ═══════════════════════════════════════════════════════════════════════════

TimerId TimerQueue::Schedule(Milliseconds delay, std::function<void()> callback) {
    auto id = nextId_++;
    Key key{now_ + std::max(delay, Milliseconds(0)), nextSequence_++};
    timers_.emplace(key, Timer{id, std::move(callback)});
    byId_.emplace(id, key);
    return id;
}

bool TimerQueue::Cancel(TimerId id) {
    auto it = byId_.find(id);
    if (it == byId_.end()) {
        return false;
    }
    timers_.erase(it->second);
    byId_.erase(it);
    return true;
}

void TimerQueue::Advance(Milliseconds delta) {
    const Milliseconds target = now_ + std::max(delta, Milliseconds(0));

    while (!timers_.empty()) {
        auto first = timers_.begin();
        if (first->first.first > target) {
            break;
        }

        // Pop before invoking so the callback may schedule or cancel freely.
        now_ = first->first.first;
        Timer timer = std::move(first->second);
        timers_.erase(first);
        byId_.erase(timer.id);

        if (timer.callback) {
            timer.callback();
        }
    }

    now_ = target;
}

void TimerQueue::Clear() {
    timers_.clear();
    byId_.clear();
}

// ═══════════════════════════════════════════════════════════════════════════
// DeferredAction
// ═══════════════════════════════════════════════════════════════════════════

void DeferredAction::Arm(Milliseconds delay, std::function<void()> action) {
    Cancel();

    const uint64_t token = ++generation_;
    timer_ = queue_.Schedule(delay, [this, token, fn = std::move(action)] {
        if (token != generation_) {
            return;  // superseded
        }
        timer_.reset();
        fn();
    });
}

void DeferredAction::Cancel() {
    ++generation_;
    if (timer_) {
        queue_.Cancel(*timer_);
        timer_.reset();
    }
}

} // namespace arc::game
