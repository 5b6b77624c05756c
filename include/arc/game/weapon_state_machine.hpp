#pragma once

/// @file weapon_state_machine.hpp
/// @brief Charge / discharge / decay cycle of one weapon instance.

#include <functional>
#include <utility>

#include "arc/game/timer_queue.hpp"
#include "arc/game/weapon_types.hpp"

namespace arc::game {

/// Observer of state changes, called after the new state is in effect.
using StateListener = std::function<void(AnimationState from, AnimationState to)>;

/// Finite state machine driving one weapon's charge cycle.
///
/// @code
///   Idle --StartCharging--> Charging --(chargeDuration)--> Charged
///   Charging --Fire--> Idle                      (early release, no shot)
///   Charged --Fire--> Discharging --(peak)--> Decay --(decay)--> Idle
/// @endcode
///
/// Every timed transition goes through a single DeferredAction, so leaving
/// a state always cancels the transition scheduled for it. Calls that are
/// not valid in the current state are silent no-ops.
class WeaponStateMachine {
public:
    WeaponStateMachine(TimerQueue& timers, WeaponStats stats);

    WeaponStateMachine(const WeaponStateMachine&) = delete;
    WeaponStateMachine& operator=(const WeaponStateMachine&) = delete;

    /// Begin charging. Only valid from Idle.
    /// @return true if the machine entered Charging.
    bool StartCharging();

    /// Release the trigger. Discharges from Charged, aborts from Charging.
    /// @return true if the state changed.
    bool Fire();

    /// Cancel any pending transition and force Idle. Idempotent.
    void ResetState();

    [[nodiscard]] AnimationState State() const noexcept { return state_; }

    [[nodiscard]] const WeaponStats& Stats() const noexcept { return stats_; }

    /// True while a timed transition is scheduled.
    [[nodiscard]] bool HasPendingTransition() const noexcept {
        return transition_.IsPending();
    }

    void SetListener(StateListener listener) { listener_ = std::move(listener); }

private:
    /// Switch to @p next, arm the timer that leaves it, then notify.
    void enter(AnimationState next);

    WeaponStats stats_;
    AnimationState state_ = AnimationState::Idle;
    DeferredAction transition_;
    StateListener listener_;
};

} // namespace arc::game
