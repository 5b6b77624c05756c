/// @file weapon_state_machine.cpp
/// @brief Charge / discharge / decay cycle of the equipped weapon.

#include "arc/game/weapon_state_machine.hpp"

#include <string>

#include "arc/foundation/game_logger.hpp"

namespace arc::game {

using arc::foundation::LogCategory;

WeaponStateMachine::WeaponStateMachine(TimerQueue& timers, WeaponStats stats)
    : stats_(std::move(stats)), transition_(timers) {}

bool WeaponStateMachine::StartCharging() {
    if (state_ != AnimationState::Idle) {
        ARC_LOG_DEBUG(LogCategory::Weapon,
                      "startCharging ignored in " + std::string(animationStateName(state_)));
        return false;
    }
    enter(AnimationState::Charging);
    return true;
}

bool WeaponStateMachine::Fire() {
    switch (state_) {
        case AnimationState::Charged:
            enter(AnimationState::Discharging);
            return true;
        case AnimationState::Charging:
            // Released before the charge completed: abort, no discharge.
            enter(AnimationState::Idle);
            return true;
        case AnimationState::Idle:
        case AnimationState::Discharging:
        case AnimationState::Decay:
            break;
    }
    ARC_LOG_DEBUG(LogCategory::Weapon,
                  "fire ignored in " + std::string(animationStateName(state_)));
    return false;
}

void WeaponStateMachine::ResetState() {
    transition_.Cancel();
    if (state_ != AnimationState::Idle) {
        enter(AnimationState::Idle);
    }
}

void WeaponStateMachine::enter(AnimationState next) {
    const AnimationState previous = state_;
    state_ = next;

    switch (next) {
        case AnimationState::Charging:
            transition_.Arm(stats_.chargeDuration,
                            [this] { enter(AnimationState::Charged); });
            break;
        case AnimationState::Discharging:
            transition_.Arm(stats_.dischargePeakDuration,
                            [this] { enter(AnimationState::Decay); });
            break;
        case AnimationState::Decay:
            transition_.Arm(stats_.decayDuration,
                            [this] { enter(AnimationState::Idle); });
            break;
        case AnimationState::Idle:
        case AnimationState::Charged:
            transition_.Cancel();
            break;
    }

    if (listener_) {
        listener_(previous, next);
    }
}

} // namespace arc::game
