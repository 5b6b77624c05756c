/// @file game_events.cpp
/// @brief Effect type naming.

#include "arc/event/game_events.hpp"

namespace arc::event {

std::string_view effectTypeName(const EffectPayload& effect) {
    return std::visit(Overloaded{
        [](const SplashDamageEffect&) -> std::string_view { return "splash_damage"; },
        [](const ArcLightningEffect&) -> std::string_view { return "arc_lightning"; },
        [](const ExplosionEffect&) -> std::string_view { return "explosion"; },
        [](const NovaEffect&) -> std::string_view { return "nova"; },
        [](const DischargeEffect&) -> std::string_view { return "discharge"; },
        [](const RockMonsterDeathEffect&) -> std::string_view { return "rock_monster_death"; },
    }, effect);
}

}  // namespace arc::event
