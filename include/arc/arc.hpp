#pragma once

/// @file arc.hpp
/// @brief Convenience header pulling in the public arcstaff API.

#include "arc/version.hpp"

#include "arc/core/result.hpp"

#include "arc/foundation/config_manager.hpp"
#include "arc/foundation/error_code.hpp"
#include "arc/foundation/game_error.hpp"
#include "arc/foundation/game_logger.hpp"
#include "arc/foundation/game_result.hpp"
#include "arc/foundation/types.hpp"

#include "arc/event/event_bus.hpp"
#include "arc/event/game_events.hpp"

#include "arc/game/combat_session.hpp"
#include "arc/game/damage_resolver.hpp"
#include "arc/game/enemy_manager.hpp"
#include "arc/game/enemy_spawner.hpp"
#include "arc/game/game_settings.hpp"
#include "arc/game/math_types.hpp"
#include "arc/game/physics_query.hpp"
#include "arc/game/physics_world.hpp"
#include "arc/game/player_status.hpp"
#include "arc/game/projectile_impact_handler.hpp"
#include "arc/game/spatial_index.hpp"
#include "arc/game/timer_queue.hpp"
#include "arc/game/weapon_catalog.hpp"
#include "arc/game/weapon_controller.hpp"
#include "arc/game/weapon_inventory.hpp"
#include "arc/game/weapon_state_machine.hpp"
#include "arc/game/weapon_types.hpp"

#include "arc/service/game_loop.hpp"
#include "arc/service/service_runner.hpp"
