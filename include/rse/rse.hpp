#pragma once

/// @file rse.hpp
/// @brief Umbrella header for the round simulation engine.

#include "rse/core/result.hpp"
#include "rse/version.hpp"

#include "rse/foundation/config_manager.hpp"
#include "rse/foundation/error_code.hpp"
#include "rse/foundation/game_error.hpp"
#include "rse/foundation/game_logger.hpp"
#include "rse/foundation/game_result.hpp"
#include "rse/foundation/types.hpp"

#include "rse/game/ability_system.hpp"
#include "rse/game/ability_types.hpp"
#include "rse/game/blackboard.hpp"
#include "rse/game/combat_system.hpp"
#include "rse/game/economy.hpp"
#include "rse/game/heuristic_agent.hpp"
#include "rse/game/intent.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/map_loader.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/movement_system.hpp"
#include "rse/game/pathing.hpp"
#include "rse/game/player.hpp"
#include "rse/game/round.hpp"
#include "rse/game/round_types.hpp"
#include "rse/game/simulation_config.hpp"
#include "rse/game/weapon_types.hpp"
