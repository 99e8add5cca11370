#pragma once

/// @file simulation_config.hpp
/// @brief Aggregated tunables for a round and their YAML overlay.
///
/// Every constant the systems use has a compiled-in default.  A YAML
/// document loaded through ConfigManager can override any of them with
/// dotted keys, for example:
///
/// @code
///   round:
///     plant_time: 4.0
///     spike_time: 45.0
///   combat:
///     flash_multiplier: 0.2
///   movement:
///     fall_damage_threshold: 1.5
///   economy:
///     win_credits: 3000
/// @endcode

#include "rse/foundation/config_manager.hpp"
#include "rse/foundation/game_result.hpp"
#include "rse/game/ability_system.hpp"
#include "rse/game/blackboard.hpp"
#include "rse/game/combat_system.hpp"
#include "rse/game/economy.hpp"
#include "rse/game/movement_system.hpp"
#include "rse/game/round_types.hpp"

namespace rse::game {

struct SimulationConfig {
    RoundTimings round;
    MovementParams movement;
    CombatTuning combat;
    AbilityTuning ability;
    EconomyTuning economy;
    BlackboardTuning blackboard;

    /// Reject values the systems cannot run with (non-positive timers,
    /// probabilities outside [0, 1], inverted ranges, ...).
    /// @return ConfigValueOutOfRange naming the first offending key.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Overlay the keys present in @p config onto the defaults and validate.
/// @return ConfigTypeMismatch for a key of the wrong type, or the
///         validation error.
[[nodiscard]] foundation::GameResult<SimulationConfig> LoadSimulationConfig(
    const foundation::ConfigManager& config);

}  // namespace rse::game
