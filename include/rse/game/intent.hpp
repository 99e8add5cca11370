#pragma once

/// @file intent.hpp
/// @brief Per-player, per-tick action requests and the provider interface.
///
/// The Round consumes one Intent per living player per tick.  Intents
/// queued with Round::SetIntent win; players without one are asked the
/// installed IIntentProvider, and default to Idle when there is none.

#include <cstddef>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "rse/game/blackboard.hpp"
#include "rse/game/combat_system.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"
#include "rse/game/round_types.hpp"

namespace rse::game {

struct IdleIntent {
    bool operator==(const IdleIntent&) const = default;
};

struct MoveIntent {
    Vector3 direction;
    bool walking = false;
    bool crouching = false;
    bool jump = false;
    std::optional<double> yaw;  ///< Explicit facing; defaults to the move direction.

    bool operator==(const MoveIntent&) const = default;
};

/// Engage a visible enemy.  Ignored when the target is not in view.
struct ShootIntent {
    PlayerId target;

    bool operator==(const ShootIntent&) const = default;
};

/// Start or continue planting; only the carrier inside a bomb site.
struct PlantIntent {
    bool operator==(const PlantIntent&) const = default;
};

/// Start or continue defusing; only a defender near the planted spike.
struct DefuseIntent {
    bool operator==(const DefuseIntent&) const = default;
};

/// Explicit purchase during the buy phase.
struct BuyIntent {
    std::string weapon;
    ShieldType shield = ShieldType::None;

    bool operator==(const BuyIntent&) const = default;
};

/// Activate the ability in @p slot toward @p target (a world point).
struct UseAbilityIntent {
    std::size_t slot = 0;
    Vector3 target;

    bool operator==(const UseAbilityIntent&) const = default;
};

/// Team call-out, copied into the event log and the team blackboard.
struct CommunicateIntent {
    std::string message;
    std::optional<Vector3> location;

    bool operator==(const CommunicateIntent&) const = default;
};

using Intent = std::variant<IdleIntent, MoveIntent, ShootIntent, PlantIntent, DefuseIntent,
                            BuyIntent, UseAbilityIntent, CommunicateIntent>;

[[nodiscard]] std::string_view IntentName(const Intent& intent) noexcept;

/// Read-only round state handed to intent providers.
struct IntentContext {
    const MapGeometry& map;
    const std::vector<Player>& players;
    const TeamBlackboard& blackboard;
    const std::vector<VisibleEnemy>& visibleEnemies;  ///< Of the deciding player.
    const Spike& spike;
    RoundPhase phase;
    double time;
    std::mt19937_64& rng;  ///< The round's generator; keeps decisions reproducible.
};

/// Producer of intents for players without a queued one.
class IIntentProvider {
public:
    virtual ~IIntentProvider() = default;

    /// Decide what @p self does this tick.
    virtual Intent Decide(const Player& self, const IntentContext& context) = 0;

    /// Called when a new round starts so cached plans can be dropped.
    virtual void Reset() {}
};

}  // namespace rse::game
