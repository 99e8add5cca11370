#pragma once

/// @file round_types.hpp
/// @brief Round phases, spike state, dropped items, events and summaries.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// Round phase.  Transitions are one-way: Buy -> Active -> End.
enum class RoundPhase : uint8_t { Buy, Active, End };

enum class RoundWinner : uint8_t { None, Attackers, Defenders };

enum class EndCondition : uint8_t {
    None,
    Elimination,
    SpikeDetonation,
    SpikeDefused,
    TimeExpired
};

/// Spike sub-state machine.
///
///   Carried <-> Dropped
///   Carried -> Planting -> Planted (or back to Carried on interrupt)
///   Planted -> Defusing -> Defused (or back to Planted on interrupt)
///   Planted | Defusing -> Detonated
enum class SpikeState : uint8_t { Carried, Dropped, Planting, Planted, Defusing, Defused, Detonated };

[[nodiscard]] std::string_view RoundPhaseName(RoundPhase phase) noexcept;
[[nodiscard]] std::string_view RoundWinnerName(RoundWinner winner) noexcept;
[[nodiscard]] std::string_view EndConditionName(EndCondition condition) noexcept;
[[nodiscard]] std::string_view SpikeStateName(SpikeState state) noexcept;

[[nodiscard]] constexpr RoundWinner WinnerFor(Team team) noexcept {
    return team == Team::Attackers ? RoundWinner::Attackers : RoundWinner::Defenders;
}

/// Phase and objective timers (seconds).
struct RoundTimings {
    double tickInterval = 0.05;
    double roundTime = 100.0;
    double buyTime = 30.0;
    double pistolBuyTime = 45.0;
    double spikeTime = 45.0;
    double plantTime = 4.0;
    double defuseTime = 7.0;
    double defuseRadius = 3.0;
    std::vector<int32_t> pistolRounds{1, 13};

    [[nodiscard]] bool IsPistolRound(int32_t roundNumber) const noexcept;
};

/// Where the spike is and who is working on it.
struct Spike {
    SpikeState state = SpikeState::Carried;
    std::optional<PlayerId> carrier;
    std::optional<PlayerId> planter;   ///< Set while planting and after the plant.
    std::optional<PlayerId> defuser;   ///< Set while defusing and after the defuse.
    Vector3 position;                  ///< Valid when dropped or planted.
    std::optional<std::string> site;
    double plantedAt = 0.0;
    double timer = 0.0;                ///< Seconds to detonation once planted.

    [[nodiscard]] bool IsPlanted() const noexcept {
        return state == SpikeState::Planted || state == SpikeState::Defusing;
    }
};

struct DroppedWeapon {
    std::string weapon;
    int32_t ammo = 0;
    Vector3 position;
    double time = 0.0;
};

struct DroppedShield {
    ShieldType shield = ShieldType::None;
    Vector3 position;
    double time = 0.0;
};

enum class RoundEventType : uint8_t {
    PhaseChange,
    Purchase,
    Damage,
    Death,
    PlantStart,
    PlantInterrupt,
    PlantComplete,
    DefuseStart,
    DefuseInterrupt,
    DefuseComplete,
    Detonation,
    AbilityUse,
    Communication,
    SpikeDrop,
    SpikePickup,
    ItemPickup,
    RoundEnd
};

[[nodiscard]] std::string_view RoundEventTypeName(RoundEventType type) noexcept;

/// One entry of the ordered event log.
struct RoundEvent {
    RoundEventType type = RoundEventType::PhaseChange;
    double time = 0.0;
    PlayerId actor;                  ///< Invalid for events without an actor.
    std::optional<PlayerId> target;
    std::string detail;              ///< Weapon, item, ability, cause or phase name.
    double amount = 0.0;             ///< Damage, credits spent, ...
    Vector3 position;
    std::vector<PlayerId> assists;
    bool headshot = false;

    bool operator==(const RoundEvent&) const = default;
};

/// Snapshot of round state.
struct RoundSummary {
    int32_t roundNumber = 0;
    RoundPhase phase = RoundPhase::Buy;
    double elapsed = 0.0;
    double buyTimeRemaining = 0.0;
    double timeRemaining = 0.0;
    SpikeState spikeState = SpikeState::Carried;
    bool spikePlanted = false;
    std::optional<double> spikeTimeRemaining;
    int32_t aliveAttackers = 0;
    int32_t aliveDefenders = 0;
    RoundWinner winner = RoundWinner::None;
    EndCondition endCondition = EndCondition::None;
    int32_t killCount = 0;

    bool operator==(const RoundSummary&) const = default;
};

}  // namespace rse::game
