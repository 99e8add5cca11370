#pragma once

/// @file combat_system.hpp
/// @brief Vision, hearing and probabilistic duel resolution.
///
/// Duels are resolved instantaneously: each side gets an advantage score
/// and a single uniform draw picks the winner with probability
/// advA / (advA + advB).  This stands in for a shot-by-shot damage race.

#include <cstdint>
#include <random>
#include <unordered_map>
#include <vector>

#include "rse/game/map_geometry.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"
#include "rse/game/weapon_types.hpp"

namespace rse::game {

/// Combat tunables.  All advantage factors are multiplicative.
struct CombatTuning {
    // Vision
    double fieldOfViewDegrees = 110.0;
    double maxVisionDistance = 50.0;
    double standingEyeHeight = 0.9;
    double crouchingEyeHeight = 0.45;

    // Hearing
    double footstepRange = 20.0;
    double gunshotRange = 50.0;

    // Duel advantage
    double flashedMultiplier = 0.2;
    double slowedMultiplier = 0.8;
    double surpriseMultiplier = 1.5;
    double highGroundMultiplier = 1.2;
    double highGroundThreshold = 0.5;
    double closeRangeMultiplier = 0.9;
    double closeRangeDistance = 5.0;
    double farRangeMultiplier = 0.8;
    double farRangeDistance = 30.0;
    double armorMultiplierPerPoint = 0.002;
    double advantageFloor = 0.1;
    WeaponTierMultipliers tiers;

    // Outcome
    double headshotChance = 0.3;
    double assistWindow = 5.0;  ///< Seconds an ability hit counts toward an assist.
    double pickupRadius = 1.5;
    int32_t minDroppedAmmo = 5;
    int32_t maxDroppedAmmo = 25;
};

/// An enemy in a player's view this tick.
struct VisibleEnemy {
    PlayerId id;
    double distance = 0.0;
    bool lookingBack = false;  ///< The enemy's view cone contains the viewer.
};

/// Visible enemies per living player.
using VisionMap = std::unordered_map<PlayerId, std::vector<VisibleEnemy>>;

/// A player within earshot of a sound.
struct Listener {
    PlayerId id;
    double intensity = 0.0;  ///< 1 at the source, falling to 0 at max range.
};

/// Result of one duel.
struct DuelOutcome {
    PlayerId winner;
    PlayerId loser;
    double winnerProbability = 0.0;
    bool headshot = false;
};

class CombatSystem {
public:
    CombatSystem() = default;
    explicit CombatSystem(CombatTuning tuning) : tuning_(tuning) {}

    /// Eye position for the player's current stance.
    [[nodiscard]] Vector3 EyePosition(const Player& player) const noexcept;

    /// True when @p target lies inside @p viewer's horizontal view cone.
    [[nodiscard]] bool InFieldOfView(const Player& viewer, const Player& target) const noexcept;

    /// Range, view cone and line of sight (walls, objects and smokes).
    [[nodiscard]] bool CanSee(const Player& viewer, const Player& target, const MapGeometry& map,
                              const std::vector<SmokeVolume>& smokes) const;

    /// Visible enemies for every living player.
    [[nodiscard]] VisionMap ComputeVision(const std::vector<Player>& players,
                                          const MapGeometry& map,
                                          const std::vector<SmokeVolume>& smokes) const;

    /// Enemies of @p listener whose footsteps are audible: moving, running
    /// (not walking or crouched) and within footstep range.
    [[nodiscard]] std::vector<Listener> FootstepsHeardBy(const Player& listener,
                                                          const std::vector<Player>& players) const;

    /// Living players within @p range of a sound at @p source, excluding @p emitter.
    [[nodiscard]] std::vector<Listener> ListenersOf(const Vector3& source, double range,
                                                     PlayerId emitter,
                                                     const std::vector<Player>& players) const;

    /// Duel strength of @p self against @p opponent.
    ///
    /// @param opponentHasSpotted Whether @p opponent already sees @p self;
    ///        if not, @p self gets the surprise bonus.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static double CalculateAdvantage(const Player& self, const Player& opponent,
                                                   bool opponentHasSpotted,
                                                   const CombatTuning& tuning);

    /// advA / (advA + advB); 0.5 when both are zero.
    [[nodiscard]] static double WinProbability(double advantageA, double advantageB) noexcept;

    /// One uniform draw: true when side A wins.
    [[nodiscard]] static bool DecideDuel(double advantageA, double advantageB,
                                         std::mt19937_64& rng);

    /// Resolve a duel between @p a and @p b.
    [[nodiscard]] DuelOutcome ResolveDuel(const Player& a, const Player& b, bool aSpottedByB,
                                          bool bSpottedByA, std::mt19937_64& rng) const;

    [[nodiscard]] const CombatTuning& Tuning() const noexcept { return tuning_; }

private:
    CombatTuning tuning_;
};

}  // namespace rse::game
