#pragma once

/// @file player.hpp
/// @brief Player model: identity, combat stats, physics state and status effects.

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "rse/foundation/types.hpp"
#include "rse/game/math_types.hpp"

namespace rse::game {

using foundation::InstanceId;
using foundation::PlayerId;

/// Side a player plays for this round.
enum class Team : uint8_t { Attackers, Defenders };

[[nodiscard]] constexpr Team Opponent(Team team) noexcept {
    return team == Team::Attackers ? Team::Defenders : Team::Attackers;
}

[[nodiscard]] constexpr std::string_view TeamName(Team team) noexcept {
    return team == Team::Attackers ? "attackers" : "defenders";
}

/// Purchasable body armour.
enum class ShieldType : uint8_t { None, Light, Heavy };

[[nodiscard]] std::string_view ShieldName(ShieldType shield) noexcept;

/// Timed conditions applied by abilities.
enum class StatusEffectType : uint8_t {
    Flashed,   ///< Blinded; heavy duel penalty.
    Smoked,    ///< Standing inside a smoke.
    Burning,   ///< Inside a molly.
    Revealed,  ///< Position exposed to the enemy team.
    Slowed     ///< Movement speed and duel penalty.
};

[[nodiscard]] std::string_view StatusEffectName(StatusEffectType type) noexcept;

/// One active status effect, tagged with the ability instance that applied it.
struct StatusEffect {
    StatusEffectType type = StatusEffectType::Flashed;
    double remaining = 0.0;
    InstanceId source;
};

/// Set of active status effects with independent remaining durations.
///
/// Effects from different sources stack as separate entries; reapplying
/// from the same source refreshes the remaining time.
struct StatusEffects {
    std::vector<StatusEffect> entries;

    /// Add or refresh an effect from @p source.
    void Apply(StatusEffectType type, double duration, InstanceId source);

    [[nodiscard]] bool Has(StatusEffectType type) const noexcept;

    /// Longest remaining time among effects of @p type (0 when absent).
    [[nodiscard]] double Remaining(StatusEffectType type) const noexcept;

    /// Count down all effects and drop the ones that ran out.
    void Tick(double deltaTime);

    /// Remove every effect applied by @p source.
    void ClearBySource(InstanceId source);

    void Clear() noexcept { entries.clear(); }
};

/// Ability carried by a player and its remaining charges.
struct AbilitySlot {
    std::string ability;
    int32_t charges = 0;
};

/// Skill ratings on a 0-100 scale.
struct SkillRatings {
    double aim = 50.0;
    double movementAccuracy = 50.0;
    double utility = 50.0;
    double clutch = 50.0;
};

/// Counters reset at the start of each round.
struct RoundStats {
    int32_t kills = 0;
    int32_t deaths = 0;
    int32_t assists = 0;
    int32_t plants = 0;
    int32_t defuses = 0;
    double damageDealt = 0.0;
    double damageTaken = 0.0;
};

inline constexpr double kMaxHealth = 100.0;
inline constexpr double kArmorAbsorption = 0.5;
inline constexpr const char* kDefaultSidearm = "Classic";

/// A single participant of the round.
///
/// Position is the point under the player's feet.  The Round owns every
/// Player for its lifetime; other systems receive references.
struct Player {
    // Identity
    PlayerId id;
    std::string name;
    Team team = Team::Attackers;
    std::string role;
    std::string agent;

    // Combat state
    double health = kMaxHealth;
    double armor = 0.0;
    int32_t credits = 800;
    std::string weapon;                    ///< Primary weapon; empty when none.
    std::string sidearm = kDefaultSidearm;
    ShieldType shield = ShieldType::None;
    bool alive = true;
    SkillRatings skills;

    // Physics
    Vector3 position;
    Vector3 velocity;
    Vector3 acceleration;
    double yaw = 0.0;           ///< View direction in radians, 0 = +x.
    Vector3 moveDirection;      ///< Normalized horizontal input, zero when idle.
    bool walking = false;
    bool crouching = false;
    bool forcedCrouch = false;
    bool jumping = false;
    bool falling = false;
    bool grounded = true;
    double lastGroundZ = 0.0;

    // Abilities and effects
    StatusEffects status;
    std::vector<AbilitySlot> abilities;
    int32_t ultPoints = 0;

    // Objective
    bool hasSpike = false;
    bool planting = false;
    bool defusing = false;
    double plantProgress = 0.0;
    double defuseProgress = 0.0;

    RoundStats stats;

    /// Apply incoming damage.  Armor soaks up to half of it first.
    /// @return Health actually removed.
    double ApplyDamage(double amount);

    /// Restore health up to kMaxHealth.
    /// @return Health actually restored.
    double Heal(double amount);

    [[nodiscard]] Vector3 ViewDirection() const noexcept { return DirectionFromYaw(yaw); }

    /// Weapon currently in hand: the primary if any, else the sidearm.
    [[nodiscard]] const std::string& ActiveWeapon() const noexcept {
        return weapon.empty() ? sidearm : weapon;
    }

    [[nodiscard]] bool IsMoving() const noexcept;

    [[nodiscard]] bool IsCrouched() const noexcept { return crouching || forcedCrouch; }

    [[nodiscard]] bool IsAirborne() const noexcept { return jumping || falling; }

    [[nodiscard]] AbilitySlot* FindAbility(std::string_view ability) noexcept;
};

}  // namespace rse::game
