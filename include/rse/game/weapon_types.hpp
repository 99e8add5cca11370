#pragma once

/// @file weapon_types.hpp
/// @brief Weapon classes, the stock weapon table and shield stats.

#include <array>
#include <cstdint>
#include <string_view>

#include "rse/game/player.hpp"

namespace rse::game {

/// Weapon class; drives the duel tier multiplier and buy decisions.
enum class WeaponType : uint8_t { Sidearm, Smg, Shotgun, Rifle, Sniper, Heavy };

[[nodiscard]] std::string_view WeaponTypeName(WeaponType type) noexcept;

/// Distance bands used for range falloff.
enum class RangeBand : uint8_t { Close, Medium, Long };

/// Static stats for one purchasable weapon.
struct WeaponStats {
    std::string_view name;
    WeaponType type = WeaponType::Sidearm;
    int32_t cost = 0;
    double damage = 0.0;
    double fireRate = 0.0;          ///< Rounds per second.
    double armorPenetration = 0.0;  ///< 0-1.
    double accuracy = 0.0;          ///< 0-1.
    double movementAccuracy = 0.0;  ///< 0-1, while moving.
    int32_t magazineSize = 0;
    double wallPenetration = 0.0;   ///< 0-1.
    double closeMultiplier = 1.0;
    double mediumMultiplier = 1.0;
    double longMultiplier = 1.0;

    [[nodiscard]] double RangeMultiplier(RangeBand band) const noexcept;
};

inline constexpr double kCloseRangeLimit = 10.0;
inline constexpr double kMediumRangeLimit = 25.0;

/// Close below 10 map units, medium below 25, long otherwise.
[[nodiscard]] RangeBand RangeBandFor(double distance) noexcept;

/// The 18 stock weapons, sidearms first.
[[nodiscard]] const std::array<WeaponStats, 18>& WeaponTable() noexcept;

/// Look up a weapon by its display name ("Vandal", "Classic", ...).
[[nodiscard]] const WeaponStats* FindWeapon(std::string_view name) noexcept;

/// Duel multiplier per weapon class.
struct WeaponTierMultipliers {
    double sidearm = 0.8;
    double smg = 0.9;
    double shotgun = 0.9;
    double rifle = 1.0;
    double sniper = 1.1;
    double heavy = 0.95;
    double unarmed = 0.3;  ///< Unknown or missing weapon.

    [[nodiscard]] double For(const WeaponStats* weapon) const noexcept;
};

/// Purchasable shield cost and armor.
struct ShieldStats {
    int32_t cost = 0;
    double armor = 0.0;
};

[[nodiscard]] ShieldStats ShieldStatsFor(ShieldType shield) noexcept;

}  // namespace rse::game
