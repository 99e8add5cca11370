/// @file weapon_types.cpp
/// @brief Stock weapon table and weapon/shield lookups.

#include "rse/game/weapon_types.hpp"

#include <algorithm>

namespace rse::game {

namespace {

using WT = WeaponType;

// name, type, cost, damage, fireRate, armorPen, accuracy, moveAcc, mag, wallPen,
// close, medium, long
constexpr std::array<WeaponStats, 18> kWeapons = {{
    {"Classic",  WT::Sidearm, 0,    26.0,  6.75,  0.50, 0.80, 0.60, 12,  0.20, 1.0, 0.8,  0.6},
    {"Shorty",   WT::Sidearm, 150,  12.0,  3.3,   0.30, 0.70, 0.55, 2,   0.10, 1.5, 0.5,  0.1},
    {"Frenzy",   WT::Sidearm, 450,  26.0,  10.0,  0.50, 0.70, 0.50, 13,  0.25, 1.0, 0.7,  0.5},
    {"Ghost",    WT::Sidearm, 500,  30.0,  6.75,  0.70, 0.85, 0.65, 15,  0.30, 1.0, 0.9,  0.75},
    {"Sheriff",  WT::Sidearm, 800,  55.0,  4.0,   0.75, 0.85, 0.50, 6,   0.50, 1.0, 0.9,  0.8},
    {"Stinger",  WT::Smg,     950,  27.0,  18.0,  0.50, 0.65, 0.70, 20,  0.30, 1.0, 0.7,  0.5},
    {"Spectre",  WT::Smg,     1600, 26.0,  13.33, 0.60, 0.75, 0.75, 30,  0.40, 1.2, 0.8,  0.6},
    {"Bucky",    WT::Shotgun, 850,  20.0,  1.1,   0.40, 0.60, 0.40, 5,   0.20, 1.2, 0.8,  0.4},
    {"Judge",    WT::Shotgun, 1850, 17.0,  3.5,   0.50, 0.55, 0.45, 7,   0.20, 1.3, 0.7,  0.3},
    {"Bulldog",  WT::Rifle,   2050, 35.0,  9.15,  0.75, 0.85, 0.40, 24,  0.60, 1.0, 0.95, 0.85},
    {"Guardian", WT::Rifle,   2250, 65.0,  5.25,  0.85, 0.95, 0.35, 12,  0.70, 1.0, 1.0,  0.95},
    {"Phantom",  WT::Rifle,   2900, 40.0,  9.75,  0.80, 0.90, 0.40, 25,  0.80, 1.0, 1.0,  1.0},
    {"Vandal",   WT::Rifle,   2900, 40.0,  9.25,  0.80, 0.85, 0.35, 25,  0.70, 1.0, 1.0,  1.0},
    {"Marshal",  WT::Sniper,  950,  101.0, 1.5,   0.90, 0.95, 0.15, 5,   0.70, 1.0, 1.0,  1.0},
    {"Operator", WT::Sniper,  4700, 150.0, 0.75,  1.00, 1.00, 0.10, 5,   0.90, 1.0, 1.0,  1.0},
    {"Outlaw",   WT::Sniper,  2400, 127.0, 1.25,  0.95, 0.98, 0.12, 5,   0.80, 1.0, 1.0,  1.0},
    {"Ares",     WT::Heavy,   1600, 30.0,  10.0,  0.70, 0.75, 0.30, 50,  0.80, 1.0, 0.9,  0.75},
    {"Odin",     WT::Heavy,   3200, 38.0,  12.0,  0.80, 0.70, 0.25, 100, 0.90, 1.0, 0.9,  0.8},
}};

}  // namespace

std::string_view WeaponTypeName(WeaponType type) noexcept {
    switch (type) {
        case WeaponType::Sidearm: return "sidearm";
        case WeaponType::Smg:     return "smg";
        case WeaponType::Shotgun: return "shotgun";
        case WeaponType::Rifle:   return "rifle";
        case WeaponType::Sniper:  return "sniper";
        case WeaponType::Heavy:   return "heavy";
    }
    return "unknown";
}

double WeaponStats::RangeMultiplier(RangeBand band) const noexcept {
    switch (band) {
        case RangeBand::Close:  return closeMultiplier;
        case RangeBand::Medium: return mediumMultiplier;
        case RangeBand::Long:   return longMultiplier;
    }
    return 1.0;
}

RangeBand RangeBandFor(double distance) noexcept {
    if (distance < kCloseRangeLimit) {
        return RangeBand::Close;
    }
    if (distance < kMediumRangeLimit) {
        return RangeBand::Medium;
    }
    return RangeBand::Long;
}

const std::array<WeaponStats, 18>& WeaponTable() noexcept {
    return kWeapons;
}

const WeaponStats* FindWeapon(std::string_view name) noexcept {
    auto it = std::find_if(kWeapons.begin(), kWeapons.end(),
                           [name](const WeaponStats& w) { return w.name == name; });
    return it != kWeapons.end() ? &*it : nullptr;
}

double WeaponTierMultipliers::For(const WeaponStats* weapon) const noexcept {
    if (weapon == nullptr) {
        return unarmed;
    }
    switch (weapon->type) {
        case WeaponType::Sidearm: return sidearm;
        case WeaponType::Smg:     return smg;
        case WeaponType::Shotgun: return shotgun;
        case WeaponType::Rifle:   return rifle;
        case WeaponType::Sniper:  return sniper;
        case WeaponType::Heavy:   return heavy;
    }
    return unarmed;
}

ShieldStats ShieldStatsFor(ShieldType shield) noexcept {
    switch (shield) {
        case ShieldType::Light: return {400, 50.0};
        case ShieldType::Heavy: return {1000, 100.0};
        case ShieldType::None:  return {0, 0.0};
    }
    return {};
}

}  // namespace rse::game
