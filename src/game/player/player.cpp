/// @file player.cpp
/// @brief Player and StatusEffects implementation.

#include "rse/game/player.hpp"

#include <algorithm>

namespace rse::game {

namespace {
constexpr double kMovingSpeedThreshold = 0.1;
}  // namespace

std::string_view ShieldName(ShieldType shield) noexcept {
    switch (shield) {
        case ShieldType::None:  return "none";
        case ShieldType::Light: return "light";
        case ShieldType::Heavy: return "heavy";
    }
    return "none";
}

std::string_view StatusEffectName(StatusEffectType type) noexcept {
    switch (type) {
        case StatusEffectType::Flashed:  return "flashed";
        case StatusEffectType::Smoked:   return "smoked";
        case StatusEffectType::Burning:  return "burning";
        case StatusEffectType::Revealed: return "revealed";
        case StatusEffectType::Slowed:   return "slowed";
    }
    return "unknown";
}

// ── StatusEffects ───────────────────────────────────────────────────────

void StatusEffects::Apply(StatusEffectType type, double duration, InstanceId source) {
    if (duration <= 0.0) {
        return;
    }
    for (auto& entry : entries) {
        if (entry.type == type && entry.source == source) {
            entry.remaining = std::max(entry.remaining, duration);
            return;
        }
    }
    entries.push_back({type, duration, source});
}

bool StatusEffects::Has(StatusEffectType type) const noexcept {
    return std::any_of(entries.begin(), entries.end(),
                       [type](const StatusEffect& e) { return e.type == type; });
}

double StatusEffects::Remaining(StatusEffectType type) const noexcept {
    double longest = 0.0;
    for (const auto& entry : entries) {
        if (entry.type == type) {
            longest = std::max(longest, entry.remaining);
        }
    }
    return longest;
}

void StatusEffects::Tick(double deltaTime) {
    for (auto& entry : entries) {
        entry.remaining -= deltaTime;
    }
    std::erase_if(entries, [](const StatusEffect& e) { return e.remaining <= 0.0; });
}

void StatusEffects::ClearBySource(InstanceId source) {
    std::erase_if(entries, [source](const StatusEffect& e) { return e.source == source; });
}

// ── Player ──────────────────────────────────────────────────────────────

double Player::ApplyDamage(double amount) {
    if (!alive || amount <= 0.0) {
        return 0.0;
    }
    const double absorbed = std::min(armor, amount * kArmorAbsorption);
    armor -= absorbed;
    const double healthDamage = std::min(health, amount - absorbed);
    health -= healthDamage;
    stats.damageTaken += healthDamage;
    return healthDamage;
}

double Player::Heal(double amount) {
    if (!alive || amount <= 0.0) {
        return 0.0;
    }
    const double restored = std::min(amount, kMaxHealth - health);
    health += restored;
    return restored;
}

bool Player::IsMoving() const noexcept {
    return velocity.HorizontalLength() > kMovingSpeedThreshold;
}

AbilitySlot* Player::FindAbility(std::string_view ability) noexcept {
    auto it = std::find_if(abilities.begin(), abilities.end(),
                           [ability](const AbilitySlot& s) { return s.ability == ability; });
    return it != abilities.end() ? &*it : nullptr;
}

}  // namespace rse::game
