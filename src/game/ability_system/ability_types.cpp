/// @file ability_types.cpp
/// @brief Ability names, definition validation and the stock catalog.

#include "rse/game/ability_types.hpp"

namespace rse::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

std::string_view AbilityTypeName(AbilityType type) noexcept {
    switch (type) {
        case AbilityType::Flash: return "flash";
        case AbilityType::Smoke: return "smoke";
        case AbilityType::Molly: return "molly";
        case AbilityType::Recon: return "recon";
        case AbilityType::Trap:  return "trap";
        case AbilityType::Heal:  return "heal";
    }
    return "unknown";
}

std::string_view TargetingKindName(TargetingKind kind) noexcept {
    switch (kind) {
        case TargetingKind::Point:      return "point";
        case TargetingKind::Projectile: return "projectile";
        case TargetingKind::Self:       return "self";
        case TargetingKind::Area:       return "area";
    }
    return "unknown";
}

std::optional<AbilityType> ParseAbilityType(std::string_view text) noexcept {
    for (auto type : {AbilityType::Flash, AbilityType::Smoke, AbilityType::Molly,
                      AbilityType::Recon, AbilityType::Trap, AbilityType::Heal}) {
        if (AbilityTypeName(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<TargetingKind> ParseTargetingKind(std::string_view text) noexcept {
    for (auto kind : {TargetingKind::Point, TargetingKind::Projectile, TargetingKind::Self,
                      TargetingKind::Area}) {
        if (TargetingKindName(kind) == text) {
            return kind;
        }
    }
    return std::nullopt;
}

// ── AbilityDefinition ───────────────────────────────────────────────────

GameResult<void> AbilityDefinition::Validate() const {
    const auto invalid = [this](std::string_view what) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidAbilityDefinition,
            "ability '" + name + "': " + std::string(what)));
    };

    if (name.empty()) {
        return invalid("name must not be empty");
    }
    if (duration <= 0.0) {
        return invalid("duration must be positive");
    }
    if (effectRadius <= 0.0) {
        return invalid("effect radius must be positive");
    }
    if (maxCharges < 0) {
        return invalid("charges must not be negative");
    }
    if (castTime < 0.0 || castTime > duration) {
        return invalid("cast time must lie within the duration");
    }
    if (damagePerSecond < 0.0 || healingPerSecond < 0.0 || bounces < 0) {
        return invalid("damage, healing and bounces must not be negative");
    }
    if (targeting == TargetingKind::Projectile && projectileSpeed <= 0.0) {
        return invalid("projectiles need a positive speed");
    }
    if (appliedStatus && statusDuration <= 0.0) {
        return invalid("applied status needs a positive duration");
    }
    return GameResult<void>::ok();
}

// ── AbilityCatalog ──────────────────────────────────────────────────────

GameResult<void> AbilityCatalog::Register(AbilityDefinition definition) {
    if (auto valid = definition.Validate(); !valid) {
        return valid;
    }
    if (definitions_.find(definition.name) != definitions_.end()) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyExists, "ability '" + definition.name + "' already registered"));
    }
    order_.push_back(definition.name);
    auto key = definition.name;
    definitions_.emplace(std::move(key), std::move(definition));
    return GameResult<void>::ok();
}

const AbilityDefinition* AbilityCatalog::Find(std::string_view name) const noexcept {
    auto it = definitions_.find(std::string(name));
    return it != definitions_.end() ? &it->second : nullptr;
}

AbilityCatalog AbilityCatalog::Standard() {
    AbilityCatalog catalog;

    AbilityDefinition flash;
    flash.name = "flash";
    flash.type = AbilityType::Flash;
    flash.targeting = TargetingKind::Projectile;
    flash.maxCharges = 2;
    flash.castTime = 0.2;
    flash.duration = 1.5;
    flash.effectRadius = 10.0;
    flash.maxRange = 30.0;
    flash.bounces = 1;
    flash.projectileSpeed = 25.0;
    flash.appliedStatus = StatusEffectType::Flashed;
    flash.statusDuration = 1.5;

    AbilityDefinition smoke;
    smoke.name = "smoke";
    smoke.type = AbilityType::Smoke;
    smoke.targeting = TargetingKind::Point;
    smoke.maxCharges = 2;
    smoke.duration = 15.0;
    smoke.effectRadius = 4.0;
    smoke.maxRange = 40.0;
    smoke.appliedStatus = StatusEffectType::Smoked;
    smoke.statusDuration = 0.25;

    AbilityDefinition molly;
    molly.name = "molly";
    molly.type = AbilityType::Molly;
    molly.targeting = TargetingKind::Projectile;
    molly.maxCharges = 1;
    molly.castTime = 0.6;
    molly.duration = 7.0;
    molly.effectRadius = 3.5;
    molly.maxRange = 20.0;
    molly.damagePerSecond = 25.0;
    molly.bounces = 1;
    molly.projectileSpeed = 15.0;
    molly.appliedStatus = StatusEffectType::Burning;
    molly.statusDuration = 0.25;

    AbilityDefinition recon;
    recon.name = "recon";
    recon.type = AbilityType::Recon;
    recon.targeting = TargetingKind::Projectile;
    recon.maxCharges = 1;
    recon.castTime = 0.5;
    recon.duration = 4.0;
    recon.effectRadius = 15.0;
    recon.maxRange = 40.0;
    recon.bounces = 1;
    recon.projectileSpeed = 30.0;
    recon.appliedStatus = StatusEffectType::Revealed;
    recon.statusDuration = 1.0;

    AbilityDefinition trap;
    trap.name = "trap";
    trap.type = AbilityType::Trap;
    trap.targeting = TargetingKind::Point;
    trap.maxCharges = 1;
    trap.duration = 30.0;
    trap.effectRadius = 2.0;
    trap.maxRange = 10.0;
    trap.appliedStatus = StatusEffectType::Slowed;
    trap.statusDuration = 2.0;

    AbilityDefinition heal;
    heal.name = "heal";
    heal.type = AbilityType::Heal;
    heal.targeting = TargetingKind::Self;
    heal.maxCharges = 1;
    heal.duration = 4.0;
    heal.effectRadius = 5.0;
    heal.healingPerSecond = 12.5;

    for (auto* def : {&flash, &smoke, &molly, &recon, &trap, &heal}) {
        catalog.order_.push_back(def->name);
        catalog.definitions_.emplace(def->name, std::move(*def));
    }
    return catalog;
}

}  // namespace rse::game
