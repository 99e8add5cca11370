/// @file simulation_config.cpp
/// @brief SimulationConfig overlay and validation.

#include "rse/game/simulation_config.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "rse/foundation/game_logger.hpp"

namespace rse::game {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

/// Reads keys into fields, keeping the first error.
class Overlay {
public:
    explicit Overlay(const ConfigManager& config) : config_(config) {}

    template <typename T>
    Overlay& Read(std::string_view key, T& field) {
        if (error_) {
            return *this;
        }
        auto value = config_.getOr<T>(key, field);
        if (!value) {
            error_ = value.error();
            return *this;
        }
        field = value.value();
        return *this;
    }

    [[nodiscard]] const std::optional<GameError>& Error() const noexcept { return error_; }

private:
    const ConfigManager& config_;
    std::optional<GameError> error_;
};

GameResult<void> outOfRange(std::string_view key, std::string_view rule) {
    return GameResult<void>::err(GameError(
        ErrorCode::ConfigValueOutOfRange,
        std::string(key) + " must be " + std::string(rule)));
}

bool isProbability(double p) noexcept { return p >= 0.0 && p <= 1.0; }

}  // namespace

GameResult<void> SimulationConfig::Validate() const {
    // ── Round ──────────────────────────────────────────────────────────
    if (round.tickInterval <= 0.0) return outOfRange("round.tick_interval", "positive");
    if (round.roundTime <= 0.0) return outOfRange("round.round_time", "positive");
    if (round.buyTime < 0.0) return outOfRange("round.buy_time", "non-negative");
    if (round.pistolBuyTime < 0.0) return outOfRange("round.pistol_buy_time", "non-negative");
    if (round.spikeTime <= 0.0) return outOfRange("round.spike_time", "positive");
    if (round.plantTime <= 0.0) return outOfRange("round.plant_time", "positive");
    if (round.defuseTime <= 0.0) return outOfRange("round.defuse_time", "positive");
    if (round.defuseRadius <= 0.0) return outOfRange("round.defuse_radius", "positive");

    // ── Movement ───────────────────────────────────────────────────────
    if (movement.runSpeed <= 0.0 || movement.walkSpeed <= 0.0 || movement.crouchSpeed <= 0.0) {
        return outOfRange("movement.*_speed", "positive");
    }
    if (movement.gravity <= 0.0) return outOfRange("movement.gravity", "positive");
    if (movement.radius <= 0.0) return outOfRange("movement.radius", "positive");
    if (movement.crouchHeight <= 0.0 || movement.crouchHeight > movement.standingHeight) {
        return outOfRange("movement.crouch_height", "in (0, standing_height]");
    }
    if (movement.fallDamageThreshold < 0.0 || movement.fallDamagePerUnit < 0.0) {
        return outOfRange("movement.fall_damage_*", "non-negative");
    }

    // ── Combat ─────────────────────────────────────────────────────────
    if (combat.fieldOfViewDegrees <= 0.0 || combat.fieldOfViewDegrees > 360.0) {
        return outOfRange("combat.field_of_view", "in (0, 360]");
    }
    if (combat.maxVisionDistance <= 0.0) return outOfRange("combat.max_vision_distance", "positive");
    if (combat.advantageFloor <= 0.0) return outOfRange("combat.advantage_floor", "positive");
    if (!isProbability(combat.headshotChance)) {
        return outOfRange("combat.headshot_chance", "in [0, 1]");
    }
    if (combat.minDroppedAmmo < 0 || combat.maxDroppedAmmo < combat.minDroppedAmmo) {
        return outOfRange("combat.dropped_ammo", "a non-negative, ordered range");
    }

    // ── Abilities ──────────────────────────────────────────────────────
    if (ability.flashViewDotThreshold < -1.0 || ability.flashViewDotThreshold > 1.0) {
        return outOfRange("ability.flash_view_dot_threshold", "in [-1, 1]");
    }

    // ── Economy ────────────────────────────────────────────────────────
    if (economy.maxCredits <= 0) return outOfRange("economy.max_credits", "positive");
    if (economy.maxUltPoints < 0) return outOfRange("economy.max_ult_points", "non-negative");
    if (economy.lossBonusMaxSteps < 0) return outOfRange("economy.loss_bonus_max_steps", "non-negative");
    if (economy.winCredits < 0 || economy.lossBonusBase < 0 || economy.killReward < 0) {
        return outOfRange("economy rewards", "non-negative");
    }

    // ── Blackboard ─────────────────────────────────────────────────────
    if (blackboard.decayBase <= 0.0 || blackboard.decayBase > 1.0) {
        return outOfRange("blackboard.decay_base", "in (0, 1]");
    }
    if (blackboard.decayInterval <= 0.0) return outOfRange("blackboard.decay_interval", "positive");

    return GameResult<void>::ok();
}

GameResult<SimulationConfig> LoadSimulationConfig(const ConfigManager& config) {
    SimulationConfig sim;
    Overlay overlay(config);

    overlay.Read("round.tick_interval", sim.round.tickInterval)
        .Read("round.round_time", sim.round.roundTime)
        .Read("round.buy_time", sim.round.buyTime)
        .Read("round.pistol_buy_time", sim.round.pistolBuyTime)
        .Read("round.spike_time", sim.round.spikeTime)
        .Read("round.plant_time", sim.round.plantTime)
        .Read("round.defuse_time", sim.round.defuseTime)
        .Read("round.defuse_radius", sim.round.defuseRadius)
        .Read("round.pistol_rounds", sim.round.pistolRounds);

    overlay.Read("movement.run_speed", sim.movement.runSpeed)
        .Read("movement.walk_speed", sim.movement.walkSpeed)
        .Read("movement.crouch_speed", sim.movement.crouchSpeed)
        .Read("movement.acceleration", sim.movement.accelerationRate)
        .Read("movement.friction", sim.movement.friction)
        .Read("movement.gravity", sim.movement.gravity)
        .Read("movement.jump_speed", sim.movement.jumpSpeed)
        .Read("movement.airborne_speed_multiplier", sim.movement.airborneSpeedMultiplier)
        .Read("movement.slowed_speed_multiplier", sim.movement.slowedSpeedMultiplier)
        .Read("movement.radius", sim.movement.radius)
        .Read("movement.standing_height", sim.movement.standingHeight)
        .Read("movement.crouch_height", sim.movement.crouchHeight)
        .Read("movement.fall_damage_threshold", sim.movement.fallDamageThreshold)
        .Read("movement.fall_damage_per_unit", sim.movement.fallDamagePerUnit);

    overlay.Read("combat.field_of_view", sim.combat.fieldOfViewDegrees)
        .Read("combat.max_vision_distance", sim.combat.maxVisionDistance)
        .Read("combat.footstep_range", sim.combat.footstepRange)
        .Read("combat.gunshot_range", sim.combat.gunshotRange)
        .Read("combat.flash_multiplier", sim.combat.flashedMultiplier)
        .Read("combat.slowed_multiplier", sim.combat.slowedMultiplier)
        .Read("combat.surprise_multiplier", sim.combat.surpriseMultiplier)
        .Read("combat.high_ground_multiplier", sim.combat.highGroundMultiplier)
        .Read("combat.high_ground_threshold", sim.combat.highGroundThreshold)
        .Read("combat.close_range_multiplier", sim.combat.closeRangeMultiplier)
        .Read("combat.close_range_distance", sim.combat.closeRangeDistance)
        .Read("combat.far_range_multiplier", sim.combat.farRangeMultiplier)
        .Read("combat.far_range_distance", sim.combat.farRangeDistance)
        .Read("combat.armor_multiplier_per_point", sim.combat.armorMultiplierPerPoint)
        .Read("combat.advantage_floor", sim.combat.advantageFloor)
        .Read("combat.headshot_chance", sim.combat.headshotChance)
        .Read("combat.assist_window", sim.combat.assistWindow)
        .Read("combat.pickup_radius", sim.combat.pickupRadius)
        .Read("combat.min_dropped_ammo", sim.combat.minDroppedAmmo)
        .Read("combat.max_dropped_ammo", sim.combat.maxDroppedAmmo);

    overlay.Read("ability.flash_view_dot_threshold", sim.ability.flashViewDotThreshold)
        .Read("ability.eye_height", sim.ability.eyeHeight);

    overlay.Read("economy.win_credits", sim.economy.winCredits)
        .Read("economy.loss_bonus_base", sim.economy.lossBonusBase)
        .Read("economy.loss_bonus_step", sim.economy.lossBonusStep)
        .Read("economy.loss_bonus_max_steps", sim.economy.lossBonusMaxSteps)
        .Read("economy.plant_bonus", sim.economy.plantBonus)
        .Read("economy.defuse_bonus", sim.economy.defuseBonus)
        .Read("economy.kill_reward", sim.economy.killReward)
        .Read("economy.starting_credits", sim.economy.startingCredits)
        .Read("economy.max_credits", sim.economy.maxCredits)
        .Read("economy.max_ult_points", sim.economy.maxUltPoints);

    overlay.Read("blackboard.decay_base", sim.blackboard.decayBase)
        .Read("blackboard.decay_interval", sim.blackboard.decayInterval)
        .Read("blackboard.forget_threshold", sim.blackboard.forgetThreshold)
        .Read("blackboard.noise_memory", sim.blackboard.noiseMemory);

    if (overlay.Error()) {
        RSE_LOG_ERROR(LogCategory::Core,
                      "Simulation config rejected: " + std::string(overlay.Error()->message()));
        return GameResult<SimulationConfig>::err(*overlay.Error());
    }

    auto valid = sim.Validate();
    if (!valid) {
        RSE_LOG_ERROR(LogCategory::Core, "Simulation config rejected: " + std::string(valid.error().message()));
        return GameResult<SimulationConfig>::err(valid.error());
    }
    return GameResult<SimulationConfig>::ok(std::move(sim));
}

}  // namespace rse::game
