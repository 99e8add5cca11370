/// @file economy.cpp
/// @brief Purchase ladder, loss bonus and carryover.

#include "rse/game/economy.hpp"

#include <algorithm>
#include <utility>

#include "rse/game/weapon_types.hpp"

namespace rse::game {

namespace {

/// Pick @p first with probability @p chance, else @p second.
const char* pick(std::mt19937_64& rng, double chance, const char* first, const char* second) {
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    return draw(rng) < chance ? first : second;
}

int32_t costOf(const std::string& weapon) {
    const WeaponStats* stats = FindWeapon(weapon);
    return stats != nullptr ? stats->cost : 0;
}

}  // namespace

int32_t LossBonus(int32_t lossStreak, const EconomyTuning& tuning) {
    const int32_t steps = std::clamp(lossStreak - 1, 0, tuning.lossBonusMaxSteps);
    return tuning.lossBonusBase + tuning.lossBonusStep * steps;
}

PurchaseDecision DecideBuy(const Player& player, std::mt19937_64& rng,
                           const EconomyTuning& tuning) {
    PurchaseDecision decision;
    const int32_t credits = player.credits;
    const int32_t heavy = ShieldStatsFor(ShieldType::Heavy).cost;
    const int32_t light = ShieldStatsFor(ShieldType::Light).cost;

    if (!player.weapon.empty()) {
        if (player.shield != ShieldType::Heavy && credits >= heavy) {
            decision.shield = ShieldType::Heavy;
            decision.cost = heavy;
        } else if (player.shield == ShieldType::None && credits >= light) {
            decision.shield = ShieldType::Light;
            decision.cost = light;
        }
        return decision;
    }

    if (credits >= tuning.fullBuyThreshold) {
        decision.weapon = pick(rng, 0.5, "Vandal", "Phantom");
        decision.shield = ShieldType::Heavy;
    } else if (credits >= tuning.halfBuyThreshold) {
        decision.weapon = pick(rng, 0.7, "Spectre", "Bulldog");
        if (costOf(decision.weapon) + light > credits) {
            decision.weapon = "Spectre";
        }
        decision.shield = ShieldType::Light;
    } else if (credits >= tuning.ecoBuyThreshold) {
        decision.weapon = pick(rng, 0.6, "Sheriff", "Ghost");
        if (credits >= tuning.ecoShieldThreshold) {
            decision.shield = ShieldType::Light;
        }
    } else {
        return decision;
    }

    decision.cost = costOf(decision.weapon) + ShieldStatsFor(decision.shield).cost;
    return decision;
}

bool ApplyPurchase(Player& player, const PurchaseDecision& purchase) {
    if (purchase.Empty()) {
        return false;
    }
    const WeaponStats* weapon = nullptr;
    if (!purchase.weapon.empty()) {
        weapon = FindWeapon(purchase.weapon);
        if (weapon == nullptr) {
            return false;
        }
    }
    const int32_t cost = (weapon != nullptr ? weapon->cost : 0) +
                         ShieldStatsFor(purchase.shield).cost;
    if (cost > player.credits) {
        return false;
    }

    player.credits -= cost;
    if (weapon != nullptr) {
        if (weapon->type == WeaponType::Sidearm) {
            player.sidearm = purchase.weapon;
        } else {
            player.weapon = purchase.weapon;
        }
    }
    if (purchase.shield != ShieldType::None) {
        player.shield = purchase.shield;
        player.armor = ShieldStatsFor(purchase.shield).armor;
    }
    return true;
}

Carryover ComputeCarryover(const std::vector<Player>& players, Team winner,
                           const LossBonusInput& lossBonus, const EconomyTuning& tuning) {
    const int32_t attackersLoss =
        lossBonus.attackersOverride.value_or(LossBonus(lossBonus.attackersLossStreak, tuning));
    const int32_t defendersLoss =
        lossBonus.defendersOverride.value_or(LossBonus(lossBonus.defendersLossStreak, tuning));

    Carryover carryover;
    for (const auto& player : players) {
        PlayerCarryover entry;
        entry.id = player.id;
        entry.team = player.team;
        entry.alive = player.alive;
        entry.credits = player.credits;
        entry.abilities = player.abilities;
        entry.stats = player.stats;
        if (player.alive) {
            entry.weapon = player.weapon;
            entry.shield = player.shield;
        }

        if (player.team == winner) {
            entry.creditsDelta = tuning.winCredits;
        } else {
            entry.creditsDelta = player.team == Team::Attackers ? attackersLoss : defendersLoss;
        }
        if (player.stats.plants > 0) {
            entry.creditsDelta += tuning.plantBonus;
        }
        if (player.stats.defuses > 0) {
            entry.creditsDelta += tuning.defuseBonus;
        }
        entry.creditsDelta += tuning.killReward * player.stats.kills;

        entry.ultPointsDelta = player.stats.kills + (player.stats.plants > 0 ? 1 : 0) +
                               (player.stats.defuses > 0 ? 1 : 0);
        carryover.emplace(player.id, std::move(entry));
    }
    return carryover;
}

void ApplyCarryover(std::vector<Player>& players, const Carryover& carryover,
                    const AbilityCatalog& catalog, const EconomyTuning& tuning) {
    for (auto& player : players) {
        auto it = carryover.find(player.id);
        if (it == carryover.end()) {
            continue;
        }
        const auto& entry = it->second;

        player.credits = std::min(entry.credits + entry.creditsDelta, tuning.maxCredits);
        player.weapon = entry.weapon;
        if (!entry.alive) {
            player.sidearm = kDefaultSidearm;
        }
        player.shield = entry.shield;
        player.armor = ShieldStatsFor(entry.shield).armor;
        player.ultPoints = std::min(player.ultPoints + entry.ultPointsDelta, tuning.maxUltPoints);
        player.abilities = entry.abilities;
        for (auto& slot : player.abilities) {
            if (const AbilityDefinition* definition = catalog.Find(slot.ability)) {
                slot.charges = definition->maxCharges;
            }
        }

        player.health = kMaxHealth;
        player.alive = true;
        player.status.Clear();
        player.hasSpike = false;
        player.planting = false;
        player.defusing = false;
        player.plantProgress = 0.0;
        player.defuseProgress = 0.0;
        player.velocity = Vector3::Zero();
        player.acceleration = Vector3::Zero();
        player.jumping = false;
        player.falling = false;
        player.grounded = true;
        player.stats = RoundStats{};
    }
}

}  // namespace rse::game
