#pragma once

/// @file economy.hpp
/// @brief Buy-phase purchase ladder, loss bonus and end-of-round carryover.

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "rse/game/ability_types.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// Credit rewards and buy thresholds.
struct EconomyTuning {
    int32_t winCredits = 3000;
    int32_t lossBonusBase = 1900;
    int32_t lossBonusStep = 500;
    int32_t lossBonusMaxSteps = 4;
    int32_t plantBonus = 300;
    int32_t defuseBonus = 300;
    int32_t killReward = 200;
    int32_t startingCredits = 800;
    int32_t maxCredits = 9000;
    int32_t maxUltPoints = 7;

    int32_t fullBuyThreshold = 3900;
    int32_t halfBuyThreshold = 2400;
    int32_t ecoBuyThreshold = 950;
    int32_t ecoShieldThreshold = 1400;
};

/// What one player buys in the buy phase.
struct PurchaseDecision {
    std::string weapon;                   ///< Empty when not buying a weapon.
    ShieldType shield = ShieldType::None; ///< None when not buying a shield.
    int32_t cost = 0;

    [[nodiscard]] bool Empty() const noexcept {
        return weapon.empty() && shield == ShieldType::None;
    }
};

/// Loss bonus after @p lossStreak consecutive losses (at least one):
/// base + step * min(streak - 1, maxSteps).
[[nodiscard]] int32_t LossBonus(int32_t lossStreak, const EconomyTuning& tuning = {});

/// Pick a purchase from the player's credits:
///   >= 3900: Vandal or Phantom with heavy shield
///   >= 2400: Spectre or Bulldog with light shield
///   >=  950: Sheriff or Ghost, plus a light shield from 1400 up
///   else   : save
///
/// A player still holding a primary weapon only tops up the shield.
/// Random choices draw from @p rng; the result is always affordable.
[[nodiscard]] PurchaseDecision DecideBuy(const Player& player, std::mt19937_64& rng,
                                         const EconomyTuning& tuning = {});

/// Charge and equip an explicit purchase.
/// @return false (and no change) when unaffordable or unknown.
bool ApplyPurchase(Player& player, const PurchaseDecision& purchase);

/// What one player takes into the next round.
struct PlayerCarryover {
    PlayerId id;
    Team team = Team::Attackers;
    bool alive = true;
    int32_t credits = 0;       ///< Credits at round end, before the delta.
    int32_t creditsDelta = 0;  ///< Win or loss bonus plus objective and kill rewards.
    std::string weapon;        ///< Kept only by survivors.
    ShieldType shield = ShieldType::None;
    int32_t ultPointsDelta = 0;
    std::vector<AbilitySlot> abilities;
    RoundStats stats;
};

using Carryover = std::map<PlayerId, PlayerCarryover>;

/// Per-team loss bonus inputs.  An explicit override wins over the streak.
struct LossBonusInput {
    std::optional<int32_t> attackersOverride;
    std::optional<int32_t> defendersOverride;
    int32_t attackersLossStreak = 1;
    int32_t defendersLossStreak = 1;
};

/// Compute every player's carryover for a round won by @p winner.
[[nodiscard]] Carryover ComputeCarryover(const std::vector<Player>& players, Team winner,
                                         const LossBonusInput& lossBonus,
                                         const EconomyTuning& tuning = {});

/// Apply @p carryover and reset per-round state for the next round:
/// full health, armor from the kept shield, statuses and progress cleared,
/// credits capped at maxCredits, ult points capped at maxUltPoints.
/// Ability slots are refilled to their definition's maxCharges; slots
/// naming an ability missing from @p catalog keep their charges.
void ApplyCarryover(std::vector<Player>& players, const Carryover& carryover,
                    const AbilityCatalog& catalog, const EconomyTuning& tuning = {});

}  // namespace rse::game
