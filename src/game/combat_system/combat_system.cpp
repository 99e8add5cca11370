/// @file combat_system.cpp
/// @brief CombatSystem implementation.

#include "rse/game/combat_system.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace rse::game {

Vector3 CombatSystem::EyePosition(const Player& player) const noexcept {
    const double eye = player.IsCrouched() ? tuning_.crouchingEyeHeight
                                           : tuning_.standingEyeHeight;
    return player.position + Vector3{0.0, 0.0, eye};
}

bool CombatSystem::InFieldOfView(const Player& viewer, const Player& target) const noexcept {
    const Vector3 flat{target.position.x - viewer.position.x,
                       target.position.y - viewer.position.y, 0.0};
    const Vector3 dir = flat.Normalized();
    if (dir.LengthSquared() == 0.0) {
        return true;
    }
    const double halfFov = tuning_.fieldOfViewDegrees * 0.5 * std::numbers::pi / 180.0;
    return viewer.ViewDirection().Dot(dir) >= std::cos(halfFov);
}

bool CombatSystem::CanSee(const Player& viewer, const Player& target, const MapGeometry& map,
                          const std::vector<SmokeVolume>& smokes) const {
    if (!viewer.alive || !target.alive) {
        return false;
    }
    const Vector3 from = EyePosition(viewer);
    const Vector3 to = EyePosition(target);
    if (Distance(from, to) > tuning_.maxVisionDistance) {
        return false;
    }
    if (!InFieldOfView(viewer, target)) {
        return false;
    }
    return map.LineOfSight(from, to, smokes);
}

VisionMap CombatSystem::ComputeVision(const std::vector<Player>& players,
                                      const MapGeometry& map,
                                      const std::vector<SmokeVolume>& smokes) const {
    VisionMap vision;
    for (const auto& viewer : players) {
        if (!viewer.alive) {
            continue;
        }
        auto& seen = vision[viewer.id];
        for (const auto& target : players) {
            if (target.team == viewer.team || !CanSee(viewer, target, map, smokes)) {
                continue;
            }
            seen.push_back({target.id, Distance(viewer.position, target.position),
                            InFieldOfView(target, viewer)});
        }
    }
    return vision;
}

std::vector<Listener> CombatSystem::FootstepsHeardBy(const Player& listener,
                                                     const std::vector<Player>& players) const {
    std::vector<Listener> heard;
    if (!listener.alive) {
        return heard;
    }
    for (const auto& other : players) {
        if (!other.alive || other.team == listener.team || !other.IsMoving() ||
            other.walking || other.IsCrouched()) {
            continue;
        }
        const double d = Distance(listener.position, other.position);
        if (d <= tuning_.footstepRange) {
            heard.push_back({other.id, 1.0 - d / tuning_.footstepRange});
        }
    }
    return heard;
}

std::vector<Listener> CombatSystem::ListenersOf(const Vector3& source, double range,
                                                PlayerId emitter,
                                                const std::vector<Player>& players) const {
    std::vector<Listener> listeners;
    if (range <= 0.0) {
        return listeners;
    }
    for (const auto& player : players) {
        if (!player.alive || player.id == emitter) {
            continue;
        }
        const double d = Distance(source, player.position);
        if (d <= range) {
            listeners.push_back({player.id, 1.0 - d / range});
        }
    }
    return listeners;
}

// ── Duels ───────────────────────────────────────────────────────────────

double CombatSystem::CalculateAdvantage(const Player& self, const Player& opponent,
                                        bool opponentHasSpotted, const CombatTuning& tuning) {
    const double distance = Distance(self.position, opponent.position);
    const WeaponStats* weapon = FindWeapon(self.ActiveWeapon());

    double advantage = self.skills.aim / 100.0;
    advantage *= tuning.tiers.For(weapon);
    if (weapon != nullptr) {
        advantage *= weapon->RangeMultiplier(RangeBandFor(distance));
    }
    advantage *= 1.0 + self.armor * tuning.armorMultiplierPerPoint;

    if (self.status.Has(StatusEffectType::Flashed)) {
        advantage *= tuning.flashedMultiplier;
    }
    if (self.status.Has(StatusEffectType::Slowed)) {
        advantage *= tuning.slowedMultiplier;
    }
    if (self.IsMoving()) {
        advantage *= self.skills.movementAccuracy / 100.0;
    }
    if (!opponentHasSpotted) {
        advantage *= tuning.surpriseMultiplier;
    }
    if (self.position.z - opponent.position.z > tuning.highGroundThreshold) {
        advantage *= tuning.highGroundMultiplier;
    }
    if (distance < tuning.closeRangeDistance) {
        advantage *= tuning.closeRangeMultiplier;
    } else if (distance > tuning.farRangeDistance) {
        advantage *= tuning.farRangeMultiplier;
    }
    return std::max(advantage, tuning.advantageFloor);
}

double CombatSystem::WinProbability(double advantageA, double advantageB) noexcept {
    const double total = advantageA + advantageB;
    return total > 0.0 ? advantageA / total : 0.5;
}

bool CombatSystem::DecideDuel(double advantageA, double advantageB, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    return draw(rng) < WinProbability(advantageA, advantageB);
}

DuelOutcome CombatSystem::ResolveDuel(const Player& a, const Player& b, bool aSpottedByB,
                                      bool bSpottedByA, std::mt19937_64& rng) const {
    const double advA = CalculateAdvantage(a, b, aSpottedByB, tuning_);
    const double advB = CalculateAdvantage(b, a, bSpottedByA, tuning_);
    const double pA = WinProbability(advA, advB);

    DuelOutcome outcome;
    if (DecideDuel(advA, advB, rng)) {
        outcome = {a.id, b.id, pA, false};
    } else {
        outcome = {b.id, a.id, 1.0 - pA, false};
    }
    std::uniform_real_distribution<double> draw(0.0, 1.0);
    outcome.headshot = draw(rng) < tuning_.headshotChance;
    return outcome;
}

}  // namespace rse::game
