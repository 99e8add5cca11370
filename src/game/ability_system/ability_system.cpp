/// @file ability_system.cpp
/// @brief AbilityInstance activation, projectile flight and effect resolution.

#include "rse/game/ability_system.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "rse/foundation/game_logger.hpp"

namespace rse::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;
using foundation::LogCategory;

namespace {

constexpr double kSurfaceOffset = 0.01;  ///< Keep bounced projectiles off the face.
constexpr int kMaxBouncesPerTick = 4;

Vector3 reflect(const Vector3& v, const Vector3& normal) noexcept {
    return v - normal * (2.0 * v.Dot(normal));
}

}  // namespace

AbilityInstance::AbilityInstance(InstanceId id, AbilityDefinition definition, PlayerId owner,
                                 Team ownerTeam, int32_t charges, AbilityTuning tuning)
    : id_(id),
      definition_(std::move(definition)),
      owner_(owner),
      ownerTeam_(ownerTeam),
      charges_(charges),
      tuning_(tuning) {}

GameResult<void> AbilityInstance::Activate(double time, const Vector3& origin,
                                           const Vector3& direction) {
    if (active_) {
        return GameResult<void>::err(GameError(
            ErrorCode::AbilityUnavailable, definition_.name + " is already active"));
    }
    if (charges_ <= 0) {
        return GameResult<void>::err(GameError(
            ErrorCode::AbilityUnavailable, definition_.name + " has no charges left"));
    }

    --charges_;
    active_ = true;
    startTime_ = time;
    endTime_ = time + definition_.duration;
    clock_ = time;
    affected_.clear();

    switch (definition_.targeting) {
        case TargetingKind::Projectile: {
            ProjectileState projectile;
            projectile.velocity = direction.Normalized() * definition_.projectileSpeed;
            projectile.bouncesRemaining = definition_.bounces;
            projectile.trajectory.push_back(origin);
            position_ = origin;
            behaviour_ = std::move(projectile);
            break;
        }
        case TargetingKind::Point:
        case TargetingKind::Area: {
            Vector3 offset = direction;
            const double length = offset.Length();
            if (definition_.maxRange > 0.0 && length > definition_.maxRange) {
                offset = offset * (definition_.maxRange / length);
            }
            position_ = origin + offset;
            behaviour_ = AreaState{};
            break;
        }
        case TargetingKind::Self:
            position_ = origin;
            behaviour_ = AreaState{};
            break;
    }

    RSE_LOG_DEBUG(LogCategory::Ability,
                  definition_.name + " activated by player " + std::to_string(owner_.value()));
    return GameResult<void>::ok();
}

double AbilityInstance::RemainingDuration(double time) const noexcept {
    return active_ ? std::max(0.0, endTime_ - time) : 0.0;
}

bool AbilityInstance::IsDeployed() const noexcept {
    if (!active_) {
        return false;
    }
    if (const auto* projectile = std::get_if<ProjectileState>(&behaviour_)) {
        return projectile->detonated;
    }
    return true;
}

std::optional<SmokeVolume> AbilityInstance::Smoke() const {
    if (definition_.type != AbilityType::Smoke || !IsDeployed()) {
        return std::nullopt;
    }
    return SmokeVolume{position_, definition_.effectRadius};
}

// ── Update ──────────────────────────────────────────────────────────────

AbilityEffectReport AbilityInstance::Update(double deltaTime, double time,
                                            const MapGeometry& map,
                                            std::vector<Player>& players) {
    AbilityEffectReport report;
    if (!active_) {
        return report;
    }
    clock_ = time;

    if (auto* projectile = std::get_if<ProjectileState>(&behaviour_);
        projectile != nullptr && !projectile->detonated) {
        advanceProjectile(*projectile, deltaTime, time, map);
        if (projectile->detonated) {
            report = ApplyEffect(map, players, deltaTime);
            report.detonated = true;
        }
    } else if (definition_.type != AbilityType::Flash) {
        report = ApplyEffect(map, players, deltaTime);
    }

    if (RemainingDuration(time) <= 0.0) {
        Expire(players);
        report.expired = true;
    }
    return report;
}

void AbilityInstance::advanceProjectile(ProjectileState& projectile, double deltaTime,
                                        double time, const MapGeometry& map) {
    double step = projectile.velocity.Length() * deltaTime;
    for (int bounce = 0; step > 0.0 && bounce < kMaxBouncesPerTick; ++bounce) {
        const Vector3 dir = projectile.velocity.Normalized();
        const auto hit = map.Raycast(position_, dir, step);
        if (!hit) {
            position_ += dir * step;
            projectile.travelled += step;
            break;
        }
        position_ = hit->point + hit->normal * kSurfaceOffset;
        projectile.travelled += hit->t;
        step -= hit->t;
        if (projectile.bouncesRemaining > 0) {
            projectile.velocity = reflect(projectile.velocity, hit->normal);
            --projectile.bouncesRemaining;
        } else {
            projectile.velocity = Vector3::Zero();
            break;
        }
    }
    projectile.trajectory.push_back(position_);

    const bool fuseDone = time - startTime_ >= definition_.castTime;
    const bool outOfRange = definition_.maxRange > 0.0 &&
                            projectile.travelled >= definition_.maxRange;
    const bool stopped = projectile.velocity.LengthSquared() == 0.0;
    if (fuseDone || outOfRange || stopped) {
        projectile.detonated = true;
        if (definition_.type == AbilityType::Molly) {
            // Fire spreads on the floor below the burst.
            position_.z = map.ElevationAt(position_.x, position_.y);
        }
        RSE_LOG_DEBUG(LogCategory::Ability, definition_.name + " detonated");
    }
}

// ── Effects ─────────────────────────────────────────────────────────────

bool AbilityInstance::isFacing(const Player& player, const MapGeometry& map) const {
    const Vector3 eye = player.position + Vector3{0.0, 0.0, tuning_.eyeHeight};
    const Vector3 toFlash = (position_ - eye).Normalized();
    if (player.ViewDirection().Dot(toFlash) <= tuning_.flashViewDotThreshold) {
        return false;
    }
    return map.LineOfSight(eye, position_);
}

bool AbilityInstance::affectsPlayer(const Player& player, const MapGeometry& map) const {
    if (!player.alive || Distance(position_, player.position) > definition_.effectRadius) {
        return false;
    }
    switch (definition_.type) {
        case AbilityType::Flash:
            return isFacing(player, map);
        case AbilityType::Recon:
        case AbilityType::Trap:
            return player.team != ownerTeam_;
        case AbilityType::Heal:
            return player.team == ownerTeam_;
        case AbilityType::Smoke:
        case AbilityType::Molly:
            return true;
    }
    return false;
}

AbilityEffectReport AbilityInstance::ApplyEffect(const MapGeometry& map,
                                                 std::vector<Player>& players,
                                                 double deltaTime) {
    AbilityEffectReport report;
    if (!active_) {
        return report;
    }

    for (auto& player : players) {
        if (!affectsPlayer(player, map)) {
            continue;
        }
        affected_.insert(player.id);
        AbilityHit hit{player.id};

        if (definition_.appliedStatus) {
            double duration = definition_.statusDuration;
            if (definition_.type == AbilityType::Flash) {
                duration = std::min(duration, endTime_ - clock_);
            }
            player.status.Apply(*definition_.appliedStatus, duration, id_);
        }
        switch (definition_.type) {
            case AbilityType::Molly:
                hit.healthLost = player.ApplyDamage(definition_.damagePerSecond * deltaTime);
                break;
            case AbilityType::Trap:
                player.status.Apply(StatusEffectType::Revealed, definition_.statusDuration, id_);
                break;
            case AbilityType::Heal:
                hit.healed = player.Heal(definition_.healingPerSecond * deltaTime);
                break;
            case AbilityType::Flash:
            case AbilityType::Smoke:
            case AbilityType::Recon:
                break;
        }
        report.hits.push_back(hit);
    }
    return report;
}

void AbilityInstance::Expire(std::vector<Player>& players) {
    if (!active_) {
        return;
    }
    active_ = false;
    for (auto& player : players) {
        player.status.ClearBySource(id_);
    }
    RSE_LOG_DEBUG(LogCategory::Ability, definition_.name + " expired");
}

}  // namespace rse::game
