/// @file movement_system.cpp
/// @brief MovementSystem implementation.
///
/// The order velocity -> gravity -> position -> collision -> contact is
/// load-bearing: wall sliding and ramp snapping both read the velocity
/// and elevation produced by the earlier steps.

#include "rse/game/movement_system.hpp"

#include <algorithm>
#include <cmath>

namespace rse::game {

double MovementSystem::CurrentMaxSpeed(const Player& player) const noexcept {
    double speed = params_.runSpeed;
    if (player.IsCrouched()) {
        speed = params_.crouchSpeed;
    } else if (player.walking) {
        speed = params_.walkSpeed;
    }
    if (player.IsAirborne() || !player.grounded) {
        speed *= params_.airborneSpeedMultiplier;
    }
    if (player.status.Has(StatusEffectType::Slowed)) {
        speed *= params_.slowedSpeedMultiplier;
    }
    return speed;
}

double MovementSystem::BodyHeight(const Player& player) const noexcept {
    return player.IsCrouched() ? params_.crouchHeight : params_.standingHeight;
}

int32_t MovementSystem::FallDamage(double fallDistance, const MovementParams& params) {
    if (fallDistance <= params.fallDamageThreshold) {
        return 0;
    }
    return static_cast<int32_t>(
        std::floor((fallDistance - params.fallDamageThreshold) * params.fallDamagePerUnit));
}

bool MovementSystem::StartJump(Player& player) const {
    if (!player.alive || !player.grounded || player.jumping || player.falling) {
        return false;
    }
    player.jumping = true;
    player.grounded = false;
    player.velocity.z = params_.jumpSpeed;
    player.lastGroundZ = player.position.z;
    return true;
}

MovementResult MovementSystem::Update(Player& player, const MoveCommand& command,
                                      double deltaTime, const MapGeometry& map) const {
    MovementResult result;
    if (!player.alive || deltaTime <= 0.0) {
        return result;
    }

    // ── Input ──────────────────────────────────────────────────────────
    const Vector3 dir = Vector3{command.direction.x, command.direction.y, 0.0}.Normalized();
    const bool hasInput = dir.LengthSquared() > 0.0;
    player.moveDirection = dir;
    player.walking = command.walking;
    player.crouching = command.crouching;
    if (command.yaw) {
        player.yaw = *command.yaw;
    } else if (hasInput) {
        player.yaw = std::atan2(dir.y, dir.x);
    }
    if (command.jump) {
        StartJump(player);
    }

    const double maxSpeed = CurrentMaxSpeed(player);

    // ── 1-2. Horizontal velocity and friction ──────────────────────────
    Vector3 horizontal{player.velocity.x, player.velocity.y, 0.0};
    Vector3 accel;
    if (hasInput) {
        const Vector3 delta = dir * maxSpeed - horizontal;
        const double gap = delta.Length();
        const double step = params_.accelerationRate * deltaTime;
        if (gap > 0.0) {
            accel = delta * (params_.accelerationRate / gap);
            horizontal += gap <= step ? delta : delta * (step / gap);
        }
    } else {
        const double speed = horizontal.Length();
        if (speed > 0.0) {
            accel = horizontal * (-params_.friction / speed);
            const double slowed = std::max(0.0, speed - params_.friction * deltaTime);
            horizontal = horizontal * (slowed / speed);
        }
    }

    // ── 3. Gravity ─────────────────────────────────────────────────────
    double vz = player.velocity.z;
    if (player.grounded) {
        vz = 0.0;
    } else {
        vz -= params_.gravity * deltaTime;
        accel.z = -params_.gravity;
    }

    // ── 4. Integrate ───────────────────────────────────────────────────
    if (horizontal.Length() > maxSpeed) {
        horizontal = horizontal.Normalized() * maxSpeed;
    }
    player.velocity = {horizontal.x, horizontal.y, vz};
    player.acceleration = accel;

    const Vector3 start = player.position;
    const Vector3 target = start + player.velocity * deltaTime;
    const bool airborne = player.IsAirborne() || !player.grounded;
    const double height = BodyHeight(player);

    // ── 5. Terrain snapping ────────────────────────────────────────────
    const auto settle = [&](double x, double y, double z) {
        const double ground = map.ElevationAt(x, y);
        if (!airborne) {
            // Elevation changes only through ramps, stairs or level ground.
            return map.CanMove(start, {x, y, ground}, params_.radius, height) ? ground : start.z;
        }
        if (z < ground && ground <= start.z + params_.landingStepTolerance) {
            return ground;
        }
        return z;
    };

    // A standing player may duck under low clearance instead of being blocked.
    const auto fits = [&](double x, double y, double z) {
        if (map.IsValidPosition(x, y, z, params_.radius, height)) {
            return true;
        }
        if (player.IsCrouched()) {
            return false;
        }
        const auto ceiling = map.CeilingAbove(x, y, z);
        return ceiling && (*ceiling - z) >= params_.crouchHeight &&
               map.IsValidPosition(x, y, z, params_.radius, params_.crouchHeight);
    };

    // ── 6. Collision: full move, X only, Y only, vertical only, hold ──
    Vector3 resolved = start;
    if (const double z = settle(target.x, target.y, target.z); fits(target.x, target.y, z)) {
        resolved = {target.x, target.y, z};
    } else if (const double zx = settle(target.x, start.y, target.z); fits(target.x, start.y, zx)) {
        resolved = {target.x, start.y, zx};
        player.velocity.y = 0.0;
    } else if (const double zy = settle(start.x, target.y, target.z); fits(start.x, target.y, zy)) {
        resolved = {start.x, target.y, zy};
        player.velocity.x = 0.0;
    } else {
        player.velocity.x = 0.0;
        player.velocity.y = 0.0;
        if (const double zv = settle(start.x, start.y, target.z); fits(start.x, start.y, zv)) {
            resolved = {start.x, start.y, zv};
        } else if (player.velocity.z > 0.0) {
            // Head hit a ceiling.
            player.velocity.z = 0.0;
        }
    }
    player.position = resolved;

    // ── 7. Ground contact and forced crouch ────────────────────────────
    const double ground = map.ElevationAt(resolved.x, resolved.y);
    const bool wasGrounded = player.grounded;
    player.grounded = player.velocity.z <= 0.0 &&
                      std::abs(resolved.z - ground) <= params_.groundTolerance;

    if (player.grounded) {
        if (!wasGrounded) {
            result.landed = true;
            result.fallDamage = FallDamage(player.lastGroundZ - resolved.z, params_);
            if (result.fallDamage > 0) {
                const double lost = std::min(static_cast<double>(result.fallDamage), player.health);
                player.health -= lost;
                player.stats.damageTaken += lost;
                result.died = player.health <= 0.0;
            }
        }
        player.jumping = false;
        player.falling = false;
        player.velocity.z = 0.0;
        player.lastGroundZ = resolved.z;
    } else if (player.velocity.z < 0.0) {
        player.jumping = false;
        player.falling = true;
    }

    const auto ceiling = map.CeilingAbove(resolved.x, resolved.y, resolved.z);
    player.forcedCrouch = ceiling && (*ceiling - resolved.z) < params_.standingHeight;

    return result;
}

}  // namespace rse::game
