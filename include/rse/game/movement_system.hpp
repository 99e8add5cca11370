#pragma once

/// @file movement_system.hpp
/// @brief Per-player physics integration and collision against map geometry.
///
/// Each tick runs, in order: horizontal velocity toward the input
/// direction, friction, gravity, position integration, terrain snapping,
/// axis-separated collision (wall slide) and the ground-contact /
/// forced-crouch re-check.

#include <cstdint>
#include <optional>

#include "rse/game/map_geometry.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// Physics tunables (map units and seconds).
struct MovementParams {
    double runSpeed = 5.5;
    double walkSpeed = 3.5;
    double crouchSpeed = 2.0;
    double accelerationRate = 60.0;
    double friction = 8.0;
    double gravity = 20.0;
    double jumpSpeed = 7.0;
    double airborneSpeedMultiplier = 0.85;
    double slowedSpeedMultiplier = 0.5;
    double radius = 0.5;
    double standingHeight = 1.0;
    double crouchHeight = 0.5;
    double groundTolerance = 0.1;
    double landingStepTolerance = 0.5;  ///< Highest ledge an airborne player lands onto.
    double fallDamageThreshold = 1.5;
    double fallDamagePerUnit = 25.0;
};

/// Movement input for one tick.
struct MoveCommand {
    Vector3 direction;          ///< Horizontal intent; zero means no input.
    bool walking = false;
    bool crouching = false;
    bool jump = false;
    std::optional<double> yaw;  ///< Explicit facing; defaults to the move direction.
};

/// Outcome of one movement tick.
struct MovementResult {
    int32_t fallDamage = 0;
    bool landed = false;
    bool died = false;
};

/// Integrates player movement against a MapGeometry.
///
/// Stateless apart from its tunables; one instance serves every player.
class MovementSystem {
public:
    MovementSystem() = default;
    explicit MovementSystem(MovementParams params) : params_(params) {}

    /// Advance @p player by @p deltaTime seconds.
    ///
    /// Dead players are left untouched.  The resolved position always
    /// satisfies map.IsValidPosition for the player's body height if the
    /// starting position did.
    MovementResult Update(Player& player, const MoveCommand& command, double deltaTime,
                          const MapGeometry& map) const;

    /// Begin a jump.  Only succeeds when grounded and not already airborne.
    bool StartJump(Player& player) const;

    /// Speed cap for the player's current stance and status.
    [[nodiscard]] double CurrentMaxSpeed(const Player& player) const noexcept;

    /// Body height used for collision (crouched or standing).
    [[nodiscard]] double BodyHeight(const Player& player) const noexcept;

    /// Damage from landing after a drop of @p fallDistance.
    [[nodiscard]] static int32_t FallDamage(double fallDistance, const MovementParams& params);

    [[nodiscard]] const MovementParams& Params() const noexcept { return params_; }

private:
    MovementParams params_;
};

}  // namespace rse::game
