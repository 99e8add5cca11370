#pragma once

/// @file ability_system.hpp
/// @brief Runtime ability instances: activation, projectile flight and effects.
///
/// An AbilityInstance is the live counterpart of an AbilityDefinition for
/// one player slot.  It is re-armed by Activate while charges remain and
/// dispatches on a behaviour variant:
///
///   - ProjectileState: flies from the caster, bounces off walls and
///     objects, detonates after the fuse (castTime) or at max range.
///   - AreaState: deployed immediately at the target point or caster.
///
/// Flashes apply once on detonation; every other type re-applies its
/// effect each tick until the instance expires.

#include <cstdint>
#include <optional>
#include <unordered_set>
#include <variant>
#include <vector>

#include "rse/foundation/game_result.hpp"
#include "rse/foundation/types.hpp"
#include "rse/game/ability_types.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/math_types.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// Shared knobs for effect resolution.
struct AbilityTuning {
    double flashViewDotThreshold = 0.5;  ///< dot(view, dir-to-flash) must exceed this.
    double eyeHeight = 0.9;              ///< Eye offset above the feet for sight checks.
};

/// Flight state of a thrown ability.
struct ProjectileState {
    Vector3 velocity;
    int32_t bouncesRemaining = 0;
    double travelled = 0.0;
    std::vector<Vector3> trajectory;
    bool detonated = false;
};

/// Placed ability; carries no extra state.
struct AreaState {};

using AbilityBehaviour = std::variant<ProjectileState, AreaState>;

/// Per-player consequence of one effect application.
struct AbilityHit {
    PlayerId target;
    double healthLost = 0.0;
    double healed = 0.0;
};

/// Everything an Update or ApplyEffect call did to players.
struct AbilityEffectReport {
    std::vector<AbilityHit> hits;
    bool detonated = false;  ///< A projectile went off during this call.
    bool expired = false;    ///< The instance deactivated during this call.
};

class AbilityInstance {
public:
    AbilityInstance(InstanceId id, AbilityDefinition definition, PlayerId owner, Team ownerTeam,
                    int32_t charges, AbilityTuning tuning = {});

    /// Arm the ability at @p time.
    ///
    /// Projectiles launch from @p origin along @p direction.  Point and
    /// area abilities are placed at origin + direction, pulled back to
    /// maxRange when further.  Self abilities stay at @p origin.
    ///
    /// @return AbilityUnavailable when already active or out of charges.
    foundation::GameResult<void> Activate(double time, const Vector3& origin,
                                          const Vector3& direction);

    /// Advance flight and apply effects for one tick ending at @p time.
    /// Deactivates (clearing applied statuses) once the duration runs out.
    AbilityEffectReport Update(double deltaTime, double time, const MapGeometry& map,
                               std::vector<Player>& players);

    /// Apply the effect to every living player in radius for @p deltaTime.
    AbilityEffectReport ApplyEffect(const MapGeometry& map, std::vector<Player>& players,
                                    double deltaTime);

    /// Deactivate and strip this instance's statuses from @p players.
    void Expire(std::vector<Player>& players);

    /// Seconds until expiry at @p time; zero when inactive.
    [[nodiscard]] double RemainingDuration(double time) const noexcept;

    /// True once the effect is live (area placed or projectile detonated).
    [[nodiscard]] bool IsDeployed() const noexcept;

    /// Vision blocker while this is a deployed smoke.
    [[nodiscard]] std::optional<SmokeVolume> Smoke() const;

    [[nodiscard]] InstanceId Id() const noexcept { return id_; }
    [[nodiscard]] const AbilityDefinition& Definition() const noexcept { return definition_; }
    [[nodiscard]] PlayerId Owner() const noexcept { return owner_; }
    [[nodiscard]] Team OwnerTeam() const noexcept { return ownerTeam_; }
    [[nodiscard]] int32_t Charges() const noexcept { return charges_; }
    [[nodiscard]] bool IsActive() const noexcept { return active_; }
    [[nodiscard]] const Vector3& Position() const noexcept { return position_; }
    [[nodiscard]] double StartTime() const noexcept { return startTime_; }
    [[nodiscard]] double EndTime() const noexcept { return endTime_; }
    [[nodiscard]] const AbilityBehaviour& Behaviour() const noexcept { return behaviour_; }

    [[nodiscard]] const std::unordered_set<PlayerId>& AffectedPlayers() const noexcept {
        return affected_;
    }
    [[nodiscard]] bool HasAffected(PlayerId player) const {
        return affected_.count(player) != 0;
    }

private:
    void advanceProjectile(ProjectileState& projectile, double deltaTime, double time,
                           const MapGeometry& map);
    [[nodiscard]] bool affectsPlayer(const Player& player, const MapGeometry& map) const;
    [[nodiscard]] bool isFacing(const Player& player, const MapGeometry& map) const;

    InstanceId id_;
    AbilityDefinition definition_;
    PlayerId owner_;
    Team ownerTeam_;
    int32_t charges_ = 0;
    AbilityTuning tuning_;

    bool active_ = false;
    Vector3 position_;
    double startTime_ = 0.0;
    double endTime_ = 0.0;
    double clock_ = 0.0;  ///< Time of the latest Activate or Update.
    AbilityBehaviour behaviour_{AreaState{}};
    std::unordered_set<PlayerId> affected_;
};

}  // namespace rse::game
