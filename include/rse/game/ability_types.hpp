#pragma once

/// @file ability_types.hpp
/// @brief Ability enumerations, immutable definitions and the definition catalog.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rse/foundation/game_result.hpp"
#include "rse/game/player.hpp"

namespace rse::game {

/// What an ability does once deployed.
enum class AbilityType : uint8_t {
    Flash,  ///< Blinds players facing it.
    Smoke,  ///< Blocks line of sight.
    Molly,  ///< Area damage over time.
    Recon,  ///< Reveals enemies in radius.
    Trap,   ///< Reveals and slows enemies that walk in.
    Heal    ///< Heals the owner's team in radius.
};

/// How an ability reaches its effect position.
enum class TargetingKind : uint8_t {
    Point,       ///< Placed directly at a target point.
    Projectile,  ///< Thrown; flies, bounces and detonates.
    Self,        ///< Centred on the caster.
    Area         ///< Placed like Point but covers a zone.
};

[[nodiscard]] std::string_view AbilityTypeName(AbilityType type) noexcept;
[[nodiscard]] std::string_view TargetingKindName(TargetingKind kind) noexcept;

[[nodiscard]] std::optional<AbilityType> ParseAbilityType(std::string_view text) noexcept;
[[nodiscard]] std::optional<TargetingKind> ParseTargetingKind(std::string_view text) noexcept;

/// Immutable ability template.
struct AbilityDefinition {
    std::string name;
    AbilityType type = AbilityType::Flash;
    TargetingKind targeting = TargetingKind::Point;
    int32_t maxCharges = 1;
    double castTime = 0.0;          ///< Projectile fuse, seconds after activation.
    double duration = 0.0;          ///< Lifetime from activation, seconds.
    double effectRadius = 0.0;
    double maxRange = 0.0;
    double damagePerSecond = 0.0;
    double healingPerSecond = 0.0;
    int32_t bounces = 0;
    double projectileSpeed = 0.0;
    std::optional<StatusEffectType> appliedStatus;
    double statusDuration = 0.0;    ///< Linger after leaving the effect (flash: blind time).
    double soundRange = 35.0;       ///< Distance at which activation is heard.

    /// Reject definitions that cannot produce a working instance.
    /// @return InvalidAbilityDefinition naming the offending field.
    [[nodiscard]] foundation::GameResult<void> Validate() const;
};

/// Named set of ability definitions.
///
/// The Round resolves player ability slots against a catalog at
/// construction, so a slot that names an unknown ability fails early.
class AbilityCatalog {
public:
    AbilityCatalog() = default;

    /// Validate and add @p definition.
    /// @return the validation error, or AlreadyExists for a duplicate name.
    foundation::GameResult<void> Register(AbilityDefinition definition);

    [[nodiscard]] const AbilityDefinition* Find(std::string_view name) const noexcept;

    [[nodiscard]] std::size_t Size() const noexcept { return order_.size(); }

    /// Definition names in registration order.
    [[nodiscard]] const std::vector<std::string>& Names() const noexcept { return order_; }

    /// Catalog holding the six stock abilities (flash, smoke, molly,
    /// recon, trap, heal).
    [[nodiscard]] static AbilityCatalog Standard();

private:
    std::unordered_map<std::string, AbilityDefinition> definitions_;
    std::vector<std::string> order_;
};

}  // namespace rse::game
