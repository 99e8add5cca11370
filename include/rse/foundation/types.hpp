#pragma once

/// @file types.hpp
/// @brief Strong ID types shared by the engine.

#include <cstdint>
#include <functional>

namespace rse::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps player ids and ability instance ids from being mixed up at
/// compile time while sharing the same underlying representation.
///
/// @tparam Tag A unique tag type to distinguish different ID types.
/// @tparam T The underlying integral type.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct PlayerIdTag {};
struct InstanceIdTag {};

/// Identifier of a player on the roster (0 is reserved as invalid).
using PlayerId = StrongId<PlayerIdTag>;

/// Identifier of a live ability instance within a round.
using InstanceId = StrongId<InstanceIdTag>;

} // namespace rse::foundation

template <typename Tag, typename T>
struct std::hash<rse::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const rse::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
