#pragma once

/// @file math_types.hpp
/// @brief Lightweight math types for the simulation layer.
///
/// Vector3 is a plain value type in map units (x east, y north, z up).
/// Double precision keeps long rounds of integration reproducible.

#include <cmath>

namespace rse::game {

/// Three-component vector used for positions, velocities and directions.
struct Vector3 {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;

    constexpr Vector3() = default;
    constexpr Vector3(double x, double y, double z) : x(x), y(y), z(z) {}

    // Arithmetic operators.
    constexpr Vector3 operator+(const Vector3& rhs) const noexcept {
        return {x + rhs.x, y + rhs.y, z + rhs.z};
    }
    constexpr Vector3 operator-(const Vector3& rhs) const noexcept {
        return {x - rhs.x, y - rhs.y, z - rhs.z};
    }
    constexpr Vector3 operator*(double scalar) const noexcept {
        return {x * scalar, y * scalar, z * scalar};
    }

    constexpr Vector3& operator+=(const Vector3& rhs) noexcept {
        x += rhs.x;
        y += rhs.y;
        z += rhs.z;
        return *this;
    }

    constexpr Vector3& operator-=(const Vector3& rhs) noexcept {
        x -= rhs.x;
        y -= rhs.y;
        z -= rhs.z;
        return *this;
    }

    [[nodiscard]] constexpr double Dot(const Vector3& rhs) const noexcept {
        return x * rhs.x + y * rhs.y + z * rhs.z;
    }

    /// Squared magnitude (avoids sqrt).
    [[nodiscard]] constexpr double LengthSquared() const noexcept { return Dot(*this); }

    [[nodiscard]] double Length() const noexcept { return std::sqrt(LengthSquared()); }

    /// Magnitude of the horizontal (x, y) component.
    [[nodiscard]] double HorizontalLength() const noexcept { return std::hypot(x, y); }

    /// Return a normalized copy, or zero vector if length is near zero.
    [[nodiscard]] Vector3 Normalized() const noexcept {
        const double len = Length();
        if (len < 1e-9) {
            return {};
        }
        return {x / len, y / len, z / len};
    }

    [[nodiscard]] static constexpr Vector3 Zero() noexcept { return {}; }

    constexpr auto operator<=>(const Vector3&) const = default;
};

constexpr Vector3 operator*(double scalar, const Vector3& v) noexcept {
    return v * scalar;
}

/// Euclidean distance between two points.
inline double Distance(const Vector3& a, const Vector3& b) noexcept {
    return (a - b).Length();
}

/// Unit vector in the horizontal plane for a yaw angle (radians, 0 = +x).
inline Vector3 DirectionFromYaw(double yaw) noexcept {
    return {std::cos(yaw), std::sin(yaw), 0.0};
}

}  // namespace rse::game
