#pragma once

/// @file map_geometry.hpp
/// @brief Static 3D map geometry: boundaries, elevation, raycasts and line of sight.
///
/// A map is a set of named axis-aligned boxes.  Areas are the walkable
/// floors, walls and objects are solid volumes, ramps and stairs carry an
/// elevation profile and bomb sites mark where the spike can be planted.
/// The geometry is built once (usually by the map loader) and then shared
/// read-only between rounds through std::shared_ptr<const MapGeometry>.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rse/foundation/game_result.hpp"
#include "rse/game/math_types.hpp"

namespace rse::game {

/// Kind of boundary stored in the map.
enum class BoundaryType : uint8_t {
    Area,     ///< Walkable floor region with a base elevation.
    Wall,     ///< Solid, usually tall, blocks movement and sight.
    Object,   ///< Solid box (crates, cover); can be stood on or crouched under.
    Stairs,   ///< Discrete steps rising toward the named direction.
    Ramp,     ///< Linear slope rising toward the named direction.
    BombSite  ///< Spike plant region.
};

/// Side of a ramp or staircase that is high.  North is +y, east is +x.
enum class Direction : uint8_t { North, South, East, West };

[[nodiscard]] std::string_view BoundaryTypeName(BoundaryType type) noexcept;

/// Parse "north"/"south"/"east"/"west" (case-sensitive, lowercase).
[[nodiscard]] std::optional<Direction> ParseDirection(std::string_view text) noexcept;

/// Axis-aligned 3D box with a type tag and elevation parameters.
///
/// The footprint spans [x, x + width] x [y, y + height] and the volume
/// spans [z, z + heightZ] vertically.  For ramps, heightZ is the rise
/// from the low side to the high side.
struct Boundary {
    std::string name;
    BoundaryType type = BoundaryType::Area;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double z = 0.0;
    double heightZ = 0.0;
    Direction direction = Direction::North;  ///< Ramps and stairs only.
    int32_t steps = 0;                        ///< Stairs only.

    /// Build a plain box boundary (area, wall, object or bomb site).
    [[nodiscard]] static Boundary Box(BoundaryType type, std::string name,
                                      double x, double y, double w, double h,
                                      double z = 0.0, double heightZ = 0.0);

    /// Build a ramp rising from @p zStart on the low side to @p zEnd on
    /// the side named by @p dir.
    [[nodiscard]] static Boundary Ramp(std::string name, double x, double y,
                                       double w, double h, double zStart,
                                       double zEnd, Direction dir);

    /// Build a staircase of @p stepCount steps rising by @p rise in total.
    [[nodiscard]] static Boundary Stairs(std::string name, double x, double y,
                                         double w, double h, double z,
                                         double rise, Direction dir,
                                         int32_t stepCount);

    [[nodiscard]] double Top() const noexcept { return z + heightZ; }

    /// Centre of the footprint at the base elevation.
    [[nodiscard]] Vector3 Center() const noexcept {
        return {x + width * 0.5, y + height * 0.5, z};
    }

    /// Inclusive footprint test: [x, x+w] x [y, y+h].
    [[nodiscard]] bool ContainsXY(double px, double py) const noexcept;

    /// Half-open footprint test: [x, x+w) x [y, y+h).
    [[nodiscard]] bool FootprintContains(double px, double py) const noexcept;

    /// 3D containment.  Areas only require pz at or above the base;
    /// boundaries without height only test the footprint.
    [[nodiscard]] bool ContainsPoint(double px, double py, double pz) const noexcept;

    /// Sphere/box overlap using the closest point of the box to the centre.
    [[nodiscard]] bool CollidesWithCircle(double cx, double cy, double radius,
                                          double cz) const noexcept;

    /// Walking surface elevation of a ramp or staircase at (px, py).
    /// Other boundary types return their base z.
    [[nodiscard]] double SurfaceElevation(double px, double py) const noexcept;
};

/// Result of a successful raycast against walls and objects.
struct RaycastHit {
    double t = 0.0;                      ///< Distance along the (unit) ray.
    Vector3 point;                       ///< World-space hit point.
    Vector3 normal;                      ///< Outward normal of the face entered.
    const Boundary* boundary = nullptr;  ///< Boundary hit, owned by the map.
};

/// Spherical vision blocker produced by a smoke ability.
struct SmokeVolume {
    Vector3 center;
    double radius = 0.0;
};

/// Immutable-after-load map geometry store.
///
/// Example:
/// @code
///   MapGeometry map("range", 40.0, 40.0);
///   (void)map.AddBoundary(Boundary::Box(BoundaryType::Area, "floor", 0, 0, 40, 40));
///   (void)map.AddBoundary(Boundary::Box(BoundaryType::Wall, "w1", 19, 0, 2, 15, 0, 10));
///   bool clear = map.LineOfSight({5, 5, 1}, {30, 5, 1});   // false, wall in the way
/// @endcode
class MapGeometry {
public:
    MapGeometry(std::string name, double width, double height);

    // ── Construction ────────────────────────────────────────────────────

    /// Add a boundary after validating its extents.
    /// @return InvalidGeometry for non-positive extents, negative heights or
    ///         stairs with fewer than two steps; AlreadyExists for a
    ///         duplicate name within the same boundary type.
    foundation::GameResult<void> AddBoundary(Boundary boundary);

    void AddAttackerSpawn(const Vector3& spawn);
    void AddDefenderSpawn(const Vector3& spawn);

    /// Replace the neighbour list of an area.
    void SetAdjacency(const std::string& area, std::vector<std::string> neighbors);

    /// Check whole-map consistency: at least one area and adjacency
    /// entries that only name known areas.
    [[nodiscard]] foundation::GameResult<void> Validate() const;

    // ── Accessors ───────────────────────────────────────────────────────

    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] double Width() const noexcept { return width_; }
    [[nodiscard]] double Height() const noexcept { return height_; }

    [[nodiscard]] const std::vector<Boundary>& Areas() const noexcept { return areas_; }
    [[nodiscard]] const std::vector<Boundary>& Walls() const noexcept { return walls_; }
    [[nodiscard]] const std::vector<Boundary>& Objects() const noexcept { return objects_; }
    [[nodiscard]] const std::vector<Boundary>& Ramps() const noexcept { return ramps_; }
    [[nodiscard]] const std::vector<Boundary>& StairsList() const noexcept { return stairs_; }
    [[nodiscard]] const std::vector<Boundary>& BombSites() const noexcept { return bombSites_; }

    [[nodiscard]] const std::vector<Vector3>& AttackerSpawns() const noexcept {
        return attackerSpawns_;
    }
    [[nodiscard]] const std::vector<Vector3>& DefenderSpawns() const noexcept {
        return defenderSpawns_;
    }
    [[nodiscard]] const std::unordered_map<std::string, std::vector<std::string>>&
    Adjacency() const noexcept {
        return adjacency_;
    }

    [[nodiscard]] const Boundary* FindArea(std::string_view name) const noexcept;
    [[nodiscard]] const Boundary* FindBombSite(std::string_view name) const noexcept;

    /// Highest walkable or solid top surface on the map.
    [[nodiscard]] double MaxTopHeight() const noexcept;

    // ── Queries ─────────────────────────────────────────────────────────

    /// True if a player cylinder of @p radius and @p height standing at
    /// (x, y, z) is inside the map, inside a walkable area at that
    /// elevation and clear of walls and objects.
    [[nodiscard]] bool IsValidPosition(double x, double y, double z,
                                       double radius = 0.5,
                                       double height = 1.0) const;

    /// Ground elevation at (x, y).  Ramps and stairs take precedence
    /// within their half-open footprint; otherwise the highest containing
    /// area's base, raised to the top of any object underfoot.
    [[nodiscard]] double ElevationAt(double x, double y) const;

    /// Nearest wall or object hit along @p direction within @p maxRange.
    /// @p direction is normalized internally; t is measured in map units.
    [[nodiscard]] std::optional<RaycastHit> Raycast(const Vector3& origin,
                                                    const Vector3& direction,
                                                    double maxRange) const;

    /// True when no wall, object or smoke blocks the segment p1 -> p2.
    [[nodiscard]] bool LineOfSight(const Vector3& p1, const Vector3& p2,
                                   const std::vector<SmokeVolume>& smokes = {}) const;

    /// True when a player can move in a straight line from start to end.
    [[nodiscard]] bool CanMove(const Vector3& start, const Vector3& end,
                               double radius = 0.5, double height = 1.0) const;

    /// Name of the highest-based area containing the point, if any.
    [[nodiscard]] std::optional<std::string> AreaAt(double x, double y, double z) const;

    [[nodiscard]] std::optional<std::string> BombSiteAt(double x, double y, double z) const;

    /// True when (x, y) lies within the half-open footprint of a ramp or stair.
    [[nodiscard]] bool IsOnRampOrStairs(double x, double y) const noexcept;

    /// Lowest overhead object base above @p z at (x, y), if any.
    [[nodiscard]] std::optional<double> CeilingAbove(double x, double y, double z) const noexcept;

private:
    [[nodiscard]] std::vector<Boundary>& bucketFor(BoundaryType type) noexcept;
    [[nodiscard]] bool onRampOrStairSurface(double x, double y, double z) const noexcept;

    std::string name_;
    double width_ = 0.0;
    double height_ = 0.0;

    std::vector<Boundary> areas_;  ///< Sorted by base elevation, highest first.
    std::vector<Boundary> walls_;
    std::vector<Boundary> objects_;
    std::vector<Boundary> ramps_;
    std::vector<Boundary> stairs_;
    std::vector<Boundary> bombSites_;

    std::vector<Vector3> attackerSpawns_;
    std::vector<Vector3> defenderSpawns_;
    std::unordered_map<std::string, std::vector<std::string>> adjacency_;
};

}  // namespace rse::game
