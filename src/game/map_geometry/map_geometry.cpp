/// @file map_geometry.cpp
/// @brief MapGeometry implementation.
///
/// Elevation precedence: ramp/stair surface, then highest area base raised
/// to any object top underfoot.  Raycasts use the per-axis slab method
/// against every wall and object box.

#include "rse/game/map_geometry.hpp"

#include <algorithm>
#include <cmath>

namespace rse::game {

using foundation::ErrorCode;
using foundation::GameError;
using foundation::GameResult;

namespace {

constexpr double kParallelEpsilon = 1e-10;
constexpr double kElevationEpsilon = 1e-4;
constexpr int kCanMoveSegments = 10;

/// Shortest distance from @p p to the segment a -> b.
double distancePointToSegment(const Vector3& p, const Vector3& a, const Vector3& b) {
    const Vector3 ab = b - a;
    const double lenSq = ab.LengthSquared();
    if (lenSq < 1e-12) {
        return Distance(p, a);
    }
    const double t = std::clamp((p - a).Dot(ab) / lenSq, 0.0, 1.0);
    return Distance(p, a + ab * t);
}

/// Clip [tmin, tmax] against one axis slab.  Returns false on a miss.
/// @p entering is set when this slab moved tmin, i.e. the ray enters the
/// box through one of this axis' faces.
bool clipSlab(double origin, double dir, double lo, double hi, double& tmin, double& tmax,
              bool& entering) {
    if (std::abs(dir) < kParallelEpsilon) {
        return origin >= lo && origin <= hi;
    }
    double t1 = (lo - origin) / dir;
    double t2 = (hi - origin) / dir;
    if (t1 > t2) {
        std::swap(t1, t2);
    }
    if (t1 > tmin) {
        tmin = t1;
        entering = true;
    }
    tmax = std::min(tmax, t2);
    return tmin <= tmax;
}

}  // namespace

// ── Names ───────────────────────────────────────────────────────────────

std::string_view BoundaryTypeName(BoundaryType type) noexcept {
    switch (type) {
        case BoundaryType::Area:     return "area";
        case BoundaryType::Wall:     return "wall";
        case BoundaryType::Object:   return "object";
        case BoundaryType::Stairs:   return "stairs";
        case BoundaryType::Ramp:     return "ramp";
        case BoundaryType::BombSite: return "bomb-site";
    }
    return "unknown";
}

std::optional<Direction> ParseDirection(std::string_view text) noexcept {
    if (text == "north") return Direction::North;
    if (text == "south") return Direction::South;
    if (text == "east") return Direction::East;
    if (text == "west") return Direction::West;
    return std::nullopt;
}

// ── Boundary ────────────────────────────────────────────────────────────

Boundary Boundary::Box(BoundaryType type, std::string name, double x, double y,
                       double w, double h, double z, double heightZ) {
    Boundary b;
    b.name = std::move(name);
    b.type = type;
    b.x = x;
    b.y = y;
    b.width = w;
    b.height = h;
    b.z = z;
    b.heightZ = heightZ;
    return b;
}

Boundary Boundary::Ramp(std::string name, double x, double y, double w, double h,
                        double zStart, double zEnd, Direction dir) {
    Boundary b = Box(BoundaryType::Ramp, std::move(name), x, y, w, h, zStart, zEnd - zStart);
    b.direction = dir;
    return b;
}

Boundary Boundary::Stairs(std::string name, double x, double y, double w, double h,
                          double z, double rise, Direction dir, int32_t stepCount) {
    Boundary b = Box(BoundaryType::Stairs, std::move(name), x, y, w, h, z, rise);
    b.direction = dir;
    b.steps = stepCount;
    return b;
}

bool Boundary::ContainsXY(double px, double py) const noexcept {
    return px >= x && px <= x + width && py >= y && py <= y + height;
}

bool Boundary::FootprintContains(double px, double py) const noexcept {
    return px >= x && px < x + width && py >= y && py < y + height;
}

bool Boundary::ContainsPoint(double px, double py, double pz) const noexcept {
    if (!ContainsXY(px, py)) {
        return false;
    }
    if (type == BoundaryType::Area) {
        return pz >= z;
    }
    if (heightZ == 0.0) {
        return true;
    }
    return pz >= z && pz <= z + heightZ;
}

bool Boundary::CollidesWithCircle(double cx, double cy, double radius,
                                  double cz) const noexcept {
    const double closestX = std::clamp(cx, x, x + width);
    const double closestY = std::clamp(cy, y, y + height);
    const double dx = cx - closestX;
    const double dy = cy - closestY;
    const double planarSq = dx * dx + dy * dy;

    if (heightZ == 0.0) {
        // Flat boundary: floor-level ones collide in 2D, others only at their level.
        if (z == 0.0) {
            return planarSq < radius * radius;
        }
        return std::abs(cz - z) < radius && planarSq < radius * radius;
    }

    const double closestZ = std::clamp(cz, z, z + heightZ);
    const double dz = cz - closestZ;
    return planarSq + dz * dz < radius * radius;
}

double Boundary::SurfaceElevation(double px, double py) const noexcept {
    if (type != BoundaryType::Ramp && type != BoundaryType::Stairs) {
        return z;
    }

    // Fraction of the way from the low side to the high side.
    const bool alongY = direction == Direction::North || direction == Direction::South;
    const double length = alongY ? height : width;
    double pos = alongY ? (py - y) : (px - x);
    if (direction == Direction::South || direction == Direction::West) {
        pos = length - pos;
    }
    pos = std::clamp(pos, 0.0, length);

    if (type == BoundaryType::Ramp) {
        return z + (pos / length) * heightZ;
    }

    const double stepLength = length / steps;
    const int32_t step = std::min(steps - 1, static_cast<int32_t>(pos / stepLength));
    return z + step * (heightZ / steps);
}

// ── MapGeometry construction ────────────────────────────────────────────

MapGeometry::MapGeometry(std::string name, double width, double height)
    : name_(std::move(name)), width_(width), height_(height) {}

std::vector<Boundary>& MapGeometry::bucketFor(BoundaryType type) noexcept {
    switch (type) {
        case BoundaryType::Area:     return areas_;
        case BoundaryType::Wall:     return walls_;
        case BoundaryType::Object:   return objects_;
        case BoundaryType::Stairs:   return stairs_;
        case BoundaryType::Ramp:     return ramps_;
        case BoundaryType::BombSite: return bombSites_;
    }
    return areas_;
}

GameResult<void> MapGeometry::AddBoundary(Boundary boundary) {
    const auto fail = [&](std::string what) {
        return GameResult<void>::err(GameError(
            ErrorCode::InvalidGeometry,
            std::string(BoundaryTypeName(boundary.type)) + " '" + boundary.name + "': " + what,
            boundary.name));
    };

    if (boundary.width <= 0.0 || boundary.height <= 0.0) {
        return fail("width and height must be positive");
    }
    if (boundary.heightZ < 0.0) {
        return fail(boundary.type == BoundaryType::Ramp
                        ? "ramp must rise toward its direction"
                        : "height_z must not be negative");
    }
    if (boundary.type == BoundaryType::Stairs && boundary.steps < 2) {
        return fail("stairs need at least 2 steps");
    }

    auto& bucket = bucketFor(boundary.type);
    const bool duplicate = std::any_of(bucket.begin(), bucket.end(), [&](const Boundary& b) {
        return b.name == boundary.name;
    });
    if (duplicate) {
        return GameResult<void>::err(GameError(
            ErrorCode::AlreadyExists,
            "duplicate " + std::string(BoundaryTypeName(boundary.type)) + " '" + boundary.name + "'",
            boundary.name));
    }

    bucket.push_back(std::move(boundary));
    if (&bucket == &areas_) {
        std::stable_sort(areas_.begin(), areas_.end(),
                         [](const Boundary& a, const Boundary& b) { return a.z > b.z; });
    }
    return GameResult<void>::ok();
}

void MapGeometry::AddAttackerSpawn(const Vector3& spawn) {
    attackerSpawns_.push_back(spawn);
}

void MapGeometry::AddDefenderSpawn(const Vector3& spawn) {
    defenderSpawns_.push_back(spawn);
}

void MapGeometry::SetAdjacency(const std::string& area, std::vector<std::string> neighbors) {
    adjacency_[area] = std::move(neighbors);
}

GameResult<void> MapGeometry::Validate() const {
    if (width_ <= 0.0 || height_ <= 0.0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidGeometry, "map size must be positive"));
    }
    if (areas_.empty()) {
        return GameResult<void>::err(
            GameError(ErrorCode::NoWalkableArea, "map '" + name_ + "' defines no areas"));
    }
    for (const auto& [area, neighbors] : adjacency_) {
        if (FindArea(area) == nullptr) {
            return GameResult<void>::err(GameError(
                ErrorCode::UnknownArea, "adjacency names unknown area '" + area + "'", area));
        }
        for (const auto& neighbor : neighbors) {
            if (FindArea(neighbor) == nullptr) {
                return GameResult<void>::err(GameError(
                    ErrorCode::UnknownArea,
                    "area '" + area + "' lists unknown neighbour '" + neighbor + "'", neighbor));
            }
        }
    }
    return GameResult<void>::ok();
}

// ── Accessors ───────────────────────────────────────────────────────────

const Boundary* MapGeometry::FindArea(std::string_view name) const noexcept {
    for (const auto& area : areas_) {
        if (area.name == name) {
            return &area;
        }
    }
    return nullptr;
}

const Boundary* MapGeometry::FindBombSite(std::string_view name) const noexcept {
    for (const auto& site : bombSites_) {
        if (site.name == name) {
            return &site;
        }
    }
    return nullptr;
}

double MapGeometry::MaxTopHeight() const noexcept {
    double top = 0.0;
    for (const auto& a : areas_) top = std::max(top, a.z);
    for (const auto& o : objects_) top = std::max(top, o.Top());
    for (const auto& r : ramps_) top = std::max(top, r.Top());
    for (const auto& s : stairs_) top = std::max(top, s.Top());
    return top;
}

// ── Queries ─────────────────────────────────────────────────────────────

bool MapGeometry::onRampOrStairSurface(double x, double y, double z) const noexcept {
    const auto contains = [&](const Boundary& b) { return b.ContainsPoint(x, y, z); };
    return std::any_of(ramps_.begin(), ramps_.end(), contains) ||
           std::any_of(stairs_.begin(), stairs_.end(), contains);
}

bool MapGeometry::IsValidPosition(double x, double y, double z, double radius,
                                  double height) const {
    if (x - radius < 0.0 || x + radius > width_ || y - radius < 0.0 || y + radius > height_) {
        return false;
    }

    // Standing underneath an elevated floor is only allowed on a ramp or stair.
    for (const auto& area : areas_) {
        if (area.ContainsXY(x, y) && z < area.z && !onRampOrStairSurface(x, y, z)) {
            return false;
        }
    }

    const bool inArea = std::any_of(areas_.begin(), areas_.end(), [&](const Boundary& a) {
        return a.ContainsPoint(x, y, z);
    });
    if (!inArea) {
        return false;
    }

    for (const auto& wall : walls_) {
        if (wall.CollidesWithCircle(x, y, radius, z)) {
            return false;
        }
    }

    for (const auto& obj : objects_) {
        if (obj.heightZ > 0.0) {
            const double closestX = std::clamp(x, obj.x, obj.x + obj.width);
            const double closestY = std::clamp(y, obj.y, obj.y + obj.height);
            const double dx = x - closestX;
            const double dy = y - closestY;
            const bool xyOverlap = dx * dx + dy * dy < radius * radius;
            const bool zOverlap = !(z + height <= obj.z || z >= obj.Top());
            if (xyOverlap && zOverlap) {
                return false;
            }
        } else if (obj.CollidesWithCircle(x, y, radius, z)) {
            return false;
        }
    }

    return true;
}

double MapGeometry::ElevationAt(double x, double y) const {
    for (const auto& ramp : ramps_) {
        if (ramp.FootprintContains(x, y)) {
            return ramp.SurfaceElevation(x, y);
        }
    }
    for (const auto& stair : stairs_) {
        if (stair.FootprintContains(x, y)) {
            return stair.SurfaceElevation(x, y);
        }
    }

    double elevation = 0.0;
    for (const auto& area : areas_) {
        if (area.FootprintContains(x, y)) {
            elevation = area.z;
            break;
        }
    }
    for (const auto& obj : objects_) {
        if (obj.FootprintContains(x, y) && obj.z <= elevation + kElevationEpsilon &&
            obj.Top() > elevation) {
            elevation = obj.Top();
        }
    }
    return elevation;
}

std::optional<RaycastHit> MapGeometry::Raycast(const Vector3& origin, const Vector3& direction,
                                               double maxRange) const {
    const Vector3 dir = direction.Normalized();
    if (dir.LengthSquared() == 0.0 || maxRange <= 0.0) {
        return std::nullopt;
    }

    std::optional<RaycastHit> nearest;
    double nearestT = maxRange;

    const auto test = [&](const Boundary& box) {
        double tmin = 0.0;
        double tmax = maxRange;
        bool ex = false;
        bool ey = false;
        bool ez = false;
        if (!clipSlab(origin.x, dir.x, box.x, box.x + box.width, tmin, tmax, ex)) return;
        if (!clipSlab(origin.y, dir.y, box.y, box.y + box.height, tmin, tmax, ey)) return;
        if (ey) ex = false;
        if (!clipSlab(origin.z, dir.z, box.z, box.Top(), tmin, tmax, ez)) return;
        if (ez) ex = ey = false;
        if (tmin >= 0.0 && tmin < nearestT) {
            nearestT = tmin;
            Vector3 normal;
            if (ex) {
                normal.x = dir.x > 0.0 ? -1.0 : 1.0;
            } else if (ey) {
                normal.y = dir.y > 0.0 ? -1.0 : 1.0;
            } else if (ez) {
                normal.z = dir.z > 0.0 ? -1.0 : 1.0;
            } else {
                // Origin inside the box.
                normal = dir * -1.0;
            }
            nearest = RaycastHit{tmin, origin + dir * tmin, normal, &box};
        }
    };

    for (const auto& wall : walls_) test(wall);
    for (const auto& obj : objects_) test(obj);
    return nearest;
}

bool MapGeometry::LineOfSight(const Vector3& p1, const Vector3& p2,
                              const std::vector<SmokeVolume>& smokes) const {
    const double distance = Distance(p1, p2);
    if (distance > 0.0) {
        auto hit = Raycast(p1, p2 - p1, distance);
        if (hit && hit->t < distance) {
            return false;
        }
    }
    for (const auto& smoke : smokes) {
        if (distancePointToSegment(smoke.center, p1, p2) <= smoke.radius) {
            return false;
        }
    }
    return true;
}

bool MapGeometry::CanMove(const Vector3& start, const Vector3& end, double radius,
                          double height) const {
    const bool startInArea = AreaAt(start.x, start.y, start.z).has_value();
    const bool endInArea = AreaAt(end.x, end.y, end.z).has_value();
    if ((!startInArea || !endInArea) && !onRampOrStairSurface(start.x, start.y, start.z) &&
        !onRampOrStairSurface(end.x, end.y, end.z)) {
        return false;
    }

    const double startElev = ElevationAt(start.x, start.y);
    const double endElev = ElevationAt(end.x, end.y);
    if (endElev > startElev + kElevationEpsilon) {
        const bool viaSlope = onRampOrStairSurface(start.x, start.y, startElev) ||
                              onRampOrStairSurface(end.x, end.y, endElev);
        if (!viaSlope) {
            return false;
        }
    }

    for (int i = 0; i <= kCanMoveSegments; ++i) {
        const double t = static_cast<double>(i) / kCanMoveSegments;
        const Vector3 p = start + (end - start) * t;
        if (!IsValidPosition(p.x, p.y, p.z, radius, height)) {
            return false;
        }
    }
    return true;
}

std::optional<std::string> MapGeometry::AreaAt(double x, double y, double z) const {
    for (const auto& area : areas_) {
        if (area.ContainsPoint(x, y, z)) {
            return area.name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> MapGeometry::BombSiteAt(double x, double y, double z) const {
    for (const auto& site : bombSites_) {
        if (site.ContainsPoint(x, y, z)) {
            return site.name;
        }
    }
    return std::nullopt;
}

bool MapGeometry::IsOnRampOrStairs(double x, double y) const noexcept {
    const auto contains = [&](const Boundary& b) { return b.FootprintContains(x, y); };
    return std::any_of(ramps_.begin(), ramps_.end(), contains) ||
           std::any_of(stairs_.begin(), stairs_.end(), contains);
}

std::optional<double> MapGeometry::CeilingAbove(double x, double y, double z) const noexcept {
    std::optional<double> ceiling;
    for (const auto& obj : objects_) {
        if (obj.heightZ > 0.0 && obj.ContainsXY(x, y) && obj.z > z + kElevationEpsilon) {
            if (!ceiling || obj.z < *ceiling) {
                ceiling = obj.z;
            }
        }
    }
    return ceiling;
}

}  // namespace rse::game
