#pragma once

/// @file pathing.hpp
/// @brief Elevation-aware navigation grid, A* path finder and area graph.
///
/// These helpers serve intent providers that need movement targets.  The
/// round engine itself never calls into them.

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "rse/game/map_geometry.hpp"
#include "rse/game/math_types.hpp"

namespace rse::game {

/// Integer cell coordinate on the navigation grid.
struct GridCell {
    int32_t x = 0;
    int32_t y = 0;

    constexpr auto operator<=>(const GridCell&) const = default;
};

/// Uniform walkability grid sampled from a MapGeometry.
///
/// Each cell stores whether a player standing at its centre is a valid
/// position and the ground elevation there.
class NavigationGrid {
public:
    NavigationGrid() = default;

    /// Sample @p map at every cell centre.
    [[nodiscard]] static NavigationGrid Build(const MapGeometry& map, double cellSize = 1.0,
                                              double agentRadius = 0.5,
                                              double agentHeight = 1.0);

    [[nodiscard]] int32_t Columns() const noexcept { return columns_; }
    [[nodiscard]] int32_t Rows() const noexcept { return rows_; }
    [[nodiscard]] double CellSize() const noexcept { return cellSize_; }

    [[nodiscard]] bool InBounds(GridCell cell) const noexcept;
    [[nodiscard]] bool IsWalkable(GridCell cell) const noexcept;

    /// Ground elevation at the cell centre (0 outside the grid).
    [[nodiscard]] double ElevationOf(GridCell cell) const noexcept;

    /// True when the cell centre lies on a ramp or staircase.
    [[nodiscard]] bool IsSlope(GridCell cell) const noexcept;

    [[nodiscard]] GridCell CellAt(double x, double y) const noexcept;

    /// World position of the cell centre at ground elevation.
    [[nodiscard]] Vector3 CellCenter(GridCell cell) const noexcept;

private:
    [[nodiscard]] std::size_t index(GridCell cell) const noexcept {
        return static_cast<std::size_t>(cell.y) * static_cast<std::size_t>(columns_) +
               static_cast<std::size_t>(cell.x);
    }

    int32_t columns_ = 0;
    int32_t rows_ = 0;
    double cellSize_ = 1.0;
    std::vector<uint8_t> walkable_;
    std::vector<uint8_t> slope_;
    std::vector<double> elevation_;
};

/// Tuning for PathFinder.
struct PathFinderOptions {
    double maxClimbHeight = 1.5;    ///< Largest step up between flat cells.
    double slopeClimbHeight = 3.0;  ///< Largest step up when leaving a ramp/stair cell.
    int32_t maxIterations = 20000;  ///< Expansions before the search gives up.
};

/// A* search over a NavigationGrid.
///
/// Eight-neighbour moves with Euclidean 3D cost and heuristic.  Diagonal
/// moves may not cut past a blocked orthogonal neighbour.
class PathFinder {
public:
    explicit PathFinder(const NavigationGrid& grid, PathFinderOptions options = {});

    /// Waypoints from @p start to @p goal, excluding the start position.
    /// The last waypoint equals @p goal exactly.  Empty when either end is
    /// unwalkable, the goal is unreachable or the iteration cap is hit.
    [[nodiscard]] std::vector<Vector3> FindPath(const Vector3& start, const Vector3& goal) const;

private:
    [[nodiscard]] bool canStep(GridCell from, GridCell to) const noexcept;

    const NavigationGrid& grid_;
    PathFinderOptions options_;
};

/// Coarse area-to-area connectivity from the map's adjacency list.
///
/// Edges are treated as bidirectional.
class AreaGraph {
public:
    explicit AreaGraph(const MapGeometry& map);

    /// Neighbouring areas, or an empty list for unknown names.
    [[nodiscard]] const std::vector<std::string>& Neighbors(std::string_view area) const;

    /// Fewest-hop route including both endpoints; empty if disconnected.
    [[nodiscard]] std::vector<std::string> FindRoute(const std::string& from,
                                                     const std::string& to) const;

private:
    std::unordered_map<std::string, std::vector<std::string>> edges_;
};

}  // namespace rse::game
