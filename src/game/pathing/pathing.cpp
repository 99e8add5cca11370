/// @file pathing.cpp
/// @brief NavigationGrid sampling, A* search and area routing.

#include "rse/game/pathing.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <deque>
#include <functional>
#include <limits>
#include <queue>
#include <unordered_set>

namespace rse::game {

// ── NavigationGrid ──────────────────────────────────────────────────────

NavigationGrid NavigationGrid::Build(const MapGeometry& map, double cellSize,
                                     double agentRadius, double agentHeight) {
    NavigationGrid grid;
    grid.cellSize_ = cellSize > 0.0 ? cellSize : 1.0;
    grid.columns_ = std::max(1, static_cast<int32_t>(map.Width() / grid.cellSize_));
    grid.rows_ = std::max(1, static_cast<int32_t>(map.Height() / grid.cellSize_));

    const auto count = static_cast<std::size_t>(grid.columns_) * static_cast<std::size_t>(grid.rows_);
    grid.walkable_.assign(count, 0);
    grid.slope_.assign(count, 0);
    grid.elevation_.assign(count, 0.0);

    for (int32_t cy = 0; cy < grid.rows_; ++cy) {
        for (int32_t cx = 0; cx < grid.columns_; ++cx) {
            const GridCell cell{cx, cy};
            const double wx = (cx + 0.5) * grid.cellSize_;
            const double wy = (cy + 0.5) * grid.cellSize_;
            const double z = map.ElevationAt(wx, wy);
            const auto i = grid.index(cell);
            grid.elevation_[i] = z;
            grid.slope_[i] = map.IsOnRampOrStairs(wx, wy) ? 1 : 0;
            grid.walkable_[i] = map.IsValidPosition(wx, wy, z, agentRadius, agentHeight) ? 1 : 0;
        }
    }
    return grid;
}

bool NavigationGrid::InBounds(GridCell cell) const noexcept {
    return cell.x >= 0 && cell.x < columns_ && cell.y >= 0 && cell.y < rows_;
}

bool NavigationGrid::IsWalkable(GridCell cell) const noexcept {
    return InBounds(cell) && walkable_[index(cell)] != 0;
}

double NavigationGrid::ElevationOf(GridCell cell) const noexcept {
    return InBounds(cell) ? elevation_[index(cell)] : 0.0;
}

bool NavigationGrid::IsSlope(GridCell cell) const noexcept {
    return InBounds(cell) && slope_[index(cell)] != 0;
}

GridCell NavigationGrid::CellAt(double x, double y) const noexcept {
    return {static_cast<int32_t>(std::floor(x / cellSize_)),
            static_cast<int32_t>(std::floor(y / cellSize_))};
}

Vector3 NavigationGrid::CellCenter(GridCell cell) const noexcept {
    return {(cell.x + 0.5) * cellSize_, (cell.y + 0.5) * cellSize_, ElevationOf(cell)};
}

// ── PathFinder ──────────────────────────────────────────────────────────

PathFinder::PathFinder(const NavigationGrid& grid, PathFinderOptions options)
    : grid_(grid), options_(options) {}

bool PathFinder::canStep(GridCell from, GridCell to) const noexcept {
    if (!grid_.IsWalkable(to)) {
        return false;
    }
    const double climb = grid_.ElevationOf(to) - grid_.ElevationOf(from);
    const double limit =
        grid_.IsSlope(from) ? options_.slopeClimbHeight : options_.maxClimbHeight;
    return climb <= limit;
}

std::vector<Vector3> PathFinder::FindPath(const Vector3& start, const Vector3& goal) const {
    const GridCell startCell = grid_.CellAt(start.x, start.y);
    const GridCell goalCell = grid_.CellAt(goal.x, goal.y);
    if (!grid_.IsWalkable(startCell) || !grid_.IsWalkable(goalCell)) {
        return {};
    }
    if (startCell == goalCell) {
        return {goal};
    }

    const auto columns = grid_.Columns();
    const auto cellCount = static_cast<std::size_t>(columns) * static_cast<std::size_t>(grid_.Rows());
    const auto idOf = [columns](GridCell c) {
        return static_cast<std::size_t>(c.y) * static_cast<std::size_t>(columns) +
               static_cast<std::size_t>(c.x);
    };
    const auto cellOf = [columns](std::size_t id) {
        return GridCell{static_cast<int32_t>(id % static_cast<std::size_t>(columns)),
                        static_cast<int32_t>(id / static_cast<std::size_t>(columns))};
    };
    const auto cost = [this](GridCell a, GridCell b) {
        return Distance(grid_.CellCenter(a), grid_.CellCenter(b));
    };

    constexpr double kInf = std::numeric_limits<double>::infinity();
    constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();
    std::vector<double> gScore(cellCount, kInf);
    std::vector<std::size_t> cameFrom(cellCount, kNone);
    std::vector<uint8_t> closed(cellCount, 0);

    struct OpenNode {
        double f;
        std::size_t id;
        bool operator>(const OpenNode& rhs) const noexcept {
            return f > rhs.f || (f == rhs.f && id > rhs.id);
        }
    };
    std::priority_queue<OpenNode, std::vector<OpenNode>, std::greater<>> open;

    const std::size_t startId = idOf(startCell);
    const std::size_t goalId = idOf(goalCell);
    gScore[startId] = 0.0;
    open.push({cost(startCell, goalCell), startId});

    static constexpr std::array<std::array<int32_t, 2>, 8> kOffsets = {{
        {0, 1}, {1, 0}, {0, -1}, {-1, 0}, {1, 1}, {-1, 1}, {1, -1}, {-1, -1}
    }};

    int32_t iterations = 0;
    bool found = false;
    while (!open.empty() && iterations < options_.maxIterations) {
        const std::size_t current = open.top().id;
        open.pop();
        if (closed[current] != 0) {
            continue;
        }
        closed[current] = 1;
        ++iterations;

        if (current == goalId) {
            found = true;
            break;
        }

        const GridCell cell = cellOf(current);
        for (const auto& [dx, dy] : kOffsets) {
            const GridCell next{cell.x + dx, cell.y + dy};
            if (!grid_.InBounds(next) || !canStep(cell, next)) {
                continue;
            }
            // No corner cutting past blocked orthogonal cells.
            if (dx != 0 && dy != 0 &&
                (!grid_.IsWalkable({cell.x + dx, cell.y}) ||
                 !grid_.IsWalkable({cell.x, cell.y + dy}))) {
                continue;
            }
            const std::size_t nextId = idOf(next);
            if (closed[nextId] != 0) {
                continue;
            }
            const double tentative = gScore[current] + cost(cell, next);
            if (tentative < gScore[nextId]) {
                gScore[nextId] = tentative;
                cameFrom[nextId] = current;
                open.push({tentative + cost(next, goalCell), nextId});
            }
        }
    }

    if (!found) {
        return {};
    }

    std::vector<Vector3> path;
    for (std::size_t id = goalId; id != startId; id = cameFrom[id]) {
        path.push_back(grid_.CellCenter(cellOf(id)));
    }
    std::reverse(path.begin(), path.end());
    path.back() = goal;
    return path;
}

// ── AreaGraph ───────────────────────────────────────────────────────────

AreaGraph::AreaGraph(const MapGeometry& map) {
    for (const auto& area : map.Areas()) {
        edges_[area.name];
    }
    const auto link = [this](const std::string& a, const std::string& b) {
        auto& list = edges_[a];
        if (std::find(list.begin(), list.end(), b) == list.end()) {
            list.push_back(b);
        }
    };
    // Iterate in area order so neighbour lists do not depend on hash order.
    for (const auto& area : map.Areas()) {
        auto it = map.Adjacency().find(area.name);
        if (it == map.Adjacency().end()) {
            continue;
        }
        for (const auto& neighbor : it->second) {
            link(area.name, neighbor);
            link(neighbor, area.name);
        }
    }
}

const std::vector<std::string>& AreaGraph::Neighbors(std::string_view area) const {
    static const std::vector<std::string> kEmpty;
    auto it = edges_.find(std::string(area));
    return it != edges_.end() ? it->second : kEmpty;
}

std::vector<std::string> AreaGraph::FindRoute(const std::string& from,
                                              const std::string& to) const {
    if (edges_.find(from) == edges_.end() || edges_.find(to) == edges_.end()) {
        return {};
    }
    if (from == to) {
        return {from};
    }

    std::unordered_map<std::string, std::string> parent;
    std::unordered_set<std::string> visited{from};
    std::deque<std::string> queue{from};
    bool reached = false;
    while (!queue.empty() && !reached) {
        const std::string current = queue.front();
        queue.pop_front();
        for (const auto& next : Neighbors(current)) {
            if (!visited.insert(next).second) {
                continue;
            }
            parent[next] = current;
            if (next == to) {
                reached = true;
                break;
            }
            queue.push_back(next);
        }
    }
    if (!reached) {
        return {};
    }

    std::vector<std::string> route{to};
    while (route.back() != from) {
        route.push_back(parent.at(route.back()));
    }
    std::reverse(route.begin(), route.end());
    return route;
}

}  // namespace rse::game
