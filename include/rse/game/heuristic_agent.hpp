#pragma once

/// @file heuristic_agent.hpp
/// @brief Rule-based intent provider used as the reference producer.
///
/// Behaviour per tick in the active phase:
///   - any visible enemy: engage the nearest (occasionally flash first)
///   - attackers: the carrier walks to the called site and plants; others
///     escort, recover a dropped spike, then guard the planted spike
///   - defenders: hold an assigned site, retake and defuse after a plant
///
/// Paths come from an A* search over a NavigationGrid built once per map.

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>

#include "rse/game/intent.hpp"
#include "rse/game/map_geometry.hpp"
#include "rse/game/pathing.hpp"

namespace rse::game {

struct HeuristicTuning {
    double cellSize = 1.0;
    double waypointReach = 0.75;   ///< Distance at which a waypoint counts as reached.
    double repathInterval = 2.0;   ///< Seconds before a plan is recomputed.
    double holdRadius = 2.0;       ///< Stop moving this close to a hold point.
    double defuseReach = 2.5;      ///< Start defusing within this distance of the spike.
    double flashChance = 0.05;     ///< Per tick, when an enemy is visible.
};

class HeuristicIntentProvider final : public IIntentProvider {
public:
    explicit HeuristicIntentProvider(std::shared_ptr<const MapGeometry> map,
                                     HeuristicTuning tuning = {});

    HeuristicIntentProvider(const HeuristicIntentProvider&) = delete;
    HeuristicIntentProvider& operator=(const HeuristicIntentProvider&) = delete;

    Intent Decide(const Player& self, const IntentContext& context) override;

    void Reset() override { plans_.clear(); }

    [[nodiscard]] const NavigationGrid& Grid() const noexcept { return grid_; }

private:
    struct Plan {
        Vector3 goal;
        std::vector<Vector3> path;
        std::size_t next = 0;
        double plannedAt = 0.0;
    };

    Intent moveToward(const Player& self, const Vector3& goal, double time);
    [[nodiscard]] Vector3 attackTarget(const IntentContext& context) const;
    [[nodiscard]] Vector3 holdTarget(const Player& self) const;
    [[nodiscard]] Vector3 siteCenter(const Boundary& site) const;

    std::shared_ptr<const MapGeometry> map_;
    HeuristicTuning tuning_;
    NavigationGrid grid_;
    PathFinder pathFinder_;
    std::unordered_map<PlayerId, Plan> plans_;
};

}  // namespace rse::game
