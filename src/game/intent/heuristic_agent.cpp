/// @file heuristic_agent.cpp
/// @brief HeuristicIntentProvider implementation.

#include "rse/game/heuristic_agent.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace rse::game {

namespace {

double horizontalDistance(const Vector3& a, const Vector3& b) noexcept {
    return std::hypot(a.x - b.x, a.y - b.y);
}

}  // namespace

HeuristicIntentProvider::HeuristicIntentProvider(std::shared_ptr<const MapGeometry> map,
                                                 HeuristicTuning tuning)
    : map_(std::move(map)),
      tuning_(tuning),
      grid_(NavigationGrid::Build(*map_, tuning_.cellSize)),
      pathFinder_(grid_) {}

Vector3 HeuristicIntentProvider::siteCenter(const Boundary& site) const {
    const Vector3 c = site.Center();
    return {c.x, c.y, map_->ElevationAt(c.x, c.y)};
}

Vector3 HeuristicIntentProvider::attackTarget(const IntentContext& context) const {
    const auto& sites = map_->BombSites();
    const auto& call = context.blackboard.CurrentStrategy();
    if (call && call->targetSite) {
        if (const Boundary* site = map_->FindBombSite(*call->targetSite)) {
            return siteCenter(*site);
        }
    }
    if (!sites.empty()) {
        return siteCenter(sites.front());
    }
    return map_->DefenderSpawns().empty() ? Vector3{} : map_->DefenderSpawns().front();
}

Vector3 HeuristicIntentProvider::holdTarget(const Player& self) const {
    const auto& sites = map_->BombSites();
    if (sites.empty()) {
        return self.position;
    }
    const auto index = static_cast<std::size_t>(self.id.value() % sites.size());
    return siteCenter(sites[index]);
}

Intent HeuristicIntentProvider::moveToward(const Player& self, const Vector3& goal, double time) {
    if (horizontalDistance(self.position, goal) <= tuning_.holdRadius) {
        plans_.erase(self.id);
        return IdleIntent{};
    }

    auto& plan = plans_[self.id];
    const bool stale = plan.path.empty() || plan.next >= plan.path.size() ||
                       horizontalDistance(plan.goal, goal) > tuning_.waypointReach ||
                       time - plan.plannedAt >= tuning_.repathInterval;
    if (stale) {
        plan.goal = goal;
        plan.path = pathFinder_.FindPath(self.position, goal);
        plan.next = 0;
        plan.plannedAt = time;
    }
    while (plan.next < plan.path.size() &&
           horizontalDistance(self.position, plan.path[plan.next]) <= tuning_.waypointReach) {
        ++plan.next;
    }

    const Vector3 waypoint = plan.next < plan.path.size() ? plan.path[plan.next] : goal;
    MoveIntent move;
    move.direction = Vector3{waypoint.x - self.position.x, waypoint.y - self.position.y, 0.0}
                         .Normalized();
    return move;
}

Intent HeuristicIntentProvider::Decide(const Player& self, const IntentContext& context) {
    if (context.phase != RoundPhase::Active || !self.alive) {
        return IdleIntent{};
    }

    // ── Engage ─────────────────────────────────────────────────────────
    if (!context.visibleEnemies.empty()) {
        const auto nearest = std::min_element(
            context.visibleEnemies.begin(), context.visibleEnemies.end(),
            [](const VisibleEnemy& a, const VisibleEnemy& b) { return a.distance < b.distance; });

        std::uniform_real_distribution<double> draw(0.0, 1.0);
        if (draw(context.rng) < tuning_.flashChance) {
            for (std::size_t slot = 0; slot < self.abilities.size(); ++slot) {
                if (self.abilities[slot].ability == "flash" && self.abilities[slot].charges > 0) {
                    for (const auto& p : context.players) {
                        if (p.id == nearest->id) {
                            return UseAbilityIntent{slot, p.position};
                        }
                    }
                }
            }
        }
        return ShootIntent{nearest->id};
    }

    // ── Objective ──────────────────────────────────────────────────────
    const Spike& spike = context.spike;
    if (self.team == Team::Attackers) {
        if (self.hasSpike) {
            if (map_->BombSiteAt(self.position.x, self.position.y, self.position.z)) {
                return PlantIntent{};
            }
            return moveToward(self, attackTarget(context), context.time);
        }
        if (spike.state == SpikeState::Dropped || spike.IsPlanted()) {
            return moveToward(self, spike.position, context.time);
        }
        return moveToward(self, attackTarget(context), context.time);
    }

    if (spike.IsPlanted()) {
        if (horizontalDistance(self.position, spike.position) <= tuning_.defuseReach) {
            return DefuseIntent{};
        }
        return moveToward(self, spike.position, context.time);
    }
    return moveToward(self, holdTarget(self), context.time);
}

}  // namespace rse::game
