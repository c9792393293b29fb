/**
 * @file shot_resolution.cpp
 * @brief Implementation of the shot resolution pipeline
 */

#include "puffer/systems/shot_resolution.hpp"

#include <iostream>
#include <tuple>
#include <utility>
#include <vector>

#include "puffer/core/bubble_field.hpp"
#include "puffer/core/coordinates.hpp"
#include "puffer/core/debug.hpp"
#include "puffer/core/profile.hpp"
#include "puffer/core/state.hpp"
#include "puffer/systems/shot/connectivity.hpp"
#include "puffer/systems/shot/matching.hpp"
#include "puffer/systems/shot/placement.hpp"
#include "puffer/systems/shot/scoring.hpp"

namespace Systems {

void ShotResolutionSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("ShotResolutionSystem");

    std::vector<std::tuple<entt::entity, Components::BubbleColor, Position>> landed;
    auto view = registry.view<const Components::Projectile, const Components::Impact>();
    for (auto [entity, projectile, impact] : view.each()) {
        landed.emplace_back(entity, projectile.color, impact.previous);
    }

    for (auto &[entity, color, previous] : landed) {
        lastOutcome = resolveShot(registry, color, previous);
        registry.destroy(entity);
    }
}

ShotOutcome ShotResolutionSystem::resolveShot(entt::registry &registry,
                                              Components::BubbleColor color,
                                              const Position &previous) const {
    using namespace ShotResolution;

    Simulation::GridCoordinates const coords(sysConfig);
    Simulation::BubbleField field(registry, coords);
    auto &state = Simulation::stateOf(registry);

    ShotOutcome outcome;

    // 1) Placement
    outcome.placement = Placement::resolveCell(field, previous);
    outcome.placed = field.add(coords.centerOf(outcome.placement.cell), color, "shot");
    DebugStats::recordPlacement(outcome.placement.degraded);

    if (outcome.placement.degraded) {
        ++state.degradedPlacements;
        std::cerr << "[ShotResolution] Warning: no free cell near ("
                  << outcome.placement.cell.row << ", " << outcome.placement.cell.col
                  << "), bubble " << outcome.placed.id << " overlaps an existing one\n";
    }

    // 2) Matching
    auto const snapshot = field.all();
    auto cluster = Matching::findMatches(outcome.placed, snapshot, sysConfig);

    if (Matching::isMatch(cluster, sysConfig)) {
        Position const centroid = Scoring::centroidOf(snapshot, cluster);
        field.removeAll(cluster);
        outcome.matched = std::move(cluster);

        // 3) Connectivity, recomputed on what the match left behind
        outcome.dropped = Connectivity::findFloating(field.all(), sysConfig);
        Simulation::BubbleIdSet droppedIds;
        for (const auto &bubble : outcome.dropped) {
            droppedIds.insert(bubble.id);
        }
        field.removeAll(droppedIds);

        // 4) Scoring
        outcome.points = Scoring::pointsFor(static_cast<int>(outcome.matched.size()),
                                            static_cast<int>(outcome.dropped.size()),
                                            sysConfig);
        Scoring::applyOutcome(state, outcome, centroid);
        DebugStats::recordMatch(static_cast<int>(outcome.matched.size()),
                                static_cast<int>(outcome.dropped.size()));

        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Match of " << outcome.matched.size() << ", dropped " << outcome.dropped.size()
            << ", +" << outcome.points << " (score " << state.score << ")\n");
    }

    // Termination is checked after every placement, match or not
    if (Scoring::crossesDangerLine(field.all(), sysConfig)) {
        outcome.gameOver = true;
        if (state.phase != Components::GamePhase::GameOver) {
            state.phase = Components::GamePhase::GameOver;
            std::cout << "Game over, final score " << state.score << std::endl;
            DebugStats::printShotStats();
        }
    }

    return outcome;
}

} // namespace Systems
