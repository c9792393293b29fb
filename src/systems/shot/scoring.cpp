#include "puffer/systems/shot/scoring.hpp"

#include <algorithm>

namespace ShotResolution {
namespace Scoring {

int pointsFor(int matched, int dropped, const SystemConfig& config) {
    return matched * config.PointsPerMatched + dropped * config.PointsPerDropped;
}

Position centroidOf(const std::vector<Simulation::PlacedBubble>& bubbles,
                    const Simulation::BubbleIdSet& ids) {
    Position sum;
    int count = 0;
    for (const auto& bubble : bubbles) {
        if (ids.count(bubble.id) != 0) {
            sum.x += bubble.position.x;
            sum.y += bubble.position.y;
            ++count;
        }
    }
    if (count == 0) {
        return {};
    }
    return {sum.x / count, sum.y / count};
}

void applyOutcome(Components::SimulationState& state,
                  const ShotOutcome& outcome,
                  const Position& centroid) {
    if (!outcome.isMatch()) {
        return;
    }

    state.score += outcome.points;

    Components::MatchBurst burst;
    burst.centroid = centroid;
    burst.placedAt = outcome.placed.position;
    burst.matched = static_cast<int>(outcome.matched.size());
    burst.dropped = static_cast<int>(outcome.dropped.size());
    burst.points = outcome.points;
    state.pendingEffects.push_back(burst);
}

bool crossesDangerLine(const std::vector<Simulation::PlacedBubble>& bubbles,
                       const SystemConfig& config) {
    const double dangerY = config.dangerLineY();
    return std::any_of(bubbles.begin(), bubbles.end(),
                       [dangerY](const Simulation::PlacedBubble& b) { return b.position.y > dangerY; });
}

} // namespace Scoring
} // namespace ShotResolution
