#include "puffer/systems/shot/matching.hpp"

#include <cstddef>

#include "puffer/core/profile.hpp"
#include "puffer/systems/shot/adjacency.hpp"

namespace ShotResolution {
namespace Matching {

Simulation::BubbleIdSet findMatches(const Simulation::PlacedBubble& seed,
                                    const std::vector<Simulation::PlacedBubble>& bubbles,
                                    const SystemConfig& config) {
    PROFILE_SCOPE("Matching::findMatches");

    std::vector<Simulation::PlacedBubble> snapshot = bubbles;
    std::size_t seedIndex = snapshot.size();
    for (std::size_t i = 0; i < snapshot.size(); ++i) {
        if (snapshot[i].id == seed.id) {
            seedIndex = i;
            break;
        }
    }
    if (seedIndex == snapshot.size()) {
        snapshot.push_back(seed);
    }

    AdjacencyList const adjacency = buildAdjacency(snapshot, config);

    std::vector<bool> visited(snapshot.size(), false);
    std::vector<std::size_t> work{seedIndex};
    visited[seedIndex] = true;

    Simulation::BubbleIdSet cluster;
    while (!work.empty()) {
        std::size_t const current = work.back();
        work.pop_back();
        cluster.insert(snapshot[current].id);

        for (std::size_t next : adjacency[current]) {
            if (!visited[next] && snapshot[next].color == seed.color) {
                visited[next] = true;
                work.push_back(next);
            }
        }
    }
    return cluster;
}

bool isMatch(const Simulation::BubbleIdSet& cluster, const SystemConfig& config) {
    return static_cast<int>(cluster.size()) >= config.MatchThreshold;
}

} // namespace Matching
} // namespace ShotResolution
