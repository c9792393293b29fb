#include "puffer/systems/shot/connectivity.hpp"

#include <cstddef>

#include "puffer/core/profile.hpp"
#include "puffer/systems/shot/adjacency.hpp"

namespace ShotResolution {
namespace Connectivity {

bool isCeilingBubble(const Simulation::PlacedBubble& bubble, const SystemConfig& config) {
    return bubble.position.y <= config.BubbleRadius * config.CeilingBandFactor;
}

std::vector<Simulation::PlacedBubble> findFloating(
    const std::vector<Simulation::PlacedBubble>& bubbles,
    const SystemConfig& config) {
    PROFILE_SCOPE("Connectivity::findFloating");

    AdjacencyList const adjacency = buildAdjacency(bubbles, config);

    std::vector<bool> grounded(bubbles.size(), false);
    std::vector<std::size_t> work;
    for (std::size_t i = 0; i < bubbles.size(); ++i) {
        if (isCeilingBubble(bubbles[i], config)) {
            grounded[i] = true;
            work.push_back(i);
        }
    }

    while (!work.empty()) {
        std::size_t const current = work.back();
        work.pop_back();
        for (std::size_t next : adjacency[current]) {
            if (!grounded[next]) {
                grounded[next] = true;
                work.push_back(next);
            }
        }
    }

    std::vector<Simulation::PlacedBubble> floating;
    for (std::size_t i = 0; i < bubbles.size(); ++i) {
        if (!grounded[i]) {
            floating.push_back(bubbles[i]);
        }
    }
    return floating;
}

} // namespace Connectivity
} // namespace ShotResolution
