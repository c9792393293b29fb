#include "puffer/systems/shot/adjacency.hpp"

#include "puffer/core/profile.hpp"

namespace ShotResolution {

double adjacencyDistance(const SystemConfig& config) {
    return config.BubbleRadius * config.AdjacencyFactor;
}

AdjacencyList buildAdjacency(const std::vector<Simulation::PlacedBubble>& bubbles,
                             const SystemConfig& config) {
    PROFILE_SCOPE("buildAdjacency");

    const double reach = adjacencyDistance(config);
    AdjacencyList adjacency(bubbles.size());

    for (std::size_t i = 0; i < bubbles.size(); ++i) {
        for (std::size_t j = i + 1; j < bubbles.size(); ++j) {
            if (bubbles[i].position.dist(bubbles[j].position) < reach) {
                adjacency[i].push_back(j);
                adjacency[j].push_back(i);
            }
        }
    }
    return adjacency;
}

} // namespace ShotResolution
