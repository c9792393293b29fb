/**
 * @file adjacency.hpp
 * @brief Pairwise neighbour graph over a snapshot of the bubble field
 *
 * Two bubbles are neighbours when their centers are closer than
 * radius * AdjacencyFactor. The factor is looser than the true cell spacing
 * (2 * radius) so rounding never separates logically adjacent cells.
 * Construction compares every pair, O(n^2) in the bubble count.
 */

#pragma once

#include <vector>

#include "puffer/core/system_config.hpp"
#include "puffer/systems/shot/shot_data.hpp"

namespace ShotResolution {

/**
 * @brief Distance below which two bubble centers count as adjacent
 */
double adjacencyDistance(const SystemConfig& config);

/**
 * @brief Builds neighbour lists for every bubble in the snapshot
 */
AdjacencyList buildAdjacency(const std::vector<Simulation::PlacedBubble>& bubbles,
                             const SystemConfig& config);

} // namespace ShotResolution
