/**
 * @file matching.hpp
 * @brief Same-color cluster detection around a newly placed bubble
 */

#pragma once

#include <vector>

#include "puffer/core/bubble_field.hpp"
#include "puffer/core/system_config.hpp"

namespace ShotResolution {
namespace Matching {

/**
 * @brief Collects the same-color cluster connected to seed
 *
 * Work-list flood fill over the adjacency graph of the snapshot: a bubble
 * joins when it has the seed's color and lies within adjacency distance of a
 * bubble already in the cluster. The result always contains seed.id and
 * never mixes colors.
 *
 * @param seed The bubble the fill starts from; added to the search if the
 *        snapshot does not contain it
 * @param bubbles Snapshot of the field
 * @param config Supplies radius and adjacency factor
 */
Simulation::BubbleIdSet findMatches(const Simulation::PlacedBubble& seed,
                                    const std::vector<Simulation::PlacedBubble>& bubbles,
                                    const SystemConfig& config);

/**
 * @brief true if a cluster is large enough to be removed
 */
bool isMatch(const Simulation::BubbleIdSet& cluster, const SystemConfig& config);

} // namespace Matching
} // namespace ShotResolution
