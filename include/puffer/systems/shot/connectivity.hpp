/**
 * @file connectivity.hpp
 * @brief Detection of bubbles no longer attached to the ceiling
 */

#pragma once

#include <vector>

#include "puffer/core/bubble_field.hpp"
#include "puffer/core/system_config.hpp"

namespace ShotResolution {
namespace Connectivity {

/**
 * @brief true if a bubble sits in the ceiling band (y <= radius * CeilingBandFactor)
 */
bool isCeilingBubble(const Simulation::PlacedBubble& bubble, const SystemConfig& config);

/**
 * @brief Returns every bubble that cannot reach the ceiling
 *
 * Flood fills from all ceiling-band bubbles across the adjacency graph,
 * ignoring color. Whatever the fill does not reach is floating. The result
 * keeps snapshot order. Recomputed from scratch on every call.
 */
std::vector<Simulation::PlacedBubble> findFloating(
    const std::vector<Simulation::PlacedBubble>& bubbles,
    const SystemConfig& config);

} // namespace Connectivity
} // namespace ShotResolution
