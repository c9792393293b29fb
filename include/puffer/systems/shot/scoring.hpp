/**
 * @file scoring.hpp
 * @brief Score deltas, cosmetic events and the game-over rule
 */

#pragma once

#include <vector>

#include "puffer/components/sim.hpp"
#include "puffer/core/bubble_field.hpp"
#include "puffer/core/system_config.hpp"
#include "puffer/systems/shot/shot_data.hpp"

namespace ShotResolution {
namespace Scoring {

/**
 * @brief matched * PointsPerMatched + dropped * PointsPerDropped
 */
int pointsFor(int matched, int dropped, const SystemConfig& config);

/**
 * @brief Mean position of the bubbles whose ids are in the set
 *
 * Returns (0,0) when no bubble of the snapshot is in the set.
 */
Position centroidOf(const std::vector<Simulation::PlacedBubble>& bubbles,
                    const Simulation::BubbleIdSet& ids);

/**
 * @brief Credits a matching shot to the state and queues its MatchBurst
 *
 * Does nothing for a shot without a match.
 */
void applyOutcome(Components::SimulationState& state,
                  const ShotOutcome& outcome,
                  const Position& centroid);

/**
 * @brief true once any bubble center is below the danger line
 */
bool crossesDangerLine(const std::vector<Simulation::PlacedBubble>& bubbles,
                       const SystemConfig& config);

} // namespace Scoring
} // namespace ShotResolution
