/**
 * @file shot_data.hpp
 * @brief Data passed between the stages of shot resolution
 */

#pragma once

#include <cstddef>
#include <vector>

#include "puffer/core/bubble_field.hpp"
#include "puffer/core/coordinates.hpp"

// Cell chosen for a landing projectile.
// degraded is set when no free cell was found and an occupied one was reused.
struct PlacementResult {
    Simulation::GridAddress cell;
    bool degraded = false;
};

// Everything one resolved shot did to the field
struct ShotOutcome {
    Simulation::PlacedBubble placed;
    PlacementResult placement;
    Simulation::BubbleIdSet matched;                // empty unless the match threshold was reached
    std::vector<Simulation::PlacedBubble> dropped;  // floating bubbles removed after the match
    int points = 0;
    bool gameOver = false;

    bool isMatch() const { return !matched.empty(); }
};

// Neighbour lists over a bubble snapshot, indexed like the snapshot
using AdjacencyList = std::vector<std::vector<std::size_t>>;
