/**
 * @file placement.hpp
 * @brief Chooses the grid cell a landing projectile snaps to
 */

#pragma once

#include "puffer/core/bubble_field.hpp"
#include "puffer/math/vector_math.hpp"
#include "puffer/systems/shot/shot_data.hpp"

namespace ShotResolution {
namespace Placement {

/**
 * @brief Finds the cell for a projectile whose last free sample was at previous
 *
 * Takes the cell under the sample (clamped into the playfield). If a bubble
 * already maps there, the 3x3 block of cells around it is scanned row by row,
 * column by column, and the free in-bounds cell whose center is closest to the
 * sample wins; the first cell at the minimal distance is kept on ties. When no
 * neighbour is free the occupied cell is returned with degraded set.
 *
 * @param field Current bubble field
 * @param previous Projectile position one step before the collision
 */
PlacementResult resolveCell(const Simulation::BubbleField& field, const Position& previous);

} // namespace Placement
} // namespace ShotResolution
