/**
 * @file coordinates.cpp
 * @brief Implementation of grid coordinate conversion
 */

#include "puffer/core/coordinates.hpp"

#include <algorithm>
#include <cmath>

namespace Simulation {

namespace {

// Half-up rounding; std::round would send -0.5 to -1.
int roundHalfUp(double v) {
    return static_cast<int>(std::floor(v + 0.5));
}

} // namespace

GridCoordinates::GridCoordinates(const SystemConfig& config)
    : radius(config.BubbleRadius),
      columns(config.GridColumns),
      rowHeight(config.BubbleRadius * GameConstants::Sqrt3)
{
}

int GridCoordinates::rowOf(double y) const {
    return roundHalfUp((y - radius) / rowHeight);
}

int GridCoordinates::colOf(double x, int row) const {
    return roundHalfUp((x - radius - rowOffset(row)) / (2.0 * radius));
}

double GridCoordinates::xOf(int row, int col) const {
    return col * 2.0 * radius + radius + rowOffset(row);
}

double GridCoordinates::yOf(int row) const {
    return row * rowHeight + radius;
}

double GridCoordinates::rowOffset(int row) const {
    return (row % 2 != 0) ? radius : 0.0;
}

int GridCoordinates::columnsInRow(int row) const {
    return (row % 2 != 0) ? columns - 1 : columns;
}

bool GridCoordinates::contains(const GridAddress& cell) const {
    return cell.row >= 0 && cell.col >= 0 && cell.col < columnsInRow(cell.row);
}

GridAddress GridCoordinates::clamp(const GridAddress& cell) const {
    int const row = std::max(cell.row, 0);
    int const col = std::min(std::max(cell.col, 0), columnsInRow(row) - 1);
    return {row, col};
}

GridAddress GridCoordinates::addressOf(const Position& pos) const {
    int const row = rowOf(pos.y);
    return {row, colOf(pos.x, row)};
}

Position GridCoordinates::centerOf(const GridAddress& cell) const {
    return {xOf(cell.row, cell.col), yOf(cell.row)};
}

void GridCoordinates::updateConfig(const SystemConfig& config) {
    radius = config.BubbleRadius;
    columns = config.GridColumns;
    rowHeight = config.BubbleRadius * GameConstants::Sqrt3;
}

} // namespace Simulation
