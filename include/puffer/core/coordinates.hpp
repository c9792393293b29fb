/**
 * @file coordinates.hpp
 * @brief Conversion between playfield pixels and staggered grid addresses
 *
 * The grid is an offset-row layout:
 * - Row pitch is radius * sqrt(3), which packs rows like a hex grid
 * - Odd rows are shifted right by one radius
 * - Row 0 touches the ceiling (its centers sit at y = radius)
 */
#pragma once

#include "puffer/core/system_config.hpp"
#include "puffer/math/vector_math.hpp"

namespace Simulation {

/**
 * @brief Logical (row, column) cell of the bubble grid
 *
 * Derived on demand from pixel coordinates and never stored.
 */
struct GridAddress {
    int row = 0;
    int col = 0;

    bool operator==(const GridAddress& other) const {
        return row == other.row && col == other.col;
    }
    bool operator!=(const GridAddress& other) const { return !(*this == other); }
};

/**
 * @class GridCoordinates
 * @brief Handles conversions between pixel space and grid space
 *
 * Rounding is "half up" (floor(v + 0.5)) for every input, negative ones
 * included, so a pixel exactly between two cells resolves to the larger index.
 * Cell centers produced by xOf()/yOf() always map back to the same address.
 */
class GridCoordinates {
public:
    /**
     * @brief Construct a new grid converter
     *
     * @param config System configuration providing the bubble radius
     */
    explicit GridCoordinates(const SystemConfig& config);

    /**
     * @brief Row whose center line is nearest to a y coordinate
     *
     * @param y Pixel y coordinate
     * @return int Row index (may be negative above the ceiling)
     */
    int rowOf(double y) const;

    /**
     * @brief Column whose center is nearest to x within the given row
     *
     * @param x Pixel x coordinate
     * @param row Row the column is taken from (selects the parity offset)
     * @return int Column index
     */
    int colOf(double x, int row) const;

    /**
     * @brief Pixel x coordinate of a cell center
     */
    double xOf(int row, int col) const;

    /**
     * @brief Pixel y coordinate of a row's center line
     */
    double yOf(int row) const;

    /** @brief Horizontal shift of a row: one radius on odd rows, zero otherwise */
    double rowOffset(int row) const;

    /** @brief Number of cells in a row: odd rows hold one fewer to stay inside the walls */
    int columnsInRow(int row) const;

    /** @brief true if the address lies inside the playfield */
    bool contains(const GridAddress& cell) const;

    /** @brief Pulls an address into the playfield (row >= 0, column within its row) */
    GridAddress clamp(const GridAddress& cell) const;

    /** @brief Maps a pixel position to its grid address */
    GridAddress addressOf(const Position& pos) const;

    /** @brief Pixel center of a grid address */
    Position centerOf(const GridAddress& cell) const;

    double getRadius() const { return radius; }
    double getRowHeight() const { return rowHeight; }

    /**
     * @brief Update the configuration
     *
     * @param config New system configuration
     */
    void updateConfig(const SystemConfig& config);

private:
    double radius;      ///< Bubble radius in pixels
    int columns;        ///< Cells in an even row
    double rowHeight;   ///< Vertical distance between row center lines
};

} // namespace Simulation
