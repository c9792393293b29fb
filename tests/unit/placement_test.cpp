#include <gtest/gtest.h>
#include "puffer/systems/shot/placement.hpp"

using namespace Simulation;
using Components::BubbleColor;
using ShotResolution::Placement::resolveCell;

class PlacementTest : public ::testing::Test {
protected:
    entt::registry registry;
    SystemConfig config;
    GridCoordinates coords{config};
    BubbleField field{registry, coords};

    void occupy(int row, int col) {
        field.add(coords.centerOf({row, col}), BubbleColor::Green);
    }
};

TEST_F(PlacementTest, FreeTargetCellIsUsed) {
    PlacementResult result = resolveCell(field, Position(152.0, 100.0));
    EXPECT_EQ(result.cell, (GridAddress{2, 3}));
    EXPECT_FALSE(result.degraded);
}

TEST_F(PlacementTest, TargetIsClampedIntoPlayfield) {
    // Above the ceiling and past the right wall on an odd row
    PlacementResult result = resolveCell(field, Position(330.0, 8.0));
    EXPECT_EQ(result.cell, (GridAddress{0, 7}));

    result = resolveCell(field, Position(312.0, 56.0));
    EXPECT_EQ(result.cell, (GridAddress{1, 6}));
}

TEST_F(PlacementTest, OccupiedTargetPicksNearestFreeNeighbour) {
    occupy(2, 3);
    // {3,3} is ~25 px away, {2,4} ~30 px
    PlacementResult result = resolveCell(field, Position(152.0, 100.0));
    EXPECT_EQ(result.cell, (GridAddress{3, 3}));
    EXPECT_FALSE(result.degraded);
}

TEST_F(PlacementTest, TiesKeepFirstCellInScanOrder) {
    occupy(2, 3);
    occupy(1, 2);
    occupy(1, 3);
    occupy(3, 2);
    occupy(3, 3);

    // {2,2} and {2,4} are both exactly 40 px from the center of {2,3}
    PlacementResult result = resolveCell(field, coords.centerOf({2, 3}));
    EXPECT_EQ(result.cell, (GridAddress{2, 2}));
    EXPECT_FALSE(result.degraded);
}

TEST_F(PlacementTest, NeighboursOutsidePlayfieldAreSkipped) {
    occupy(0, 0);
    // {0,-1} would be nearest, but it lies past the left wall
    PlacementResult result = resolveCell(field, Position(14.0, 18.0));
    EXPECT_EQ(result.cell, (GridAddress{1, 0}));
    EXPECT_TRUE(coords.contains(result.cell));
}

TEST_F(PlacementTest, FullNeighbourhoodIsDegraded) {
    for (int row = 1; row <= 3; ++row) {
        for (int col = 2; col <= 4; ++col) {
            occupy(row, col);
        }
    }

    PlacementResult result = resolveCell(field, Position(152.0, 100.0));
    EXPECT_TRUE(result.degraded);
    EXPECT_EQ(result.cell, (GridAddress{2, 3}));
}
