#include <gtest/gtest.h>
#include "puffer/systems/shot/scoring.hpp"

using namespace Simulation;
using namespace ShotResolution;
using Components::BubbleColor;

class ScoringTest : public ::testing::Test {
protected:
    SystemConfig config;

    static PlacedBubble bubble(const std::string& id, double x, double y) {
        PlacedBubble b;
        b.id = id;
        b.position = Position(x, y);
        return b;
    }
};

TEST_F(ScoringTest, PointsFormula) {
    EXPECT_EQ(Scoring::pointsFor(0, 0, config), 0);
    EXPECT_EQ(Scoring::pointsFor(3, 0, config), 30);
    EXPECT_EQ(Scoring::pointsFor(4, 0, config), 40);
    EXPECT_EQ(Scoring::pointsFor(3, 2, config), 70);
    for (int m = 3; m < 10; ++m) {
        for (int f = 0; f < 10; ++f) {
            EXPECT_EQ(Scoring::pointsFor(m, f, config), 10 * m + 20 * f);
        }
    }
}

TEST_F(ScoringTest, CentroidOfSelectedBubbles) {
    std::vector<PlacedBubble> bubbles = {
        bubble("a", 20.0, 20.0),
        bubble("b", 60.0, 20.0),
        bubble("c", 40.0, 80.0),
        bubble("d", 300.0, 300.0),
    };

    Position c = Scoring::centroidOf(bubbles, {"a", "b", "c"});
    EXPECT_DOUBLE_EQ(c.x, 40.0);
    EXPECT_DOUBLE_EQ(c.y, 40.0);

    Position none = Scoring::centroidOf(bubbles, {"zzz"});
    EXPECT_DOUBLE_EQ(none.x, 0.0);
    EXPECT_DOUBLE_EQ(none.y, 0.0);
}

TEST_F(ScoringTest, ApplyOutcomeCreditsMatchAndQueuesBurst) {
    Components::SimulationState state;
    state.score = 15;

    ShotOutcome outcome;
    outcome.placed = bubble("shot-9", 100.0, 20.0);
    outcome.matched = {"a", "b", "shot-9"};
    outcome.dropped = {bubble("x", 0.0, 0.0), bubble("y", 0.0, 0.0)};
    outcome.points = 70;

    Scoring::applyOutcome(state, outcome, Position(80.0, 20.0));

    EXPECT_EQ(state.score, 85);
    ASSERT_EQ(state.pendingEffects.size(), 1u);
    const auto& burst = state.pendingEffects[0];
    EXPECT_DOUBLE_EQ(burst.centroid.x, 80.0);
    EXPECT_DOUBLE_EQ(burst.placedAt.x, 100.0);
    EXPECT_EQ(burst.matched, 3);
    EXPECT_EQ(burst.dropped, 2);
    EXPECT_EQ(burst.points, 70);
}

TEST_F(ScoringTest, ApplyOutcomeIgnoresMisses) {
    Components::SimulationState state;
    state.score = 15;

    ShotOutcome outcome;
    outcome.placed = bubble("shot-1", 100.0, 20.0);
    Scoring::applyOutcome(state, outcome, Position());

    EXPECT_EQ(state.score, 15);
    EXPECT_TRUE(state.pendingEffects.empty());
}

TEST_F(ScoringTest, DangerLineIsStrict) {
    // Height 500 minus 100
    EXPECT_DOUBLE_EQ(config.dangerLineY(), 400.0);
    EXPECT_FALSE(Scoring::crossesDangerLine({}, config));
    EXPECT_FALSE(Scoring::crossesDangerLine({bubble("a", 20.0, 400.0)}, config));
    EXPECT_TRUE(Scoring::crossesDangerLine({bubble("a", 20.0, 20.0), bubble("b", 40.0, 400.5)}, config));
}
