#include <gtest/gtest.h>
#include "puffer/systems/shot/connectivity.hpp"
#include "puffer/core/color_source.hpp"
#include "puffer/scenarios/classic.hpp"

using namespace Simulation;
using namespace ShotResolution;
using Components::BubbleColor;

class ConnectivityTest : public ::testing::Test {
protected:
    entt::registry registry;
    SystemConfig config;
    GridCoordinates coords{config};
    BubbleField field{registry, coords};

    PlacedBubble addAt(int row, int col, BubbleColor color) {
        return field.add(coords.centerOf({row, col}), color);
    }
};

TEST_F(ConnectivityTest, EmptyFieldHasNothingFloating) {
    EXPECT_TRUE(Connectivity::findFloating({}, config).empty());
}

TEST_F(ConnectivityTest, CeilingBandIsTwoRadii) {
    auto top = addAt(0, 0, BubbleColor::Red);
    auto second = addAt(1, 0, BubbleColor::Red);
    EXPECT_TRUE(Connectivity::isCeilingBubble(top, config));
    EXPECT_FALSE(Connectivity::isCeilingBubble(second, config));

    PlacedBubble edge;
    edge.position = Position(100.0, 40.0);
    EXPECT_TRUE(Connectivity::isCeilingBubble(edge, config));
}

TEST_F(ConnectivityTest, FullLayoutIsGrounded) {
    ClassicScenario scenario;
    RandomColorSource colors(7);
    scenario.createBubbles(field, colors);
    EXPECT_TRUE(Connectivity::findFloating(field.all(), config).empty());
}

TEST_F(ConnectivityTest, GroundingIgnoresColor) {
    addAt(0, 0, BubbleColor::Red);
    addAt(1, 0, BubbleColor::Green);
    addAt(2, 0, BubbleColor::Blue);
    addAt(3, 0, BubbleColor::Yellow);
    EXPECT_TRUE(Connectivity::findFloating(field.all(), config).empty());
}

TEST_F(ConnectivityTest, DetachedClusterFloatsInInsertionOrder) {
    addAt(0, 0, BubbleColor::Red);
    auto a = addAt(3, 4, BubbleColor::Green);
    auto b = addAt(3, 3, BubbleColor::Blue);

    auto floating = Connectivity::findFloating(field.all(), config);
    ASSERT_EQ(floating.size(), 2u);
    EXPECT_EQ(floating[0].id, a.id);
    EXPECT_EQ(floating[1].id, b.id);
}

TEST_F(ConnectivityTest, CeilingBubblesNeverFloat) {
    ClassicScenario scenario;
    RandomColorSource colors(3);
    scenario.createBubbles(field, colors);

    // Cut every link between row 0 and the rest
    BubbleIdSet cut;
    for (const auto& bubble : field.all()) {
        if (coords.rowOf(bubble.position.y) == 1) {
            cut.insert(bubble.id);
        }
    }
    field.removeAll(cut);

    auto bubbles = field.all();
    auto floating = Connectivity::findFloating(bubbles, config);
    EXPECT_FALSE(floating.empty());
    for (const auto& bubble : floating) {
        EXPECT_FALSE(Connectivity::isCeilingBubble(bubble, config));
        EXPECT_GE(coords.rowOf(bubble.position.y), 2);
    }
    // Rows 2..5 hang from nothing now
    EXPECT_EQ(floating.size(), bubbles.size() - 8u);
}
