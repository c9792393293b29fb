#include <gtest/gtest.h>
#include <set>
#include <string>
#include "puffer/core/constants.hpp"

using Components::BubbleColor;

TEST(ConstantsTest, ColorNames) {
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Red), "RED");
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Green), "GREEN");
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Blue), "BLUE");
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Yellow), "YELLOW");
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Magenta), "MAGENTA");
    EXPECT_EQ(GameConstants::colorName(BubbleColor::Cyan), "CYAN");
}

TEST(ConstantsTest, PaletteEntries) {
    Components::Color red = GameConstants::colorRgb(BubbleColor::Red);
    EXPECT_EQ(red.r, 0xFF);
    EXPECT_EQ(red.g, 0x55);
    EXPECT_EQ(red.b, 0x55);

    Components::Color cyan = GameConstants::colorRgb(BubbleColor::Cyan);
    EXPECT_EQ(cyan.r, 0x55);
    EXPECT_EQ(cyan.g, 0xFF);
    EXPECT_EQ(cyan.b, 0xFF);

    // Every color is distinguishable on screen
    std::set<int> packed;
    for (BubbleColor color : Components::AllBubbleColors) {
        Components::Color rgb = GameConstants::colorRgb(color);
        packed.insert((rgb.r << 16) | (rgb.g << 8) | rgb.b);
    }
    EXPECT_EQ(packed.size(), static_cast<size_t>(Components::BubbleColorCount));
}
