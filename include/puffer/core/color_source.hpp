/**
 * @file color_source.hpp
 * @brief Injectable sources of bubble colors
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "puffer/components/basic.hpp"

/**
 * @class IColorSource
 * @brief Supplies colors for initial bubbles and new projectiles
 */
class IColorSource {
public:
    virtual ~IColorSource() = default;

    /**
     * @brief Draws the next color
     */
    virtual Components::BubbleColor next() = 0;
};

/**
 * @class RandomColorSource
 * @brief Independent uniform draws from the six bubble colors
 *
 * A seed of 0 seeds the generator from the wall clock.
 */
class RandomColorSource : public IColorSource {
public:
    explicit RandomColorSource(uint32_t seed = 0);
    ~RandomColorSource() override = default;

    Components::BubbleColor next() override;

private:
    std::mt19937 generator;
    std::uniform_int_distribution<int> distribution;
};

/**
 * @class SequenceColorSource
 * @brief Replays a fixed list of colors, wrapping around at the end
 */
class SequenceColorSource : public IColorSource {
public:
    explicit SequenceColorSource(std::vector<Components::BubbleColor> colors);
    ~SequenceColorSource() override = default;

    Components::BubbleColor next() override;

private:
    std::vector<Components::BubbleColor> colors;
    std::size_t cursor = 0;
};
