#include "puffer/core/color_source.hpp"

#include <ctime>
#include <utility>

RandomColorSource::RandomColorSource(uint32_t seed)
    : generator(seed != 0 ? seed : static_cast<uint32_t>(std::time(nullptr)))
    , distribution(0, Components::BubbleColorCount - 1)
{
}

Components::BubbleColor RandomColorSource::next() {
    return Components::AllBubbleColors[static_cast<std::size_t>(distribution(generator))];
}

SequenceColorSource::SequenceColorSource(std::vector<Components::BubbleColor> colors)
    : colors(std::move(colors))
{
}

Components::BubbleColor SequenceColorSource::next() {
    if (colors.empty()) {
        return Components::BubbleColor::Red;
    }
    Components::BubbleColor const color = colors[cursor];
    cursor = (cursor + 1) % colors.size();
    return color;
}
