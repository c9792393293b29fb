#ifndef PUFFER_COMPONENTS_BASIC_HPP
#define PUFFER_COMPONENTS_BASIC_HPP

#include <array>
#include <cstdint>
#include <string>
#include <utility>
#include "puffer/math/vector_math.hpp" // for Position, Vector

namespace Components {

    /**
     * @brief The fixed set of bubble colors
     */
    enum class BubbleColor : uint8_t {
        Red,
        Green,
        Blue,
        Yellow,
        Magenta,
        Cyan
    };

    constexpr int BubbleColorCount = 6;

    constexpr std::array<BubbleColor, BubbleColorCount> AllBubbleColors = {
        BubbleColor::Red,
        BubbleColor::Green,
        BubbleColor::Blue,
        BubbleColor::Yellow,
        BubbleColor::Magenta,
        BubbleColor::Cyan
    };

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    // A bubble placed in the field.
    // serial orders bubbles by insertion; id is unique for the lifetime of a game.
    struct Bubble {
        BubbleColor color = BubbleColor::Red;
        std::string id;
        uint64_t serial = 0;

        Bubble(BubbleColor c = BubbleColor::Red, std::string i = {}, uint64_t s = 0)
            : color(c), id(std::move(i)), serial(s) {}
    };

    // The in-flight shot. At most one entity carries this component.
    struct Projectile {
        BubbleColor color = BubbleColor::Red;

        explicit Projectile(BubbleColor c = BubbleColor::Red) : color(c) {}
    };

    // Attached by the projectile system when the shot collides.
    // previous is the last non-colliding sample (position minus velocity).
    struct Impact {
        Position previous;
        bool ceiling = false;
    };

    // Display color for the presentation layer
    struct Color {
        uint8_t r, g, b;
        Color(uint8_t r = 255, uint8_t g = 255, uint8_t b = 255)
            : r(r), g(g), b(b) {}
    };

} // namespace Components

#endif // PUFFER_COMPONENTS_BASIC_HPP
