#ifndef PUFFER_I_SCENARIO_HPP
#define PUFFER_I_SCENARIO_HPP

#include "puffer/core/bubble_field.hpp"
#include "puffer/core/color_source.hpp"
#include "puffer/core/system_config.hpp"

/**
 * @brief Abstract base class for an initial field layout
 *
 * Each scenario must provide:
 *  - getConfig() returning the SystemConfig the game runs with
 *  - createBubbles() that populates an empty field
 */
class IScenario {
public:
    virtual ~IScenario() = default;

    /**
     * @brief Returns playfield geometry, rules and seed for this scenario
     */
    virtual SystemConfig getConfig() const = 0;

    /**
     * @brief Places the starting bubbles
     * @param field Empty bubble field
     * @param colors Source for any colors the layout leaves open
     */
    virtual void createBubbles(Simulation::BubbleField &field, IColorSource &colors) const = 0;
};

#endif // PUFFER_I_SCENARIO_HPP
