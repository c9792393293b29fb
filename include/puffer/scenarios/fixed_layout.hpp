/**
 * @file fixed_layout.hpp
 * @brief Declaration of the FixedLayoutScenario class
 */

#pragma once

#include <vector>

#include "puffer/components/basic.hpp"
#include "puffer/core/coordinates.hpp"
#include "puffer/scenarios/i_scenario.hpp"

/**
 * @struct LayoutCell
 * @brief One pre-placed bubble of a fixed layout
 */
struct LayoutCell {
    int row;
    int col;
    Components::BubbleColor color;
};

/**
 * @class FixedLayoutScenario
 *
 * Places an explicit list of bubbles, in list order. Used for reproducible
 * games and tests.
 */
class FixedLayoutScenario : public IScenario {
public:
    FixedLayoutScenario(std::vector<LayoutCell> cells, SystemConfig config = SystemConfig());
    ~FixedLayoutScenario() override = default;

    SystemConfig getConfig() const override;
    void createBubbles(Simulation::BubbleField &field, IColorSource &colors) const override;

private:
    std::vector<LayoutCell> cells;
    SystemConfig config;
};
