/**
 * @file classic.hpp
 * @brief Declaration of the ClassicScenario class
 */

#pragma once

#include "puffer/scenarios/i_scenario.hpp"

/**
 * @struct ClassicConfig
 * @brief Configuration parameters specific to the classic layout
 */
struct ClassicConfig {
    int rows = GameConstants::InitialRows;   // Rows filled from the ceiling down
    uint32_t seed = 0;                       // 0 = seed from the clock
};

/**
 * @class ClassicScenario
 *
 * Fills the top rows completely with random colors: GridColumns bubbles on
 * even rows, one fewer on the shifted odd rows.
 */
class ClassicScenario : public IScenario {
public:
    ClassicScenario() = default;
    explicit ClassicScenario(const ClassicConfig &config) : scenarioConfig(config) {}
    ~ClassicScenario() override = default;

    SystemConfig getConfig() const override;
    void createBubbles(Simulation::BubbleField &field, IColorSource &colors) const override;

private:
    ClassicConfig scenarioConfig;
};
