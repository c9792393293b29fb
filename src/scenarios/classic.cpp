/**
 * @file classic.cpp
 * @brief The standard opening field: six packed rows of random colors.
 */

#include "puffer/scenarios/classic.hpp"

#include <string>

SystemConfig ClassicScenario::getConfig() const {
  SystemConfig cfg;
  cfg.InitialRows = scenarioConfig.rows;
  cfg.Seed = scenarioConfig.seed;
  return cfg;
}

void ClassicScenario::createBubbles(Simulation::BubbleField &field, IColorSource &colors) const {
  const auto &coords = field.coordinates();

  for (int row = 0; row < scenarioConfig.rows; ++row) {
    for (int col = 0; col < coords.columnsInRow(row); ++col) {
      std::string const prefix = "r" + std::to_string(row) + "c" + std::to_string(col);
      field.add(coords.centerOf({row, col}), colors.next(), prefix);
    }
  }
}
