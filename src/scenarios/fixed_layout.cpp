#include "puffer/scenarios/fixed_layout.hpp"

#include <string>
#include <utility>

FixedLayoutScenario::FixedLayoutScenario(std::vector<LayoutCell> cells, SystemConfig config)
    : cells(std::move(cells))
    , config(config)
{
}

SystemConfig FixedLayoutScenario::getConfig() const {
  return config;
}

void FixedLayoutScenario::createBubbles(Simulation::BubbleField &field, IColorSource & /*colors*/) const {
  const auto &coords = field.coordinates();
  for (const auto &cell : cells) {
    std::string const prefix = "r" + std::to_string(cell.row) + "c" + std::to_string(cell.col);
    field.add(coords.centerOf({cell.row, cell.col}), cell.color, prefix);
  }
}
