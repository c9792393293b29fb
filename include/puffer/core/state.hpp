#pragma once

#include <entt/entt.hpp>
#include "puffer/components/sim.hpp"

namespace Simulation {

/**
 * @brief Returns the simulation state stored on the registry's state entity
 *
 * Creates the state entity with default values if the registry has none.
 */
Components::SimulationState& stateOf(entt::registry& registry);

/**
 * @brief Read-only lookup of the simulation state
 * @return nullptr if the registry has no state entity
 */
const Components::SimulationState* findState(const entt::registry& registry);

} // namespace Simulation
