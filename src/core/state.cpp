#include "puffer/core/state.hpp"

namespace Simulation {

Components::SimulationState& stateOf(entt::registry& registry) {
    auto view = registry.view<Components::SimulationState>();
    if (!view.empty()) {
        return registry.get<Components::SimulationState>(view.front());
    }
    auto stateEntity = registry.create();
    return registry.emplace<Components::SimulationState>(stateEntity);
}

const Components::SimulationState* findState(const entt::registry& registry) {
    auto view = registry.view<const Components::SimulationState>();
    if (view.empty()) {
        return nullptr;
    }
    return &registry.get<Components::SimulationState>(view.front());
}

} // namespace Simulation
