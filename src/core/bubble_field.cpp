#include "puffer/core/bubble_field.hpp"

#include <algorithm>

#include "puffer/core/state.hpp"

namespace Simulation {

BubbleField::BubbleField(entt::registry& registry, const GridCoordinates& coords)
    : registry(registry)
    , coords(coords)
{
}

PlacedBubble BubbleField::add(const Position& pos,
                              Components::BubbleColor color,
                              const std::string& idPrefix) {
    auto& state = stateOf(registry);
    uint64_t const serial = state.nextSerial++;

    PlacedBubble placed;
    placed.entity = registry.create();
    placed.id = idPrefix + "-" + std::to_string(serial);
    placed.position = pos;
    placed.color = color;
    placed.serial = serial;

    registry.emplace<Components::Position>(placed.entity, pos);
    registry.emplace<Components::Bubble>(placed.entity, color, placed.id, serial);
    return placed;
}

std::size_t BubbleField::removeAll(const BubbleIdSet& ids) {
    if (ids.empty()) {
        return 0;
    }

    // Collect first; destroying while iterating a view invalidates it
    std::vector<entt::entity> doomed;
    auto view = registry.view<Components::Bubble>();
    for (auto entity : view) {
        if (ids.count(view.get<Components::Bubble>(entity).id) != 0) {
            doomed.push_back(entity);
        }
    }
    for (auto entity : doomed) {
        registry.destroy(entity);
    }
    return doomed.size();
}

std::vector<PlacedBubble> BubbleField::all() const {
    return snapshot(registry);
}

std::vector<PlacedBubble> BubbleField::snapshot(const entt::registry& registry) {
    std::vector<PlacedBubble> bubbles;
    auto view = registry.view<const Components::Position, const Components::Bubble>();
    for (auto [entity, pos, bubble] : view.each()) {
        bubbles.push_back({entity, bubble.id, pos, bubble.color, bubble.serial});
    }
    std::sort(bubbles.begin(), bubbles.end(),
              [](const PlacedBubble& a, const PlacedBubble& b) { return a.serial < b.serial; });
    return bubbles;
}

bool BubbleField::isOccupied(int row, int col) const {
    GridAddress const cell{row, col};
    auto view = registry.view<const Components::Position, const Components::Bubble>();
    for (auto [entity, pos, bubble] : view.each()) {
        if (coords.addressOf(pos) == cell) {
            return true;
        }
    }
    return false;
}

std::optional<PlacedBubble> BubbleField::find(const std::string& id) const {
    auto view = registry.view<const Components::Position, const Components::Bubble>();
    for (auto [entity, pos, bubble] : view.each()) {
        if (bubble.id == id) {
            return PlacedBubble{entity, bubble.id, pos, bubble.color, bubble.serial};
        }
    }
    return std::nullopt;
}

std::size_t BubbleField::size() const {
    return registry.view<const Components::Bubble>().size();
}

void BubbleField::clear() {
    auto view = registry.view<Components::Bubble>();
    std::vector<entt::entity> const doomed(view.begin(), view.end());
    registry.destroy(doomed.begin(), doomed.end());
}

} // namespace Simulation
