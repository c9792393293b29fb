/**
 * @file bubble_field.hpp
 * @brief Storage and membership queries for placed bubbles
 *
 * The field is a thin view over the bubble entities of an EnTT registry.
 * It owns no game behaviour: keeping one bubble per grid address is the
 * job of the placement stage, not of the field.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <entt/entt.hpp>

#include "puffer/components/basic.hpp"
#include "puffer/core/coordinates.hpp"

namespace Simulation {

/**
 * @brief Value snapshot of one placed bubble
 */
struct PlacedBubble {
    entt::entity entity = entt::null;
    std::string id;
    Position position;
    Components::BubbleColor color = Components::BubbleColor::Red;
    uint64_t serial = 0;
};

using BubbleIdSet = std::unordered_set<std::string>;

/**
 * @class BubbleField
 * @brief The mutable collection of placed bubbles
 */
class BubbleField {
public:
    BubbleField(entt::registry& registry, const GridCoordinates& coords);

    /**
     * @brief Places a bubble at a pixel position
     *
     * The bubble id is "<idPrefix>-<serial>", where the serial comes from the
     * simulation state and never repeats within a game.
     *
     * @return The snapshot of the new bubble
     */
    PlacedBubble add(const Position& pos,
                     Components::BubbleColor color,
                     const std::string& idPrefix = "b");

    /**
     * @brief Removes every bubble whose id is in the set
     * @return Number of bubbles removed
     */
    std::size_t removeAll(const BubbleIdSet& ids);

    /** @brief All bubbles in insertion order */
    std::vector<PlacedBubble> all() const;

    /** @brief All bubbles of a registry in insertion order, without a field */
    static std::vector<PlacedBubble> snapshot(const entt::registry& registry);

    /** @brief true if any bubble maps to the given grid address */
    bool isOccupied(int row, int col) const;
    bool isOccupied(const GridAddress& cell) const { return isOccupied(cell.row, cell.col); }

    std::optional<PlacedBubble> find(const std::string& id) const;

    std::size_t size() const;
    bool empty() const { return size() == 0; }

    /** @brief Destroys every bubble entity */
    void clear();

    const GridCoordinates& coordinates() const { return coords; }

private:
    entt::registry& registry;
    GridCoordinates coords;
};

} // namespace Simulation
