/**
 * @file shot_resolution.hpp
 * @brief Turns a collided projectile into field changes
 *
 * This module orchestrates the shot pipeline:
 * 1. Placement: snap the projectile to the nearest free grid cell
 * 2. Matching: flood fill the same-color cluster around the new bubble
 * 3. Connectivity: drop bubbles cut off from the ceiling (only after a match)
 * 4. Scoring: credit points, queue the cosmetic burst, test the danger line
 */

#pragma once

#include <optional>

#include <entt/entt.hpp>

#include "puffer/components/basic.hpp"
#include "puffer/systems/i_system.hpp"
#include "puffer/systems/shot/shot_data.hpp"

namespace Systems {

/**
 * @class ShotResolutionSystem
 * @brief Consumes projectiles carrying an Impact and resolves them
 */
class ShotResolutionSystem : public ISystem {
public:
    ShotResolutionSystem() = default;
    ~ShotResolutionSystem() override = default;

    /**
     * @brief Resolves every collided projectile, then destroys it
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Runs the full pipeline for one landing shot
     *
     * @param registry Registry holding the bubble field and simulation state
     * @param color Color of the landing projectile
     * @param previous Last non-colliding projectile position
     * @return What the shot did
     */
    ShotOutcome resolveShot(entt::registry &registry,
                            Components::BubbleColor color,
                            const Position &previous) const;

    /**
     * @brief Outcome of the most recent shot resolved by update()
     */
    const std::optional<ShotOutcome>& getLastOutcome() const { return lastOutcome; }

    void clearLastOutcome() { lastOutcome.reset(); }

private:
    std::optional<ShotOutcome> lastOutcome;
};

} // namespace Systems
