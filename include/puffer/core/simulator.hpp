/**
 * @file simulator.hpp
 * @brief Main simulator class that owns the ECS registry and the game lifecycle.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include <entt/entt.hpp>

#include "puffer/components/sim.hpp"
#include "puffer/core/bubble_field.hpp"
#include "puffer/core/color_source.hpp"
#include "puffer/core/system_config.hpp"
#include "puffer/scenarios/i_scenario.hpp"
#include "puffer/systems/i_system.hpp"
#include "puffer/systems/shot/shot_data.hpp"

namespace Systems {
class ShotResolutionSystem;
}

/**
 * @brief Read-only copy of the in-flight projectile
 */
struct ProjectileSnapshot {
    Position position;
    Vector velocity;
    Components::BubbleColor color;
};

/**
 * @class BubbleSimulator
 * @brief Single-writer driver for the bubble shooter simulation.
 *
 * Every mutation (fire, tick, reset) runs to completion on the caller's
 * thread; the presentation layer reads the queries between ticks.
 */
class BubbleSimulator {
public:
    /**
     * @brief Classic layout with a clock-seeded random color source
     */
    BubbleSimulator();

    /**
     * @param scenario Initial field layout and configuration
     * @param colors Color source; a RandomColorSource seeded with the
     *        scenario's Seed is created when null
     */
    explicit BubbleSimulator(std::unique_ptr<IScenario> scenario,
                             std::unique_ptr<IColorSource> colors = nullptr);

    ~BubbleSimulator();

    BubbleSimulator(const BubbleSimulator&) = delete;
    BubbleSimulator& operator=(const BubbleSimulator&) = delete;

    /**
     * @brief Replaces the scenario; takes effect on the next reset()
     */
    void loadScenario(std::unique_ptr<IScenario> scenario);

    void setColorSource(std::unique_ptr<IColorSource> colors);

    /**
     * @brief Starts a new game: clears the field, projectile, score and
     *        pending effects, lays out the scenario and enters Playing
     */
    void reset();

    /**
     * @brief Launches a projectile from the launcher toward a target point
     *
     * Ignored unless the game is Playing, no projectile is in flight and the
     * target lies above the launcher. The upcoming color is used for the shot
     * and a new one is drawn.
     *
     * @return true if a projectile was launched
     */
    bool fire(double targetX, double targetY);

    /**
     * @brief Steps the ECS systems for one tick (no-op unless Playing)
     */
    void tick();

    // Queries for the presentation layer
    std::vector<Simulation::PlacedBubble> getBubbles() const;
    std::optional<ProjectileSnapshot> getProjectile() const;
    int64_t getScore() const;
    Components::GamePhase getPhase() const;
    Components::BubbleColor getNextColor() const;
    Position getLaunchPosition() const;

    /**
     * @brief Hands over and clears the queued cosmetic events
     */
    std::vector<Components::MatchBurst> drainEffects();

    /**
     * @brief Outcome of the most recently resolved shot, if any since reset
     */
    const std::optional<ShotOutcome>& getLastShot() const;

    int getDegradedPlacements() const;

    const SystemConfig& getConfig() const { return currentConfig; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    entt::registry registry;
    std::unique_ptr<IScenario> scenarioPtr;
    std::unique_ptr<IColorSource> colorSource;
    SystemConfig currentConfig;

    std::vector<std::unique_ptr<Systems::ISystem>> systems;
    Systems::ShotResolutionSystem* shotSystem = nullptr;

    void createSystems();
    void applyConfig(const SystemConfig& cfg);
    Simulation::BubbleField field();
};
