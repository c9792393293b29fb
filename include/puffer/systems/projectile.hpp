/**
 * @file projectile.hpp
 * @brief System for advancing the in-flight projectile
 *
 * This system handles:
 * - Position integration (x += vx, y += vy) once per tick
 * - Reflection off the side walls
 * - Collision detection against the ceiling and placed bubbles
 * - Despawning a projectile that leaves the playfield vertically
 *
 * Required components:
 * - Position, Velocity, Projectile (to modify)
 *
 * Produces:
 * - Impact on the projectile when it collides, consumed by ShotResolutionSystem
 */

#ifndef PUFFER_PROJECTILE_SYSTEM_HPP
#define PUFFER_PROJECTILE_SYSTEM_HPP

#include <entt/entt.hpp>
#include "puffer/systems/i_system.hpp"

namespace Systems {

/**
 * @struct ProjectileConfig
 * @brief Configuration parameters specific to the projectile system
 */
struct ProjectileConfig {
    // Vertical despawn margin beyond the playfield, in bubble radii
    double despawnMarginRadii = 1.0;
};

/**
 * @class ProjectileSystem
 * @brief Moves the projectile and flags collisions
 *
 * Wall reflection only negates vx; the position is not corrected, so the
 * projectile may overshoot a wall by up to one step. The bubble test takes the
 * first bubble within reach, not the nearest one.
 */
class ProjectileSystem : public ConfigurableSystem<ProjectileConfig> {
public:
    ProjectileSystem() = default;
    ~ProjectileSystem() override = default;

    /**
     * @brief Advances every projectile that has not collided yet
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif
