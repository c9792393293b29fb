#include "puffer/systems/projectile.hpp"

#include <utility>
#include <vector>

#include "puffer/components/basic.hpp"
#include "puffer/core/debug.hpp"
#include "puffer/core/profile.hpp"

namespace Systems {

void ProjectileSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("ProjectileSystem");

    const double radius = sysConfig.BubbleRadius;
    const double width = sysConfig.playfieldWidth();
    const double height = sysConfig.PlayfieldHeight;
    const double hitDistance = radius * sysConfig.CollisionFactor;
    const double margin = radius * specificConfig.despawnMarginRadii;

    std::vector<std::pair<entt::entity, Components::Impact>> impacts;
    std::vector<entt::entity> lost;

    auto bubbles = registry.view<const Components::Position, const Components::Bubble>();
    auto view = registry.view<Components::Position, Components::Velocity, const Components::Projectile>(
        entt::exclude<Components::Impact>);

    for (auto &&[entity, pos, vel, projectile] : view.each()) {
        pos += vel;

        if (pos.x < radius || pos.x > width - radius) {
            vel.x = -vel.x;
        }

        bool collided = false;
        bool ceiling = false;

        if (pos.y < radius) {
            collided = true;
            ceiling = true;
        } else {
            for (auto [bubbleEntity, bubblePos, bubble] : bubbles.each()) {
                if (pos.dist(bubblePos) < hitDistance) {
                    collided = true;
                    break;
                }
            }
        }

        if (collided) {
            // The sample before this step; uses the velocity after any reflection
            impacts.emplace_back(entity, Components::Impact{pos - vel, ceiling});
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
                "Projectile hit " << (ceiling ? "ceiling" : "bubble")
                << " at (" << pos.x << ", " << pos.y << ")\n");
        } else if (pos.y < -margin || pos.y > height + margin) {
            lost.push_back(entity);
        }
    }

    for (auto &[entity, impact] : impacts) {
        registry.emplace<Components::Impact>(entity, impact);
    }
    for (auto entity : lost) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "Projectile left the playfield, despawned\n");
        registry.destroy(entity);
    }
}

} // namespace Systems
