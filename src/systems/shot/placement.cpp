#include "puffer/systems/shot/placement.hpp"

#include <limits>

#include "puffer/core/debug.hpp"
#include "puffer/core/profile.hpp"

namespace ShotResolution {
namespace Placement {

PlacementResult resolveCell(const Simulation::BubbleField& field, const Position& previous) {
    PROFILE_SCOPE("Placement::resolveCell");

    const auto& coords = field.coordinates();
    Simulation::GridAddress const target = coords.clamp(coords.addressOf(previous));

    if (!field.isOccupied(target)) {
        return {target, false};
    }

    double bestDist = std::numeric_limits<double>::infinity();
    Simulation::GridAddress best = target;
    bool found = false;

    for (int dr = -1; dr <= 1; ++dr) {
        for (int dc = -1; dc <= 1; ++dc) {
            Simulation::GridAddress const candidate{target.row + dr, target.col + dc};
            if (!coords.contains(candidate) || field.isOccupied(candidate)) {
                continue;
            }
            double const dist = previous.dist(coords.centerOf(candidate));
            if (dist < bestDist) {
                bestDist = dist;
                best = candidate;
                found = true;
            }
        }
    }

    if (!found) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "No free cell around (" << target.row << ", " << target.col << ")\n");
        return {target, true};
    }
    return {best, false};
}

} // namespace Placement
} // namespace ShotResolution
