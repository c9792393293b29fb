#pragma once

#include <cstdint>
#include <vector>

#include "puffer/components/basic.hpp"

namespace Components {

    enum class GamePhase {
        Start,
        Playing,
        GameOver
    };

    // Cosmetic event emitted on every successful match, drained by the presentation layer.
    struct MatchBurst {
        Position centroid;      ///< Mean position of the matched bubbles
        Position placedAt;      ///< Cell center of the bubble that completed the match
        int matched = 0;
        int dropped = 0;
        int points = 0;
    };

    // Lives on a single state entity in the registry.
    struct SimulationState {
        GamePhase phase = GamePhase::Start;
        int64_t score = 0;
        BubbleColor nextColor = BubbleColor::Red;

        // Monotonic counter used to mint bubble ids and serials
        uint64_t nextSerial = 0;

        int degradedPlacements = 0;

        std::vector<MatchBurst> pendingEffects;
    };
}
