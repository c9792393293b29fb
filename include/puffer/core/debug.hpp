#pragma once

#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef ENABLE_DEBUG
#define ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-session shot counters, printed when a game ends
class DebugStats {
public:
    static void reset() {
        shots = 0;
        placements = 0;
        degraded_placements = 0;
        matches = 0;
        matched_bubbles = 0;
        dropped_bubbles = 0;
    }

    static void recordShot() { shots++; }

    static void recordPlacement(bool degraded) {
        placements++;
        if (degraded) {
            degraded_placements++;
        }
    }

    static void recordMatch(int matched, int dropped) {
        matches++;
        matched_bubbles += matched;
        dropped_bubbles += dropped;
    }

    static int shotCount() { return shots; }
    static int placementCount() { return placements; }
    static int degradedPlacementCount() { return degraded_placements; }
    static int matchCount() { return matches; }

    static void printShotStats() {
        DEBUG_MSG(DEBUG_LEVEL_BASIC,
            "Shot stats:\n"
            "  Shots fired: " << shots << "\n"
            "  Placements: " << placements << " (" << degraded_placements << " degraded)\n"
            "  Matches: " << matches << "\n"
            "  Bubbles matched/dropped: " << matched_bubbles << "/" << dropped_bubbles << "\n"
        );
    }

private:
    static int shots;
    static int placements;
    static int degraded_placements;
    static int matches;
    static int matched_bubbles;
    static int dropped_bubbles;
};
