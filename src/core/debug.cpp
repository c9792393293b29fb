#include "puffer/core/debug.hpp"

// Initialize static members
int DebugStats::shots = 0;
int DebugStats::placements = 0;
int DebugStats::degraded_placements = 0;
int DebugStats::matches = 0;
int DebugStats::matched_bubbles = 0;
int DebugStats::dropped_bubbles = 0;
