#pragma once

#include <cstdint>
#include "puffer/core/constants.hpp"

/**
 * @struct SystemConfig
 * @brief Holds all shared configuration parameters for the simulation.
 *
 * The active scenario produces one of these in getConfig(); the simulator
 * pushes it into every system before the first tick.
 */
struct SystemConfig {
    double BubbleRadius = GameConstants::BubbleRadius;
    int GridColumns = GameConstants::GridColumns;
    double PlayfieldHeight = GameConstants::PlayfieldHeight;

    double LaunchOffsetY = GameConstants::LaunchOffsetY;
    double ProjectileSpeed = GameConstants::ProjectileSpeed;

    double CollisionFactor = GameConstants::CollisionFactor;
    double AdjacencyFactor = GameConstants::AdjacencyFactor;
    double CeilingBandFactor = GameConstants::CeilingBandFactor;

    int MatchThreshold = GameConstants::MatchThreshold;
    int PointsPerMatched = GameConstants::PointsPerMatched;
    int PointsPerDropped = GameConstants::PointsPerDropped;
    double DangerLineOffset = GameConstants::DangerLineOffset;

    int InitialRows = GameConstants::InitialRows;

    // 0 seeds the color source from the clock
    uint32_t Seed = 0;

    double playfieldWidth() const { return GridColumns * 2.0 * BubbleRadius; }
    double launchX() const { return playfieldWidth() / 2.0; }
    double launchY() const { return PlayfieldHeight - LaunchOffsetY; }
    double dangerLineY() const { return PlayfieldHeight - DangerLineOffset; }
};
