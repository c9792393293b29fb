#ifndef PUFFER_GAME_CONSTANTS_HPP
#define PUFFER_GAME_CONSTANTS_HPP

#include <string>
#include "puffer/components/basic.hpp"

namespace GameConstants {

    // Truly global constants
    extern const double Pi;
    extern const double Sqrt3;

    // Playfield geometry
    extern const double BubbleRadius;
    extern const int GridColumns;
    extern const double PlayfieldHeight;

    // Shooter
    extern const double LaunchOffsetY;      ///< Launch point sits this far above the bottom edge
    extern const double ProjectileSpeed;    ///< Pixels per tick

    // Rules
    extern const double CollisionFactor;    ///< Hit when distance < radius * CollisionFactor
    extern const double AdjacencyFactor;    ///< Neighbours when distance < radius * AdjacencyFactor
    extern const double CeilingBandFactor;  ///< Ceiling row is y <= radius * CeilingBandFactor
    extern const int MatchThreshold;
    extern const int PointsPerMatched;
    extern const int PointsPerDropped;
    extern const double DangerLineOffset;   ///< Game over once y > height - DangerLineOffset
    extern const int InitialRows;

    // Display constants
    extern const unsigned int StepsPerSecond;

    /**
     * @brief Human readable name of a bubble color
     */
    std::string colorName(Components::BubbleColor color);

    /**
     * @brief Display palette entry for a bubble color
     */
    Components::Color colorRgb(Components::BubbleColor color);
}

#endif // PUFFER_GAME_CONSTANTS_HPP
