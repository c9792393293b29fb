#include "puffer/core/constants.hpp"

namespace GameConstants {

    const double Pi    = 3.14159265358979323846;
    const double Sqrt3 = 1.73205080756887729353;

    const double BubbleRadius    = 20.0;
    const int    GridColumns     = 8;
    const double PlayfieldHeight = 500.0;

    const double LaunchOffsetY   = 40.0;
    const double ProjectileSpeed = 8.0;

    const double CollisionFactor   = 1.8;
    const double AdjacencyFactor   = 2.5;
    const double CeilingBandFactor = 2.0;
    const int    MatchThreshold    = 3;
    const int    PointsPerMatched  = 10;
    const int    PointsPerDropped  = 20;
    const double DangerLineOffset  = 100.0;
    const int    InitialRows       = 6;

    const unsigned int StepsPerSecond = 60;

    std::string colorName(Components::BubbleColor color) {
        switch (color) {
            case Components::BubbleColor::Red:     return "RED";
            case Components::BubbleColor::Green:   return "GREEN";
            case Components::BubbleColor::Blue:    return "BLUE";
            case Components::BubbleColor::Yellow:  return "YELLOW";
            case Components::BubbleColor::Magenta: return "MAGENTA";
            case Components::BubbleColor::Cyan:    return "CYAN";
            default: return "UNKNOWN";
        }
    }

    Components::Color colorRgb(Components::BubbleColor color) {
        switch (color) {
            case Components::BubbleColor::Red:     return {0xFF, 0x55, 0x55};
            case Components::BubbleColor::Green:   return {0x55, 0xFF, 0x55};
            case Components::BubbleColor::Blue:    return {0x55, 0x55, 0xFF};
            case Components::BubbleColor::Yellow:  return {0xFF, 0xFF, 0x55};
            case Components::BubbleColor::Magenta: return {0xFF, 0x55, 0xFF};
            case Components::BubbleColor::Cyan:    return {0x55, 0xFF, 0xFF};
            default: return {};
        }
    }

} // namespace GameConstants
