/**
 * @file renderer_native.hpp
 * @brief Desktop front end drawing the simulation with SFML
 *
 * This layer handles:
 * - Bubble, projectile and launcher drawing
 * - Fading rings for queued MatchBurst events
 * - Score / phase text
 *
 * It only reads simulator state; all game rules stay in the core.
 */

#pragma once

#include <string>
#include <vector>

#include <SFML/Graphics.hpp>

#include "puffer/components/sim.hpp"
#include "puffer/core/simulator.hpp"

/**
 * @class Renderer
 * @brief Owns the SFML window and draws one frame at a time
 */
class Renderer {
public:
    /**
     * @param screenWidth Width of the playfield window
     * @param screenHeight Height of the playfield window
     */
    Renderer(int screenWidth, int screenHeight);
    ~Renderer();

    /**
     * @brief Creates the window and loads the HUD font
     * @return false if the window could not be opened; a missing font only
     *         disables text
     */
    bool init();

    void clear();
    void present();

    /** @brief Draws bubbles, projectile, launcher and upcoming color */
    void renderField(const BubbleSimulator& simulator);

    /** @brief Takes ownership of new bursts and draws all live ones */
    void renderEffects(std::vector<Components::MatchBurst> bursts);

    /** @brief Score, and the start / game over prompt when not playing */
    void renderHud(const BubbleSimulator& simulator);

    void renderText(const std::string& text, int x, int y,
                    sf::Color color = sf::Color::White, unsigned int size = 16);

    bool isInitialized() const { return initialized; }

    sf::RenderWindow& getWindow() { return window; }

private:
    // A MatchBurst being animated: an expanding ring that fades out
    struct LiveBurst {
        Components::MatchBurst burst;
        float life = 1.0f;
    };

    sf::RenderWindow window;
    sf::Font font;
    bool initialized;
    bool hasFont;
    int screenWidth;
    int screenHeight;
    std::vector<LiveBurst> liveBursts;

    void drawBubble(const Position& pos, float radius, Components::BubbleColor color);
};
