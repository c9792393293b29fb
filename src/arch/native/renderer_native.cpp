#include "puffer/arch/native/renderer_native.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <utility>

#include "puffer/core/constants.hpp"

namespace {

sf::Color toSfColor(Components::BubbleColor color) {
    Components::Color const rgb = GameConstants::colorRgb(color);
    return sf::Color(rgb.r, rgb.g, rgb.b);
}

} // namespace

Renderer::Renderer(int screenWidth, int screenHeight)
    : window()
    , font()
    , initialized(false)
    , hasFont(false)
    , screenWidth(screenWidth)
    , screenHeight(screenHeight)
{
}

Renderer::~Renderer() = default;

bool Renderer::init() {
    window.create(sf::VideoMode(screenWidth, screenHeight), "Puffer Blast");
    if (!window.isOpen()) {
        std::cerr << "Failed to open the game window\n";
        return false;
    }
    window.setFramerateLimit(GameConstants::StepsPerSecond);

    hasFont = font.loadFromFile("assets/fonts/arial.ttf");
    if (!hasFont) {
        std::cerr << "Failed to load font assets/fonts/arial.ttf, HUD text disabled\n";
    }
    initialized = true;
    return true;
}

void Renderer::clear() {
    window.clear(sf::Color(10, 10, 10));
}

void Renderer::present() {
    window.display();
}

void Renderer::drawBubble(const Position& pos, float radius, Components::BubbleColor color) {
    sf::CircleShape circle(radius);
    circle.setOrigin(radius, radius);
    circle.setPosition(static_cast<float>(pos.x), static_cast<float>(pos.y));
    circle.setFillColor(toSfColor(color));
    window.draw(circle);
}

void Renderer::renderField(const BubbleSimulator& simulator) {
    const auto& cfg = simulator.getConfig();
    float const radius = static_cast<float>(cfg.BubbleRadius);

    // Danger line
    float const dangerY = static_cast<float>(cfg.dangerLineY());
    sf::Vertex line[2] = {
        sf::Vertex(sf::Vector2f(0.f, dangerY), sf::Color(120, 40, 40)),
        sf::Vertex(sf::Vector2f(static_cast<float>(screenWidth), dangerY), sf::Color(120, 40, 40))
    };
    window.draw(line, 2, sf::Lines);

    for (const auto& bubble : simulator.getBubbles()) {
        drawBubble(bubble.position, radius - 2.f, bubble.color);
    }

    if (auto projectile = simulator.getProjectile()) {
        drawBubble(projectile->position, radius, projectile->color);
    }

    // Launcher base with the upcoming color loaded
    Position const launch = simulator.getLaunchPosition();
    sf::RectangleShape base(sf::Vector2f(40.f, 20.f));
    base.setPosition(static_cast<float>(launch.x) - 20.f, static_cast<float>(cfg.PlayfieldHeight) - 20.f);
    base.setFillColor(sf::Color(51, 51, 51));
    window.draw(base);
    drawBubble(launch, radius, simulator.getNextColor());
}

void Renderer::renderEffects(std::vector<Components::MatchBurst> bursts) {
    for (auto& burst : bursts) {
        liveBursts.push_back({std::move(burst), 1.0f});
    }

    for (auto& live : liveBursts) {
        float const grow = 1.0f - live.life;
        float const ringRadius = 10.f + 40.f * grow;
        sf::CircleShape ring(ringRadius);
        ring.setOrigin(ringRadius, ringRadius);
        ring.setPosition(static_cast<float>(live.burst.centroid.x),
                         static_cast<float>(live.burst.centroid.y));
        ring.setFillColor(sf::Color::Transparent);
        ring.setOutlineThickness(3.f);
        ring.setOutlineColor(sf::Color(255, 85, 170, static_cast<sf::Uint8>(255 * live.life)));
        window.draw(ring);

        live.life -= 0.015f;
    }

    liveBursts.erase(std::remove_if(liveBursts.begin(), liveBursts.end(),
                                    [](const LiveBurst& b) { return b.life <= 0.f; }),
                     liveBursts.end());
}

void Renderer::renderHud(const BubbleSimulator& simulator) {
    std::stringstream ss;
    ss << "Score: " << simulator.getScore();
    renderText(ss.str(), 10, screenHeight - 30);
    renderText("Next: " + GameConstants::colorName(simulator.getNextColor()),
               screenWidth - 110, screenHeight - 30, toSfColor(simulator.getNextColor()));

    switch (simulator.getPhase()) {
        case Components::GamePhase::Start:
            renderText("Click to start", screenWidth / 2 - 60, screenHeight / 2, sf::Color(255, 255, 85), 20);
            break;
        case Components::GamePhase::GameOver:
            liveBursts.clear();
            renderText("GAME OVER", screenWidth / 2 - 60, screenHeight / 2 - 30, sf::Color(255, 85, 85), 24);
            renderText("Click to try again", screenWidth / 2 - 75, screenHeight / 2 + 10);
            break;
        default:
            break;
    }
}

void Renderer::renderText(const std::string& text, int x, int y, sf::Color color, unsigned int size) {
    if (!hasFont) {
        return;
    }
    sf::Text sfText;
    sfText.setFont(font);
    sfText.setString(text);
    sfText.setCharacterSize(size);
    sfText.setFillColor(color);
    sfText.setPosition(static_cast<float>(x), static_cast<float>(y));
    window.draw(sfText);
}
