/**
 * @file main_native.cpp
 * @brief Main entry point for the desktop build.
 *
 * Usage: puffer_native [seed]
 */

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <memory>

#include <SFML/Window/Event.hpp>

#include "puffer/arch/native/renderer_native.hpp"
#include "puffer/core/profile.hpp"
#include "puffer/core/simulator.hpp"
#include "puffer/scenarios/classic.hpp"

int main(int argc, char** argv) {
    ClassicConfig classic;
    if (argc > 1) {
        classic.seed = static_cast<uint32_t>(std::strtoul(argv[1], nullptr, 10));
    }

    BubbleSimulator simulator(std::make_unique<ClassicScenario>(classic));
    const SystemConfig& cfg = simulator.getConfig();

    Renderer renderer(static_cast<int>(cfg.playfieldWidth()), static_cast<int>(cfg.PlayfieldHeight));
    if (!renderer.init()) {
        std::cerr << "Renderer initialization failed." << std::endl;
        return 1;
    }

    sf::RenderWindow& window = renderer.getWindow();
    while (window.isOpen()) {
        sf::Event event;
        while (window.pollEvent(event)) {
            if (event.type == sf::Event::Closed) {
                window.close();
            } else if (event.type == sf::Event::KeyPressed) {
                switch (event.key.code) {
                    case sf::Keyboard::Escape:
                        window.close();
                        break;
                    case sf::Keyboard::Enter:
                    case sf::Keyboard::R:
                        simulator.reset();
                        break;
                    default:
                        break;
                }
            } else if (event.type == sf::Event::MouseButtonPressed &&
                       event.mouseButton.button == sf::Mouse::Left) {
                if (simulator.getPhase() == Components::GamePhase::Playing) {
                    simulator.fire(event.mouseButton.x, event.mouseButton.y);
                } else {
                    simulator.reset();
                }
            }
        }

        simulator.tick();

        renderer.clear();
        renderer.renderField(simulator);
        renderer.renderEffects(simulator.drainEffects());
        renderer.renderHud(simulator);
        renderer.present();
    }

    Profiling::Profiler::printStats();
    return 0;
}
