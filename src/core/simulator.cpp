/**
 * @fileoverview simulator.cpp
 * @brief Implementation of BubbleSimulator.
 */

#include "puffer/core/simulator.hpp"

#include <cmath>
#include <iostream>
#include <utility>

#include "puffer/components/basic.hpp"
#include "puffer/core/coordinates.hpp"
#include "puffer/core/debug.hpp"
#include "puffer/core/profile.hpp"
#include "puffer/core/state.hpp"
#include "puffer/scenarios/classic.hpp"
#include "puffer/systems/projectile.hpp"
#include "puffer/systems/shot_resolution.hpp"

BubbleSimulator::BubbleSimulator()
    : BubbleSimulator(std::make_unique<ClassicScenario>())
{
}

BubbleSimulator::BubbleSimulator(std::unique_ptr<IScenario> scenario,
                                 std::unique_ptr<IColorSource> colors)
    : scenarioPtr(std::move(scenario))
    , colorSource(std::move(colors))
{
  if (!scenarioPtr) {
    scenarioPtr = std::make_unique<ClassicScenario>();
  }
  currentConfig = scenarioPtr->getConfig();
  if (!colorSource) {
    colorSource = std::make_unique<RandomColorSource>(currentConfig.Seed);
  }

  createSystems();

  // Waiting for the first reset()
  auto& state = Simulation::stateOf(registry);
  state.phase = Components::GamePhase::Start;
  state.nextColor = colorSource->next();
}

BubbleSimulator::~BubbleSimulator() = default;

void BubbleSimulator::loadScenario(std::unique_ptr<IScenario> scenario) {
  if (scenario) {
    scenarioPtr = std::move(scenario);
  }
}

void BubbleSimulator::setColorSource(std::unique_ptr<IColorSource> colors) {
  if (colors) {
    colorSource = std::move(colors);
  }
}

void BubbleSimulator::applyConfig(const SystemConfig& cfg) {
  currentConfig = cfg;

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

void BubbleSimulator::createSystems() {
  systems.clear();

  auto shots = std::make_unique<Systems::ShotResolutionSystem>();
  shotSystem = shots.get();

  systems.push_back(std::make_unique<Systems::ProjectileSystem>());
  systems.push_back(std::move(shots));

  for (auto& system : systems) {
    system->setSystemConfig(currentConfig);
  }
}

Simulation::BubbleField BubbleSimulator::field() {
  return Simulation::BubbleField(registry, Simulation::GridCoordinates(currentConfig));
}

void BubbleSimulator::reset() {
  std::cout << "BubbleSimulator::reset()" << std::endl;

  applyConfig(scenarioPtr->getConfig());

  // One indivisible transition: field, projectile, score and effect queue go together
  registry.clear();
  shotSystem->clearLastOutcome();
  DebugStats::reset();

  auto& state = Simulation::stateOf(registry);

  auto bubbles = field();
  scenarioPtr->createBubbles(bubbles, *colorSource);

  state.nextColor = colorSource->next();
  state.score = 0;
  state.phase = Components::GamePhase::Playing;
}

bool BubbleSimulator::fire(double targetX, double targetY) {
  auto& state = Simulation::stateOf(registry);
  if (state.phase != Components::GamePhase::Playing) {
    return false;
  }
  if (!registry.view<Components::Projectile>().empty()) {
    return false;
  }

  Position const launch = getLaunchPosition();
  // A level or downward shot would bounce between the walls forever
  if (targetY >= launch.y) {
    return false;
  }

  double const angle = std::atan2(targetY - launch.y, targetX - launch.x);

  auto projectile = registry.create();
  registry.emplace<Components::Position>(projectile, launch);
  registry.emplace<Components::Velocity>(projectile, Vector::fromAngle(angle, currentConfig.ProjectileSpeed));
  registry.emplace<Components::Projectile>(projectile, state.nextColor);

  state.nextColor = colorSource->next();
  DebugStats::recordShot();
  return true;
}

void BubbleSimulator::tick() {
  PROFILE_SCOPE("BubbleSimulator::tick");

  if (getPhase() != Components::GamePhase::Playing) {
    return;
  }

  // Update all systems in order
  for (auto& system : systems) {
    system->update(registry);
  }
}

std::vector<Simulation::PlacedBubble> BubbleSimulator::getBubbles() const {
  return Simulation::BubbleField::snapshot(registry);
}

std::optional<ProjectileSnapshot> BubbleSimulator::getProjectile() const {
  auto view = registry.view<const Components::Position, const Components::Velocity, const Components::Projectile>();
  for (auto [entity, pos, vel, projectile] : view.each()) {
    return ProjectileSnapshot{pos, vel, projectile.color};
  }
  return std::nullopt;
}

int64_t BubbleSimulator::getScore() const {
  const auto* state = Simulation::findState(registry);
  return state ? state->score : 0;
}

Components::GamePhase BubbleSimulator::getPhase() const {
  const auto* state = Simulation::findState(registry);
  return state ? state->phase : Components::GamePhase::Start;
}

Components::BubbleColor BubbleSimulator::getNextColor() const {
  const auto* state = Simulation::findState(registry);
  return state ? state->nextColor : Components::BubbleColor::Red;
}

Position BubbleSimulator::getLaunchPosition() const {
  return {currentConfig.launchX(), currentConfig.launchY()};
}

std::vector<Components::MatchBurst> BubbleSimulator::drainEffects() {
  auto& state = Simulation::stateOf(registry);
  std::vector<Components::MatchBurst> effects;
  effects.swap(state.pendingEffects);
  return effects;
}

const std::optional<ShotOutcome>& BubbleSimulator::getLastShot() const {
  return shotSystem->getLastOutcome();
}

int BubbleSimulator::getDegradedPlacements() const {
  const auto* state = Simulation::findState(registry);
  return state ? state->degradedPlacements : 0;
}
