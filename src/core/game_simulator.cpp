/**
 * @fileoverview game_simulator.cpp
 * @brief Implementation of GameSimulator.
 */

#include "pingpong/core/game_simulator.hpp"

#include <iostream>

#include "pingpong/core/debug.hpp"
#include "pingpong/core/profile.hpp"
#include "pingpong/systems/collision_report.hpp"
#include "pingpong/tracking/racket_tracker.hpp"

GameSimulator::GameSimulator(const GameConfig& config, IAudioCues& audio)
    : config(config)
    , dispatcher(config, gameState, audio)
    , trackingBridge(gameState)
    , trackingSession(executor,
                      [this](const AnchorUpdate& update) { handleAnchorUpdate(update); },
                      [this]() { trackingBridge.onTrackingStarted(); },
                      [this]() { trackingBridge.onTrackingStopped(); })
{
    createSystems();
    reset();
}

GameSimulator::~GameSimulator() {
    trackingSession.stop();
}

void GameSimulator::createSystems() {
    gravitySystem = std::make_unique<Systems::GravitySystem>(config);
    movementSystem = std::make_unique<Systems::MovementSystem>(config);
    contactSystem = std::make_unique<Systems::ContactSystem>(config);
    boundarySystem = std::make_unique<Systems::BoundarySystem>(config);

    setSystemConfig(sysConfig);
}

void GameSimulator::setSystemConfig(const SystemConfig& cfg) {
    sysConfig = cfg;
    if (sysConfig.Substeps < 1) {
        std::cerr << "[GameSimulator] Warning: Substeps " << sysConfig.Substeps
                  << " < 1, using 1" << std::endl;
        sysConfig.Substeps = 1;
    }
    Profiling::Profiler::setFrameBudget(sysConfig.SecondsPerTick);

    gravitySystem->setSystemConfig(sysConfig);
    movementSystem->setSystemConfig(sysConfig);
    contactSystem->setSystemConfig(sysConfig);
    boundarySystem->setSystemConfig(sysConfig);
}

void GameSimulator::reset() {
    registry.clear();
    contactSystem->takeReports();
    scene = Entities::EntityFactory::createScene(registry, config);
    gameState.resetGame();
    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[GameSimulator] scene reset\n");
}

void GameSimulator::newGame() {
    Systems::resetBall(registry, scene.ball, config.getBallStartPosition());
    gameState.resetGame();
    gameState.startGame();
}

void GameSimulator::tick() {
    PROFILE_SCOPE("GameSimulator::tick");

    executor.drain();

    if (gameState.isGameActive()) {
        stepPhysics();
    }

    boundarySystem->update(registry);
    ++frameCount;
}

void GameSimulator::stepPhysics() {
    for (int step = 0; step < sysConfig.Substeps; ++step) {
        gravitySystem->update(registry);
        movementSystem->update(registry);
        contactSystem->update(registry);

        for (const auto& report : contactSystem->takeReports()) {
            dispatcher.dispatch(registry, report);
        }

        // A ground contact ends the rally mid-frame
        if (!gameState.isGameActive()) {
            break;
        }
    }
}

void GameSimulator::handleCollision(entt::entity a, entt::entity b) {
    if (!registry.valid(a) || !registry.valid(b)) {
        return;
    }
    if (auto report = Systems::makeCollisionReport(registry, a, b)) {
        dispatcher.dispatch(registry, *report);
    }
}

void GameSimulator::postCollision(entt::entity a, entt::entity b) {
    executor.post([this, a, b]() { handleCollision(a, b); });
}

void GameSimulator::handleAnchorUpdate(const AnchorUpdate& update) {
    trackingBridge.onAnchorUpdate(update);

    if (update.event != AnchorEvent::Removed && registry.valid(scene.racket)) {
        RacketTracker::updatePose(registry, scene.racket, update.wristPosition, update.timeSeconds);
    }
}

bool GameSimulator::startTracking(IHandTrackingProvider& provider) {
    return trackingSession.start(provider);
}

void GameSimulator::stopTracking() {
    trackingSession.stop();
}

std::size_t GameSimulator::getBoundaryRecoveries() const {
    return boundarySystem->getRecoveryCount();
}
