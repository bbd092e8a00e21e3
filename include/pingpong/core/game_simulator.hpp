/**
 * @file game_simulator.hpp
 * @brief Owns the ECS registry, the physics systems and the game session.
 */

#pragma once

#include <cstdint>
#include <memory>
#include <entt/entt.hpp>

#include "pingpong/audio/i_audio_cues.hpp"
#include "pingpong/core/game_config.hpp"
#include "pingpong/core/game_state_machine.hpp"
#include "pingpong/core/serial_executor.hpp"
#include "pingpong/core/system_config.hpp"
#include "pingpong/entities/entity_factory.hpp"
#include "pingpong/systems/boundary.hpp"
#include "pingpong/systems/collision_dispatcher.hpp"
#include "pingpong/systems/contact.hpp"
#include "pingpong/systems/gravity.hpp"
#include "pingpong/systems/movement.hpp"
#include "pingpong/tracking/hand_tracking_session.hpp"
#include "pingpong/tracking/tracking_bridge.hpp"

/**
 * @class GameSimulator
 * @brief Composition root for one play session.
 *
 * Wires the state machine, collision dispatcher, tracking bridge and physics
 * systems together around a single registry. The GameConfig and the audio
 * sink are borrowed and must outlive the simulator.
 *
 * Threading: every method except postCollision() must be called from one
 * thread, the one that calls tick(). Platform threads hand work over with
 * postCollision() or through the tracking session; both land on the
 * SerialExecutor, which tick() drains first thing each frame.
 */
class GameSimulator {
public:
    GameSimulator(const GameConfig& config, IAudioCues& audio);
    ~GameSimulator();

    GameSimulator(const GameSimulator&) = delete;
    GameSimulator& operator=(const GameSimulator&) = delete;

    /**
     * @brief Rebuilds the scene and returns the session to Idle
     */
    void reset();

    /**
     * @brief Puts the ball back at its start pose and starts a fresh rally
     */
    void newGame();

    /**
     * @brief Advances one frame
     *
     * Runs queued platform work, then steps physics while Playing (gravity,
     * movement and contact detection per substep, dispatching each onset),
     * then applies the boundary check whatever the state.
     */
    void tick();

    /**
     * @brief Handles a contact onset between two entities
     *
     * Pairs without a ball and stale entities are ignored.
     */
    void handleCollision(entt::entity a, entt::entity b);

    /**
     * @brief Queues handleCollision() for the next frame; safe from any thread
     */
    void postCollision(entt::entity a, entt::entity b);

    /**
     * @brief Applies one hand-tracking update: availability and racket pose
     */
    void handleAnchorUpdate(const AnchorUpdate& update);

    bool startTracking(IHandTrackingProvider& provider);
    void stopTracking();

    void setSystemConfig(const SystemConfig& cfg);

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }
    const Entities::Scene& getScene() const { return scene; }
    GameStateMachine& getGameState() { return gameState; }
    const GameStateMachine& getGameState() const { return gameState; }
    const TrackingAvailabilityBridge& getTrackingBridge() const { return trackingBridge; }
    const HandTrackingSession& getTrackingSession() const { return trackingSession; }
    SerialExecutor& getExecutor() { return executor; }
    const GameConfig& getConfig() const { return config; }
    std::uint64_t getFrameCount() const { return frameCount; }
    std::size_t getBoundaryRecoveries() const;

private:
    void createSystems();
    void stepPhysics();

    const GameConfig& config;
    entt::registry registry;
    Entities::Scene scene;

    SystemConfig sysConfig;
    std::unique_ptr<Systems::GravitySystem> gravitySystem;
    std::unique_ptr<Systems::MovementSystem> movementSystem;
    std::unique_ptr<Systems::ContactSystem> contactSystem;
    std::unique_ptr<Systems::BoundarySystem> boundarySystem;

    GameStateMachine gameState;
    SerialExecutor executor;
    Systems::CollisionDispatcher dispatcher;
    TrackingAvailabilityBridge trackingBridge;
    // Declared last so the consumer task is joined before anything it reaches
    HandTrackingSession trackingSession;

    std::uint64_t frameCount = 0;
};
