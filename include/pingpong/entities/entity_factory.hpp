#pragma once

#include <entt/entt.hpp>
#include "pingpong/components/basic.hpp"
#include "pingpong/core/game_config.hpp"

namespace Entities {

/**
 * Handles to the bodies that make up one table scene.
 */
struct Scene {
    entt::entity table = entt::null;
    entt::entity wall = entt::null;
    entt::entity ground = entt::null;
    entt::entity ball = entt::null;
    entt::entity racket = entt::null;
};

/**
 * Factory for the bodies of a table-tennis scene.
 * Sizes and positions come from the GameConfig; only colliders and
 * kinematic state are created, no render data.
 */
class EntityFactory {
public:
    static entt::entity createTable(entt::registry& registry, const GameConfig& config);
    static entt::entity createWall(entt::registry& registry, const GameConfig& config);

    /**
     * Creates a thin, wide box at ground level. Any ball touching it ends
     * the rally.
     */
    static entt::entity createGround(entt::registry& registry, const GameConfig& config);

    /**
     * Creates the ball at the config's start pose, at rest.
     */
    static entt::entity createBall(entt::registry& registry, const GameConfig& config);

    /**
     * Creates the racket at its rest pose. The racket is kinematic: it is
     * posed by hand tracking, never by gravity or integration.
     */
    static entt::entity createRacket(entt::registry& registry);
    static entt::entity createRacket(entt::registry& registry, const Position& position);

    /**
     * Creates every body of the scene.
     */
    static Scene createScene(entt::registry& registry, const GameConfig& config);
};

} // namespace Entities
