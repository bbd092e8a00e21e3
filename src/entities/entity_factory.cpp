#include "pingpong/entities/entity_factory.hpp"
#include "pingpong/core/constants.hpp"

namespace Entities {

entt::entity EntityFactory::createTable(entt::registry& registry, const GameConfig& config) {
    auto table = registry.create();
    registry.emplace<Components::Body>(table, Components::BodyKind::Table);
    registry.emplace<Components::Position>(table, config.getTablePosition());
    registry.emplace<Components::BoxExtents>(table, config.getTableSize());
    return table;
}

entt::entity EntityFactory::createWall(entt::registry& registry, const GameConfig& config) {
    auto wall = registry.create();
    registry.emplace<Components::Body>(wall, Components::BodyKind::Wall);
    registry.emplace<Components::Position>(wall, config.getWallPosition());
    registry.emplace<Components::BoxExtents>(wall, config.getWallSize());
    return wall;
}

entt::entity EntityFactory::createGround(entt::registry& registry, const GameConfig& config) {
    auto ground = registry.create();
    registry.emplace<Components::Body>(ground, Components::BodyKind::Ground);
    registry.emplace<Components::Position>(ground, 0.0, config.getGroundLevel(), 0.0);
    registry.emplace<Components::BoxExtents>(ground, Vector(GameConstants::GroundPlaneSize,
                                                            GameConstants::GroundPlaneThickness,
                                                            GameConstants::GroundPlaneSize));
    return ground;
}

entt::entity EntityFactory::createBall(entt::registry& registry, const GameConfig& config) {
    auto ball = registry.create();
    registry.emplace<Components::Body>(ball, Components::BodyKind::Ball);
    registry.emplace<Components::Position>(ball, config.getBallStartPosition());
    registry.emplace<Components::Velocity>(ball, 0.0, 0.0, 0.0);
    registry.emplace<Components::AngularVelocity>(ball);
    registry.emplace<Components::Radius>(ball, config.getBallRadius());
    registry.emplace<Components::Contacts>(ball);
    registry.emplace<Components::Dynamic>(ball);
    return ball;
}

entt::entity EntityFactory::createRacket(entt::registry& registry) {
    return createRacket(registry, GameConstants::RacketRestPosition);
}

entt::entity EntityFactory::createRacket(entt::registry& registry, const Position& position) {
    auto racket = registry.create();
    registry.emplace<Components::Body>(racket, Components::BodyKind::Racket);
    registry.emplace<Components::Position>(racket, position);
    registry.emplace<Components::Velocity>(racket, 0.0, 0.0, 0.0);
    registry.emplace<Components::BoxExtents>(racket, Vector(GameConstants::RacketWidth,
                                                            GameConstants::RacketHeight,
                                                            GameConstants::RacketThickness));
    registry.emplace<Components::PoseSample>(racket);
    return racket;
}

Scene EntityFactory::createScene(entt::registry& registry, const GameConfig& config) {
    Scene scene;
    scene.table = createTable(registry, config);
    scene.wall = createWall(registry, config);
    scene.ground = createGround(registry, config);
    scene.ball = createBall(registry, config);
    scene.racket = createRacket(registry);
    return scene;
}

} // namespace Entities
