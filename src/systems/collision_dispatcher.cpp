#include "pingpong/systems/collision_dispatcher.hpp"
#include "pingpong/algo/collision_response.hpp"
#include "pingpong/core/constants.hpp"
#include "pingpong/core/debug.hpp"
#include "pingpong/core/profile.hpp"

namespace Systems {

CollisionDispatcher::CollisionDispatcher(const GameConfig& config,
                                         GameStateMachine& gameState,
                                         IAudioCues& audio)
    : config(config)
    , gameState(gameState)
    , audio(audio)
{
}

void CollisionDispatcher::dispatch(entt::registry& registry, const CollisionReport& report) {
    PROFILE_SCOPE("CollisionDispatcher");

    if (report.subjectKind != Components::BodyKind::Ball) {
        return;
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[Collision] ball -> "
              << GameConstants::getBodyKindName(report.counterpartKind) << "\n");

    switch (report.counterpartKind) {
        case Components::BodyKind::Table:
            handleTableBounce(registry, report);
            break;
        case Components::BodyKind::Wall:
            handleWallBounce(registry, report);
            break;
        case Components::BodyKind::Racket:
            handleRacketHit(registry, report);
            break;
        case Components::BodyKind::Ground:
            handleGroundContact(registry, report);
            break;
        case Components::BodyKind::Ball:
            break;
    }
}

bool CollisionDispatcher::bounce(entt::registry& registry, entt::entity ball, const Vector& normal) {
    auto* vel = registry.try_get<Components::Velocity>(ball);
    if (!vel) {
        return false;
    }

    Vector const reflected = CollisionResponse::reflect(*vel, normal, config.getRestitution());
    *vel = CollisionResponse::clamp(reflected, config.getMaxBallSpeed());
    return true;
}

void CollisionDispatcher::handleTableBounce(entt::registry& registry, const CollisionReport& report) {
    if (!bounce(registry, report.subject, GameConstants::UpNormal)) {
        return;
    }
    audio.playTableBounce(report.position);
}

void CollisionDispatcher::handleWallBounce(entt::registry& registry, const CollisionReport& report) {
    if (!bounce(registry, report.subject, GameConstants::ForwardNormal)) {
        return;
    }
    audio.playWallBounce(report.position);
}

void CollisionDispatcher::handleRacketHit(entt::registry& registry, const CollisionReport& report) {
    auto* ballVel = registry.try_get<Components::Velocity>(report.subject);
    if (!ballVel) {
        return;
    }

    // A racket without a velocity estimate transfers nothing
    Vector racketVel;
    if (const auto* vel = registry.try_get<Components::Velocity>(report.counterpart)) {
        racketVel = *vel;
    }

    Vector const transferred = CollisionResponse::racketTransfer(
        *ballVel, racketVel, config.getTransferCoefficient());
    *ballVel = CollisionResponse::clamp(transferred, config.getMaxBallSpeed());

    audio.playBallHit(report.position);
    gameState.recordHit();
}

void CollisionDispatcher::handleGroundContact(entt::registry& registry, const CollisionReport& report) {
    if (auto* vel = registry.try_get<Components::Velocity>(report.subject)) {
        *vel = Components::Velocity();
    }
    if (auto* angVel = registry.try_get<Components::AngularVelocity>(report.subject)) {
        angVel->omega = Vector();
    }

    audio.playGameOver();
    gameState.handleGroundCollision();
}

} // namespace Systems
