#include "pingpong/systems/boundary.hpp"
#include "pingpong/algo/collision_response.hpp"
#include "pingpong/core/debug.hpp"
#include "pingpong/core/profile.hpp"

namespace Systems {

bool isOutOfBounds(const Position& position, const PlayAreaBounds& bounds) {
    return position.x < bounds.min.x || position.x > bounds.max.x ||
           position.y < bounds.min.y || position.y > bounds.max.y ||
           position.z < bounds.min.z || position.z > bounds.max.z;
}

void resetBall(entt::registry& registry, entt::entity ball, const Position& position) {
    if (auto* pos = registry.try_get<Components::Position>(ball)) {
        *pos = position;
    }
    if (auto* vel = registry.try_get<Components::Velocity>(ball)) {
        *vel = Components::Velocity();
    }
    if (auto* angVel = registry.try_get<Components::AngularVelocity>(ball)) {
        angVel->omega = Vector();
    }
    // Contacts from the old pose no longer apply
    if (auto* contacts = registry.try_get<Components::Contacts>(ball)) {
        contacts->touching.clear();
    }
}

bool repositionIfOutOfBounds(entt::registry& registry, entt::entity ball,
                             const GameConfig& config) {
    const auto* pos = registry.try_get<Components::Position>(ball);
    if (!pos || !isOutOfBounds(*pos, config.getPlayAreaBounds())) {
        return false;
    }

    DEBUG_MSG(DEBUG_LEVEL_BASIC, "[Boundary] ball out of bounds at ("
              << pos->x << ", " << pos->y << ", " << pos->z << "), resetting\n");
    resetBall(registry, ball, config.getBallStartPosition());
    return true;
}

BoundarySystem::BoundarySystem(const GameConfig& config)
    : ConfigurableSystem<BoundaryConfig>(config) {
}

void BoundarySystem::update(entt::registry &registry) {
    PROFILE_SCOPE("BoundarySystem");

    auto view = registry.view<Components::Body, Components::Position>();
    for (auto entity : view) {
        if (view.get<Components::Body>(entity).kind != Components::BodyKind::Ball) {
            continue;
        }

        if (repositionIfOutOfBounds(registry, entity, gameConfig)) {
            ++recoveryCount;
            continue;
        }

        if (specificConfig.clampSpeed) {
            if (auto* vel = registry.try_get<Components::Velocity>(entity)) {
                *vel = CollisionResponse::clamp(*vel, gameConfig.getMaxBallSpeed());
            }
        }
    }
}

} // namespace Systems
