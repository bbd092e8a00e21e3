#include "pingpong/systems/collision_report.hpp"

#include <utility>

namespace Systems {

std::optional<CollisionReport> makeCollisionReport(const entt::registry& registry,
                                                   entt::entity a, entt::entity b) {
    const auto* bodyA = registry.try_get<Components::Body>(a);
    const auto* bodyB = registry.try_get<Components::Body>(b);
    if (!bodyA || !bodyB) {
        return std::nullopt;
    }

    if (bodyA->kind != Components::BodyKind::Ball) {
        if (bodyB->kind != Components::BodyKind::Ball) {
            return std::nullopt;
        }
        std::swap(a, b);
        std::swap(bodyA, bodyB);
    }

    CollisionReport report;
    report.subject = a;
    report.counterpart = b;
    report.subjectKind = bodyA->kind;
    report.counterpartKind = bodyB->kind;
    if (const auto* pos = registry.try_get<Components::Position>(a)) {
        report.position = *pos;
    }
    if (const auto* vel = registry.try_get<Components::Velocity>(a)) {
        report.incomingVelocity = *vel;
    }
    return report;
}

} // namespace Systems
