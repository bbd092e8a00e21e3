#include "pingpong/systems/contact.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/profile.hpp"

#include <algorithm>
#include <utility>

namespace Systems {

bool sphereIntersectsBox(const Position& center, double radius,
                         const Position& boxCenter, const Vector& halfSize) {
    // Closest point on the box to the sphere centre
    double const cx = std::clamp(center.x, boxCenter.x - halfSize.x, boxCenter.x + halfSize.x);
    double const cy = std::clamp(center.y, boxCenter.y - halfSize.y, boxCenter.y + halfSize.y);
    double const cz = std::clamp(center.z, boxCenter.z - halfSize.z, boxCenter.z + halfSize.z);

    double const dx = center.x - cx;
    double const dy = center.y - cy;
    double const dz = center.z - cz;
    return dx * dx + dy * dy + dz * dz <= radius * radius;
}

ContactSystem::ContactSystem(const GameConfig& config) : ISystem(config) {}

void ContactSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("ContactSystem");

    auto balls = registry.view<Components::Body, Components::Position,
                               Components::Radius, Components::Contacts>();
    auto colliders = registry.view<Components::Body, Components::Position,
                                   Components::BoxExtents>();

    for (auto ball : balls) {
        if (balls.get<Components::Body>(ball).kind != Components::BodyKind::Ball) {
            continue;
        }
        const auto& ballPos = balls.get<Components::Position>(ball);
        double const radius = balls.get<Components::Radius>(ball).value;
        auto& contacts = balls.get<Components::Contacts>(ball);

        std::vector<entt::entity> touching;
        for (auto &&[other, body, pos, box] : colliders.each()) {
            if (other == ball || !sphereIntersectsBox(ballPos, radius, pos, box.halfSize)) {
                continue;
            }
            touching.push_back(other);

            bool const wasTouching = std::find(contacts.touching.begin(),
                                               contacts.touching.end(),
                                               other) != contacts.touching.end();
            if (wasTouching) {
                continue;
            }
            if (auto report = makeCollisionReport(registry, ball, other)) {
                pendingReports.push_back(*report);
            }
        }
        contacts.touching = std::move(touching);
    }
}

std::vector<CollisionReport> ContactSystem::takeReports() {
    std::vector<CollisionReport> out;
    out.swap(pendingReports);
    return out;
}

} // namespace Systems
