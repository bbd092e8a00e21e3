#include "pingpong/tracking/racket_tracker.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/constants.hpp"

namespace RacketTracker {

void updatePose(entt::registry& registry, entt::entity racket,
                const Position& position, double timeSeconds) {
    auto* pos = registry.try_get<Components::Position>(racket);
    auto* sample = registry.try_get<Components::PoseSample>(racket);
    if (!pos || !sample) {
        return;
    }

    Vector velocity;
    double const dt = timeSeconds - sample->timeSeconds;
    if (sample->valid && dt > GameConstants::MinPoseInterval) {
        velocity = (Vector(position) - Vector(sample->position)) / dt;
    }

    *pos = position;
    sample->position = position;
    sample->timeSeconds = timeSeconds;
    sample->valid = true;

    if (auto* vel = registry.try_get<Components::Velocity>(racket)) {
        *vel = velocity;
    }
}

} // namespace RacketTracker
