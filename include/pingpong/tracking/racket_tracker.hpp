#pragma once

#include <entt/entt.hpp>
#include "pingpong/math/vector_math.hpp"

/**
 * @brief Poses the racket from hand-tracking samples
 *
 * The racket's Velocity is estimated from consecutive samples as
 * displacement / elapsed time. Intervals shorter than
 * GameConstants::MinPoseInterval (and the first sample) give zero velocity.
 *
 * Requires Position, Velocity and PoseSample on the racket entity.
 */
namespace RacketTracker {

void updatePose(entt::registry& registry, entt::entity racket,
                const Position& position, double timeSeconds);

} // namespace RacketTracker
