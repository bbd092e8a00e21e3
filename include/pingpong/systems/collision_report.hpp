/**
 * @file collision_report.hpp
 * @brief Transient description of one ball contact onset
 */

#ifndef PINGPONG_COLLISION_REPORT_HPP
#define PINGPONG_COLLISION_REPORT_HPP

#include <optional>
#include <entt/entt.hpp>
#include "pingpong/components/basic.hpp"

namespace Systems {

/**
 * @struct CollisionReport
 * @brief Produced by the physics backend once per contact onset, consumed once
 *
 * subject is always the ball; counterpart is what it touched.
 */
struct CollisionReport {
    entt::entity subject = entt::null;
    entt::entity counterpart = entt::null;
    Components::BodyKind subjectKind = Components::BodyKind::Ball;
    Components::BodyKind counterpartKind = Components::BodyKind::Ball;
    Position position;         ///< Ball position at onset
    Vector incomingVelocity;   ///< Ball velocity at onset
};

/**
 * @brief Builds a report from an unordered entity pair
 *
 * The pair is ordered so that the ball is the subject. Returns nothing
 * when neither entity is a ball or either lacks a Body.
 */
std::optional<CollisionReport> makeCollisionReport(const entt::registry& registry,
                                                   entt::entity a, entt::entity b);

} // namespace Systems

#endif // PINGPONG_COLLISION_REPORT_HPP
