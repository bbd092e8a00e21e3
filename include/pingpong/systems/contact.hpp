/**
 * @file contact.hpp
 * @brief Narrow-phase contact detection between balls and box colliders
 *
 * This system handles:
 * - Sphere-vs-box overlap tests of every ball against every box collider
 * - Remembering which colliders each ball currently touches
 * - Emitting a CollisionReport only when a contact begins
 *
 * Required components:
 * - Ball: Body, Position, Radius, Contacts
 * - Collider: Body, Position, BoxExtents
 *
 * The system never changes velocities; responses are the dispatcher's job.
 */

#ifndef PINGPONG_CONTACT_SYSTEM_HPP
#define PINGPONG_CONTACT_SYSTEM_HPP

#include <vector>
#include <entt/entt.hpp>
#include "pingpong/systems/collision_report.hpp"
#include "pingpong/systems/i_system.hpp"

namespace Systems {

/**
 * @brief True if a sphere overlaps an axis-aligned box
 *
 * @param center Sphere centre
 * @param radius Sphere radius
 * @param boxCenter Box centre
 * @param halfSize Box half extents
 */
bool sphereIntersectsBox(const Position& center, double radius,
                         const Position& boxCenter, const Vector& halfSize);

class ContactSystem : public ISystem {
public:
    explicit ContactSystem(const GameConfig& config);

    ~ContactSystem() override = default;

    /**
     * @brief Detects contacts and queues a report for each new one
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Hands over the onsets detected since the last call
     */
    std::vector<CollisionReport> takeReports();

private:
    std::vector<CollisionReport> pendingReports;
};

} // namespace Systems

#endif // PINGPONG_CONTACT_SYSTEM_HPP
