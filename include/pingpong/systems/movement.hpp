/**
 * @file movement.hpp
 * @brief System for updating positions based on velocity
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 *
 * Static bodies (table, wall, ground) carry no Velocity and are skipped.
 */

#ifndef PINGPONG_MOVEMENT_SYSTEM_HPP
#define PINGPONG_MOVEMENT_SYSTEM_HPP

#include <entt/entt.hpp>
#include "pingpong/systems/i_system.hpp"

namespace Systems {

class MovementSystem : public ISystem {
public:
    explicit MovementSystem(const GameConfig& config);

    ~MovementSystem() override = default;

    /**
     * @brief Advances dynamic bodies by one substep
     *
     * Kinematic bodies (the racket) are posed by tracking and never
     * integrated here.
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif // PINGPONG_MOVEMENT_SYSTEM_HPP
