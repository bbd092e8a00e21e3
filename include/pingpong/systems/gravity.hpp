/**
 * @file gravity.hpp
 * @brief System applying uniform gravity to dynamic bodies
 *
 * Required components:
 * - Dynamic (tag)
 * - Velocity (to modify)
 */

#ifndef PINGPONG_GRAVITY_SYSTEM_HPP
#define PINGPONG_GRAVITY_SYSTEM_HPP

#include <entt/entt.hpp>
#include "pingpong/systems/i_system.hpp"

namespace Systems {

class GravitySystem : public ISystem {
public:
    explicit GravitySystem(const GameConfig& config);

    ~GravitySystem() override = default;

    /**
     * @brief Adds gravity * dt to the velocity of every dynamic body
     */
    void update(entt::registry &registry) override;
};

} // namespace Systems

#endif // PINGPONG_GRAVITY_SYSTEM_HPP
