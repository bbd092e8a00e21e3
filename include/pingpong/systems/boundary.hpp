/**
 * @file boundary.hpp
 * @brief System for recovering balls that leave the play area
 *
 * This system handles:
 * - Checking if balls are outside the play-area box
 * - Returning them to the canonical start pose with zero velocity
 * - Clamping ball speed to the configured maximum
 *
 * Required components:
 * - Body (kind Ball)
 * - Position (to read/modify)
 *
 * Optional components:
 * - Velocity, AngularVelocity (zeroed on recovery)
 *
 * Runs once per frame. Both corrections are idempotent, so a skipped or
 * repeated frame never changes the outcome for an in-bounds ball.
 */

#ifndef PINGPONG_BOUNDARY_SYSTEM_HPP
#define PINGPONG_BOUNDARY_SYSTEM_HPP

#include <cstddef>
#include <entt/entt.hpp>
#include "pingpong/components/basic.hpp"
#include "pingpong/systems/i_system.hpp"

namespace Systems {

/**
 * @brief True if any coordinate of position lies outside bounds
 */
bool isOutOfBounds(const Position& position, const PlayAreaBounds& bounds);

/**
 * @brief Moves a ball to position and stops all its motion
 *
 * Missing velocity components are tolerated; only the position is set then.
 */
void resetBall(entt::registry& registry, entt::entity ball, const Position& position);

/**
 * @brief Returns an out-of-bounds ball to the start pose
 *
 * @return true if the ball was repositioned, false if it was in bounds
 *         or has no Position
 */
bool repositionIfOutOfBounds(entt::registry& registry, entt::entity ball,
                             const GameConfig& config);

/**
 * @struct BoundaryConfig
 * @brief Configuration parameters specific to the boundary system
 */
struct BoundaryConfig {
    // Apply the max-speed clamp every frame in addition to recovery
    bool clampSpeed = true;
};

/**
 * @class BoundarySystem
 * @brief Per-frame boundary recovery and speed clamp for balls
 */
class BoundarySystem : public ConfigurableSystem<BoundaryConfig> {
public:
    explicit BoundarySystem(const GameConfig& config);

    ~BoundarySystem() override = default;

    /**
     * @brief Checks and corrects every ball
     * @param registry EnTT registry containing entities and components
     */
    void update(entt::registry &registry) override;

    /**
     * @brief Number of recoveries performed since construction
     */
    std::size_t getRecoveryCount() const { return recoveryCount; }

private:
    std::size_t recoveryCount = 0;
};

} // namespace Systems

#endif // PINGPONG_BOUNDARY_SYSTEM_HPP
