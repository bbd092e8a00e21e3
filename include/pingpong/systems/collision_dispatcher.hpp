/**
 * @file collision_dispatcher.hpp
 * @brief Routes ball contact onsets to velocity responses and game events
 *
 * For each CollisionReport, keyed on what the ball touched:
 * - Table:  reflect about +Y, clamp, table-bounce cue
 * - Wall:   reflect about +Z, clamp, wall-bounce cue
 * - Racket: add racket velocity share, clamp, ball-hit cue, recordHit()
 * - Ground: stop the ball, game-over cue, handleGroundCollision()
 * - Ball:   ignored
 *
 * The ball's velocity is always written back before the cue or scoring
 * call that depends on it.
 */

#ifndef PINGPONG_COLLISION_DISPATCHER_HPP
#define PINGPONG_COLLISION_DISPATCHER_HPP

#include <entt/entt.hpp>
#include "pingpong/audio/i_audio_cues.hpp"
#include "pingpong/core/game_config.hpp"
#include "pingpong/core/game_state_machine.hpp"
#include "pingpong/systems/collision_report.hpp"

namespace Systems {

/**
 * @class CollisionDispatcher
 * @brief Applies the response for one collision report
 *
 * Holds non-owning references to the config, the state machine and the
 * audio sink. Must be called from the game-state thread.
 */
class CollisionDispatcher {
public:
    CollisionDispatcher(const GameConfig& config, GameStateMachine& gameState, IAudioCues& audio);

    /**
     * @brief Handles one contact onset
     * @param registry Registry holding the ball's kinematic components
     * @param report Contact onset; subject must be the ball
     */
    void dispatch(entt::registry& registry, const CollisionReport& report);

private:
    void handleTableBounce(entt::registry& registry, const CollisionReport& report);
    void handleWallBounce(entt::registry& registry, const CollisionReport& report);
    void handleRacketHit(entt::registry& registry, const CollisionReport& report);
    void handleGroundContact(entt::registry& registry, const CollisionReport& report);

    /**
     * @brief Reflects and clamps the ball's velocity in place
     * @return false if the ball has no Velocity
     */
    bool bounce(entt::registry& registry, entt::entity ball, const Vector& normal);

    const GameConfig& config;
    GameStateMachine& gameState;
    IAudioCues& audio;
};

} // namespace Systems

#endif // PINGPONG_COLLISION_DISPATCHER_HPP
