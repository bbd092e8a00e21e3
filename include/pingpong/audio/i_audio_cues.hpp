/**
 * @file i_audio_cues.hpp
 * @brief Fire-and-forget sound cues triggered by collisions
 */

#ifndef PINGPONG_I_AUDIO_CUES_HPP
#define PINGPONG_I_AUDIO_CUES_HPP

#include "pingpong/math/vector_math.hpp"

/**
 * @class IAudioCues
 * @brief Audio subsystem seen from the collision dispatcher
 *
 * Implementations own their resources and must return promptly; the
 * dispatcher calls them on the game-state thread and ignores the outcome.
 */
class IAudioCues {
public:
    virtual ~IAudioCues() = default;

    virtual void playTableBounce(const Position& position) = 0;
    virtual void playWallBounce(const Position& position) = 0;
    virtual void playBallHit(const Position& position) = 0;
    virtual void playGameOver() = 0;
};

#endif // PINGPONG_I_AUDIO_CUES_HPP
