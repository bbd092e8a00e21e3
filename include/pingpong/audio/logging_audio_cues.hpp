#pragma once

#include <cstddef>
#include <ostream>
#include "pingpong/audio/i_audio_cues.hpp"

/**
 * @brief Audio sink that writes each cue to a stream instead of playing it
 *
 * Used by the headless demo where no spatial audio engine is present.
 */
class LoggingAudioCues : public IAudioCues {
public:
    explicit LoggingAudioCues(std::ostream& out);

    void playTableBounce(const Position& position) override;
    void playWallBounce(const Position& position) override;
    void playBallHit(const Position& position) override;
    void playGameOver() override;

    std::size_t getCueCount() const { return cueCount; }

private:
    void log(const char* cue, const Position& position);

    std::ostream& out;
    std::size_t cueCount = 0;
};
