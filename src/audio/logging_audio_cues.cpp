#include "pingpong/audio/logging_audio_cues.hpp"

#include <iomanip>

LoggingAudioCues::LoggingAudioCues(std::ostream& out) : out(out) {}

void LoggingAudioCues::playTableBounce(const Position& position) {
    log("table-bounce", position);
}

void LoggingAudioCues::playWallBounce(const Position& position) {
    log("wall-bounce", position);
}

void LoggingAudioCues::playBallHit(const Position& position) {
    log("ball-hit", position);
}

void LoggingAudioCues::playGameOver() {
    ++cueCount;
    out << "[Audio] game-over\n";
}

void LoggingAudioCues::log(const char* cue, const Position& position) {
    ++cueCount;
    out << "[Audio] " << cue << " at ("
        << std::fixed << std::setprecision(2)
        << position.x << ", " << position.y << ", " << position.z << ")\n";
}
