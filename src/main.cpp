/**
 * @file main.cpp
 * @brief Headless demo: a scripted player rallies against the wall.
 *
 * Hand poses are fed through a QueuedTrackingProvider exactly as a platform
 * provider would deliver them, including one tracking dropout that pauses
 * the rally. Audio cues are written to stdout.
 */

#include <chrono>
#include <cstdint>
#include <iostream>
#include <thread>

#include "pingpong/audio/logging_audio_cues.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/constants.hpp"
#include "pingpong/core/game_config.hpp"
#include "pingpong/core/profile.hpp"
#include "pingpong/core/session_manager.hpp"
#include "pingpong/tracking/hand_tracking_provider.hpp"

namespace {

const std::uint64_t MaxFrames = 2400;
const int MaxRallies = 3;
const std::uint64_t TrackingLossFrame = 150;
const std::uint64_t TrackingRestoreFrame = 240;
const std::uint64_t GameOverHoldFrames = 60;

// Racket swing imparted at contact: up and toward the wall
const Vector SwingVelocity(0.0, 5.0, -3.0);
const double SwingDuration = 0.02;

// Waits until the tracking task has handed `count` updates to the executor
void waitForDelivery(SerialExecutor& executor, std::size_t count) {
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(50);
    while (executor.pending() < count && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

// Pushes the hand poses for one frame and returns how many were pushed
std::size_t playFrame(QueuedTrackingProvider& hand, const GameSimulator& sim, double now) {
    const auto& registry = sim.getRegistry();
    const auto& ball = sim.getScene().ball;
    const auto& pos = registry.get<Components::Position>(ball);
    const auto& vel = registry.get<Components::Velocity>(ball);

    double const tableTop = sim.getConfig().getTablePosition().y
                            + sim.getConfig().getTableSize().y / 2;
    bool const inReach = vel.y < 0.0 && pos.y > tableTop + 0.05 && pos.y < tableTop + 0.35;

    if (!inReach) {
        hand.push({AnchorEvent::Updated, GameConstants::RacketRestPosition, now});
        return 1;
    }

    // Wind up behind the ball, then meet it
    Position const windup = pos + SwingVelocity * -SwingDuration;
    hand.push({AnchorEvent::Updated, windup, now - SwingDuration});
    hand.push({AnchorEvent::Updated, pos, now});
    return 2;
}

// Plays the scripted rallies; the profiled section closes on return
void runDemo() {
    PROFILE_SCOPE("demo");

    GameConfig const config;
    LoggingAudioCues audio(std::cout);
    QueuedTrackingProvider hand;
    SessionManager session(config, audio);

    session.init(hand);
    GameSimulator& sim = session.getSimulator();
    double const dt = 1.0 / GameConstants::StepsPerSecond;

    hand.push({AnchorEvent::Added, GameConstants::RacketRestPosition, 0.0});
    waitForDelivery(sim.getExecutor(), 1);

    int rallies = 1;
    unsigned int bestScore = 0;
    std::uint64_t gameOverFrames = 0;

    for (std::uint64_t frame = 1; frame < MaxFrames; ++frame) {
        double const now = static_cast<double>(frame) * dt;

        std::size_t pushed = 0;
        if (frame == TrackingLossFrame) {
            pushed = hand.push({AnchorEvent::Removed, Position(), now}) ? 1 : 0;
        } else if (frame < TrackingLossFrame || frame >= TrackingRestoreFrame) {
            pushed = playFrame(hand, sim, now);
        }
        waitForDelivery(sim.getExecutor(), pushed);

        session.tick();

        const auto& game = sim.getGameState();
        if (game.getScore() > bestScore) {
            bestScore = game.getScore();
        }

        if (game.getState() == GameState::GameOver) {
            if (++gameOverFrames >= GameOverHoldFrames) {
                if (rallies >= MaxRallies) {
                    break;
                }
                ++rallies;
                gameOverFrames = 0;
                session.restart();
            }
        }
    }

    session.shutdown();

    std::cout << "\nRallies played: " << rallies
              << "\nBest score: " << bestScore
              << "\nFrames: " << sim.getFrameCount()
              << "\nBoundary recoveries: " << sim.getBoundaryRecoveries()
              << "\nAudio cues: " << audio.getCueCount() << std::endl;
}

} // namespace

int main() {
    runDemo();
    Profiling::Profiler::printStats();
    return 0;
}
