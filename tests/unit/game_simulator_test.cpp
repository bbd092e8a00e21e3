#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "pingpong/core/game_simulator.hpp"
#include "pingpong/core/session_manager.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/constants.hpp"

namespace {

class CountingAudio : public IAudioCues {
public:
    void playTableBounce(const Position&) override { ++tableBounces; }
    void playWallBounce(const Position&) override { ++wallBounces; }
    void playBallHit(const Position&) override { ++hits; }
    void playGameOver() override { ++gameOvers; }

    int tableBounces = 0;
    int wallBounces = 0;
    int hits = 0;
    int gameOvers = 0;
};

AnchorUpdate makeUpdate(AnchorEvent event, const Position& wrist, double t) {
    AnchorUpdate update;
    update.event = event;
    update.wristPosition = wrist;
    update.timeSeconds = t;
    return update;
}

} // namespace

class GameSimulatorTest : public ::testing::Test {
protected:
    GameConfig config;
    CountingAudio audio;
    GameSimulator sim{config, audio};

    Position& ballPosition() {
        return sim.getRegistry().get<Components::Position>(sim.getScene().ball);
    }

    Vector& ballVelocity() {
        return sim.getRegistry().get<Components::Velocity>(sim.getScene().ball);
    }

    // Ticks until pred() holds or maxFrames have run
    template<typename Pred>
    bool tickUntil(Pred pred, int maxFrames) {
        for (int i = 0; i < maxFrames; ++i) {
            sim.tick();
            if (pred()) {
                return true;
            }
        }
        return false;
    }
};

TEST_F(GameSimulatorTest, StartsIdleWithBallAtStart) {
    EXPECT_EQ(sim.getGameState().getState(), GameState::Idle);
    EXPECT_EQ(ballPosition(), config.getBallStartPosition());
    EXPECT_TRUE(sim.getRegistry().valid(sim.getScene().table));
    EXPECT_TRUE(sim.getRegistry().valid(sim.getScene().racket));
}

TEST_F(GameSimulatorTest, PhysicsFrozenUntilGameStarts) {
    for (int i = 0; i < 10; ++i) {
        sim.tick();
    }
    EXPECT_EQ(ballPosition(), config.getBallStartPosition());
    EXPECT_EQ(sim.getFrameCount(), 10u);
}

TEST_F(GameSimulatorTest, DroppedBallBouncesOffTable) {
    sim.newGame();
    ASSERT_EQ(sim.getGameState().getState(), GameState::Playing);

    ASSERT_TRUE(tickUntil([this]() { return audio.tableBounces > 0; }, 120));
    EXPECT_GT(ballVelocity().y, 0.0);
    EXPECT_EQ(sim.getGameState().getState(), GameState::Playing);
    EXPECT_EQ(audio.gameOvers, 0);
}

TEST_F(GameSimulatorTest, BallOnGroundEndsRally) {
    sim.newGame();
    sim.getGameState().recordHit();
    ballPosition() = Position(2.5, 0.5, -1.5);

    ASSERT_TRUE(tickUntil([this]() {
        return sim.getGameState().getState() == GameState::GameOver;
    }, 120));

    EXPECT_EQ(audio.gameOvers, 1);
    EXPECT_EQ(sim.getGameState().getScore(), 1u);
    EXPECT_EQ(sim.getGameState().getConsecutiveHits(), 0u);
    EXPECT_TRUE(ballVelocity().isZero());

    // Frozen after the rally ends
    Position const resting = ballPosition();
    sim.tick();
    EXPECT_EQ(ballPosition(), resting);
}

TEST_F(GameSimulatorTest, NewGameAfterGameOverResetsBallAndScore) {
    sim.newGame();
    sim.getGameState().recordHit();
    sim.handleCollision(sim.getScene().ball, sim.getScene().ground);
    ASSERT_EQ(sim.getGameState().getState(), GameState::GameOver);

    sim.newGame();
    EXPECT_EQ(sim.getGameState().getState(), GameState::Playing);
    EXPECT_EQ(sim.getGameState().getScore(), 0u);
    EXPECT_EQ(ballPosition(), config.getBallStartPosition());
}

TEST_F(GameSimulatorTest, RacketCollisionScores) {
    sim.newGame();
    sim.getRegistry().get<Components::Velocity>(sim.getScene().racket) = Vector(0.0, 5.0, -5.0);

    // Argument order does not matter
    sim.handleCollision(sim.getScene().racket, sim.getScene().ball);

    EXPECT_EQ(sim.getGameState().getScore(), 1u);
    EXPECT_EQ(audio.hits, 1);
    EXPECT_DOUBLE_EQ(ballVelocity().y, 4.0);
}

TEST_F(GameSimulatorTest, StaleCollisionIsIgnored) {
    sim.newGame();
    auto gone = sim.getRegistry().create();
    sim.getRegistry().destroy(gone);

    sim.handleCollision(sim.getScene().ball, gone);
    sim.handleCollision(sim.getScene().table, sim.getScene().wall);
    EXPECT_EQ(audio.tableBounces + audio.wallBounces + audio.hits + audio.gameOvers, 0);
}

TEST_F(GameSimulatorTest, PostedCollisionAppliedOnNextTick) {
    sim.newGame();
    sim.postCollision(sim.getScene().ball, sim.getScene().ground);
    EXPECT_EQ(sim.getGameState().getState(), GameState::Playing);

    sim.tick();
    EXPECT_EQ(sim.getGameState().getState(), GameState::GameOver);
}

TEST_F(GameSimulatorTest, TrackingLossPausesAndFreezesBall) {
    sim.newGame();
    sim.handleAnchorUpdate(makeUpdate(AnchorEvent::Added, Position(0.2, 1.1, -0.5), 0.0));
    sim.tick();

    sim.handleAnchorUpdate(makeUpdate(AnchorEvent::Removed, Position(), 0.1));
    EXPECT_EQ(sim.getGameState().getState(), GameState::Paused);
    EXPECT_TRUE(sim.getTrackingBridge().isTrackingLost());

    Position const frozen = ballPosition();
    sim.tick();
    sim.tick();
    EXPECT_EQ(ballPosition(), frozen);

    sim.handleAnchorUpdate(makeUpdate(AnchorEvent::Updated, Position(0.2, 1.1, -0.5), 0.2));
    EXPECT_EQ(sim.getGameState().getState(), GameState::Playing);
    sim.tick();
    EXPECT_NE(ballPosition(), frozen);
}

TEST_F(GameSimulatorTest, AnchorUpdatesPoseRacket) {
    sim.handleAnchorUpdate(makeUpdate(AnchorEvent::Added, Position(0.0, 1.0, -0.5), 1.0));
    sim.handleAnchorUpdate(makeUpdate(AnchorEvent::Updated, Position(0.0, 1.5, -0.5), 1.5));

    const auto& registry = sim.getRegistry();
    EXPECT_EQ(registry.get<Components::Position>(sim.getScene().racket), Position(0.0, 1.5, -0.5));
    EXPECT_NEAR(registry.get<Components::Velocity>(sim.getScene().racket).y, 1.0, 1e-9);
}

TEST_F(GameSimulatorTest, OutOfBoundsBallRecoveredEvenWhilePaused) {
    sim.newGame();
    sim.getGameState().pauseGame();
    ballPosition() = Position(0.0, 50.0, -1.5);

    sim.tick();
    EXPECT_EQ(ballPosition(), config.getBallStartPosition());
    EXPECT_EQ(sim.getBoundaryRecoveries(), 1u);
    EXPECT_EQ(sim.getGameState().getState(), GameState::Paused);
}

TEST_F(GameSimulatorTest, InvalidSubstepsFallBackToOne) {
    SystemConfig cfg;
    cfg.Substeps = 0;
    sim.setSystemConfig(cfg);
    sim.newGame();

    sim.tick();
    EXPECT_LT(ballPosition().y, config.getBallStartPosition().y);
}

TEST_F(GameSimulatorTest, TrackingSessionDrivesPause) {
    QueuedTrackingProvider provider;
    ASSERT_TRUE(sim.startTracking(provider));
    sim.newGame();

    provider.push(makeUpdate(AnchorEvent::Added, Position(0.0, 1.0, -0.5), 0.0));
    provider.push(makeUpdate(AnchorEvent::Removed, Position(), 0.1));

    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (sim.getExecutor().pending() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    sim.tick();
    EXPECT_EQ(sim.getGameState().getState(), GameState::Paused);

    sim.stopTracking();
    EXPECT_FALSE(sim.getTrackingSession().isRunning());
    EXPECT_FALSE(sim.getTrackingBridge().isTrackingActive());
}

TEST_F(GameSimulatorTest, RemovalBeforeFirstPosePauses) {
    QueuedTrackingProvider provider;
    ASSERT_TRUE(sim.startTracking(provider));
    EXPECT_TRUE(sim.getTrackingBridge().isTrackingActive());
    sim.newGame();

    provider.push(makeUpdate(AnchorEvent::Removed, Position(), 0.0));

    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (sim.getExecutor().pending() < 1 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    sim.tick();
    EXPECT_EQ(sim.getGameState().getState(), GameState::Paused);
    EXPECT_TRUE(sim.getTrackingBridge().isTrackingLost());
    EXPECT_FALSE(sim.getTrackingBridge().isTrackingActive());

    sim.stopTracking();
}

TEST(SessionManagerTest, RunsWithoutTracking) {
    GameConfig config;
    CountingAudio audio;
    SessionManager session(config, audio);

    QueuedTrackingProvider unsupported(false);
    EXPECT_FALSE(session.init(unsupported));
    EXPECT_EQ(session.getSimulator().getGameState().getState(), GameState::Playing);

    session.run(5);
    EXPECT_EQ(session.getSimulator().getFrameCount(), 5u);

    session.togglePause();
    EXPECT_EQ(session.getSimulator().getGameState().getState(), GameState::Paused);
    session.togglePause();
    EXPECT_EQ(session.getSimulator().getGameState().getState(), GameState::Playing);

    session.restart();
    EXPECT_EQ(session.getSimulator().getGameState().getScore(), 0u);
    session.shutdown();
}
