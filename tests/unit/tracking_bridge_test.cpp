#include <gtest/gtest.h>
#include "pingpong/tracking/tracking_bridge.hpp"
#include "pingpong/core/game_state_machine.hpp"

namespace {

// Counts pause/resume requests without applying them
class CountingControl : public IGameControl {
public:
    void pauseGame() override { ++pauses; }
    void resumeGame() override { ++resumes; }

    int pauses = 0;
    int resumes = 0;
};

AnchorUpdate makeUpdate(AnchorEvent event) {
    AnchorUpdate update;
    update.event = event;
    update.wristPosition = Position(0.0, 1.0, -0.5);
    return update;
}

} // namespace

class TrackingBridgeTest : public ::testing::Test {
protected:
    GameStateMachine game;
    TrackingAvailabilityBridge bridge{game};
};

TEST_F(TrackingBridgeTest, StartsInactive) {
    EXPECT_FALSE(bridge.isTrackingActive());
    EXPECT_FALSE(bridge.isTrackingLost());
}

TEST_F(TrackingBridgeTest, AcquireMarksActive) {
    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Added));
    EXPECT_TRUE(bridge.isTrackingActive());
    EXPECT_FALSE(bridge.isTrackingLost());
}

TEST_F(TrackingBridgeTest, LossPausesAndRecoveryResumes) {
    game.startGame();
    game.recordHit();
    game.recordHit();
    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Added));

    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Removed));
    EXPECT_EQ(game.getState(), GameState::Paused);
    EXPECT_TRUE(bridge.isTrackingLost());
    EXPECT_FALSE(bridge.isTrackingActive());

    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Updated));
    EXPECT_EQ(game.getState(), GameState::Playing);
    EXPECT_FALSE(bridge.isTrackingLost());
    EXPECT_TRUE(bridge.isTrackingActive());

    // Score and hits untouched across the dropout
    EXPECT_EQ(game.getScore(), 2u);
    EXPECT_EQ(game.getConsecutiveHits(), 2u);
}

TEST_F(TrackingBridgeTest, RemovalWhileInactiveIsIgnored) {
    CountingControl control;
    TrackingAvailabilityBridge counting(control);

    counting.onTrackingRemoved();
    EXPECT_EQ(control.pauses, 0);
    EXPECT_FALSE(counting.isTrackingLost());
}

TEST_F(TrackingBridgeTest, RepeatedRemovalPausesOnce) {
    CountingControl control;
    TrackingAvailabilityBridge counting(control);
    counting.onTrackingAcquired();

    counting.onTrackingRemoved();
    counting.onTrackingRemoved();
    EXPECT_EQ(control.pauses, 1);
}

TEST_F(TrackingBridgeTest, UpdatesWithoutLossNeverResume) {
    CountingControl control;
    TrackingAvailabilityBridge counting(control);

    counting.onTrackingAcquired();
    counting.onTrackingAcquired();
    EXPECT_EQ(control.resumes, 0);
}

TEST_F(TrackingBridgeTest, RemovalOutsidePlayOnlyChangesFlags) {
    bridge.onTrackingAcquired();

    bridge.onTrackingRemoved();
    EXPECT_EQ(game.getState(), GameState::Idle);
    EXPECT_TRUE(bridge.isTrackingLost());

    bridge.onTrackingAcquired();
    EXPECT_EQ(game.getState(), GameState::Idle);
    EXPECT_FALSE(bridge.isTrackingLost());
}

TEST_F(TrackingBridgeTest, RecoveryAfterGameOverDoesNotResume) {
    game.startGame();
    bridge.onTrackingAcquired();
    bridge.onTrackingRemoved();

    // Game over while tracking was lost
    game.endGame();
    bridge.onTrackingAcquired();
    EXPECT_EQ(game.getState(), GameState::GameOver);
}

TEST_F(TrackingBridgeTest, StartMarksActiveSoRemovalPauses) {
    game.startGame();

    bridge.onTrackingStarted();
    EXPECT_TRUE(bridge.isTrackingActive());
    EXPECT_FALSE(bridge.isTrackingLost());

    // Removed before any pose arrived
    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Removed));
    EXPECT_EQ(game.getState(), GameState::Paused);
    EXPECT_TRUE(bridge.isTrackingLost());

    bridge.onAnchorUpdate(makeUpdate(AnchorEvent::Added));
    EXPECT_EQ(game.getState(), GameState::Playing);
    EXPECT_FALSE(bridge.isTrackingLost());
}

TEST_F(TrackingBridgeTest, StopIsNotALoss) {
    game.startGame();
    bridge.onTrackingAcquired();

    bridge.onTrackingStopped();
    EXPECT_FALSE(bridge.isTrackingActive());
    EXPECT_FALSE(bridge.isTrackingLost());
    EXPECT_EQ(game.getState(), GameState::Playing);

    // Removal after a stop has nothing to lose
    bridge.onTrackingRemoved();
    EXPECT_EQ(game.getState(), GameState::Playing);
}
