#include <gtest/gtest.h>
#include "pingpong/core/game_state_machine.hpp"

class GameStateMachineTest : public ::testing::Test {
protected:
    GameStateMachine game;

    void playHits(int count) {
        for (int i = 0; i < count; ++i) {
            game.recordHit();
        }
    }
};

TEST_F(GameStateMachineTest, StartsIdleWithEmptyScore) {
    EXPECT_EQ(game.getState(), GameState::Idle);
    EXPECT_EQ(game.getScore(), 0u);
    EXPECT_EQ(game.getConsecutiveHits(), 0u);
    EXPECT_FALSE(game.isGameActive());
}

TEST_F(GameStateMachineTest, StartGameFromAnyState) {
    game.startGame();
    EXPECT_EQ(game.getState(), GameState::Playing);

    game.pauseGame();
    game.startGame();
    EXPECT_EQ(game.getState(), GameState::Playing);

    game.endGame();
    game.startGame();
    EXPECT_EQ(game.getState(), GameState::Playing);
    EXPECT_TRUE(game.isGameActive());
}

TEST_F(GameStateMachineTest, PauseOnlyFromPlaying) {
    game.pauseGame();
    EXPECT_EQ(game.getState(), GameState::Idle);

    game.startGame();
    game.pauseGame();
    EXPECT_EQ(game.getState(), GameState::Paused);

    // Pausing twice stays paused
    game.pauseGame();
    EXPECT_EQ(game.getState(), GameState::Paused);

    game.endGame();
    game.pauseGame();
    EXPECT_EQ(game.getState(), GameState::GameOver);
}

TEST_F(GameStateMachineTest, ResumeOnlyFromPaused) {
    game.resumeGame();
    EXPECT_EQ(game.getState(), GameState::Idle);

    game.startGame();
    game.resumeGame();
    EXPECT_EQ(game.getState(), GameState::Playing);

    game.pauseGame();
    game.resumeGame();
    EXPECT_EQ(game.getState(), GameState::Playing);

    game.endGame();
    game.resumeGame();
    EXPECT_EQ(game.getState(), GameState::GameOver);
}

TEST_F(GameStateMachineTest, HitsCountOnlyWhilePlaying) {
    game.recordHit();
    EXPECT_EQ(game.getScore(), 0u);

    game.startGame();
    playHits(3);
    EXPECT_EQ(game.getScore(), 3u);
    EXPECT_EQ(game.getConsecutiveHits(), 3u);

    game.pauseGame();
    game.recordHit();
    EXPECT_EQ(game.getScore(), 3u);
    EXPECT_EQ(game.getConsecutiveHits(), 3u);

    game.resumeGame();
    game.recordHit();
    EXPECT_EQ(game.getScore(), 4u);
}

TEST_F(GameStateMachineTest, ScoreFollowsConsecutiveHits) {
    game.startGame();
    for (unsigned int i = 1; i <= 5; ++i) {
        game.recordHit();
        EXPECT_EQ(game.getScore(), i);
        EXPECT_EQ(game.getScore(), game.getConsecutiveHits());
    }
}

TEST_F(GameStateMachineTest, PauseKeepsScoreAndHits) {
    game.startGame();
    playHits(2);
    game.pauseGame();
    game.resumeGame();

    EXPECT_EQ(game.getScore(), 2u);
    EXPECT_EQ(game.getConsecutiveHits(), 2u);
}

TEST_F(GameStateMachineTest, GroundCollisionEndsRallyAndKeepsScore) {
    game.startGame();
    playHits(10);
    EXPECT_EQ(game.getScore(), 10u);

    game.handleGroundCollision();

    EXPECT_EQ(game.getState(), GameState::GameOver);
    EXPECT_EQ(game.getScore(), 10u);
    EXPECT_EQ(game.getConsecutiveHits(), 0u);
}

TEST_F(GameStateMachineTest, GroundCollisionIgnoredUnlessPlaying) {
    game.handleGroundCollision();
    EXPECT_EQ(game.getState(), GameState::Idle);

    game.startGame();
    playHits(2);
    game.pauseGame();
    game.handleGroundCollision();
    EXPECT_EQ(game.getState(), GameState::Paused);
    EXPECT_EQ(game.getConsecutiveHits(), 2u);
}

TEST_F(GameStateMachineTest, HitAfterGameOverIsIgnored) {
    game.startGame();
    playHits(1);
    game.handleGroundCollision();

    game.recordHit();
    EXPECT_EQ(game.getScore(), 1u);
    EXPECT_EQ(game.getConsecutiveHits(), 0u);
}

TEST_F(GameStateMachineTest, ResetClearsEverything) {
    game.startGame();
    playHits(4);
    game.resetGame();

    EXPECT_EQ(game.getState(), GameState::Idle);
    EXPECT_EQ(game.getScore(), 0u);
    EXPECT_EQ(game.getConsecutiveHits(), 0u);
}

TEST_F(GameStateMachineTest, RestartAfterGameOverKeepsScoreUntilReset) {
    game.startGame();
    playHits(3);
    game.handleGroundCollision();

    // startGame alone does not clear the score of the finished rally
    game.startGame();
    EXPECT_EQ(game.getScore(), 3u);
    EXPECT_EQ(game.getConsecutiveHits(), 0u);

    game.recordHit();
    EXPECT_EQ(game.getScore(), 1u);
}

TEST_F(GameStateMachineTest, PausedControlledThroughInterface) {
    IGameControl& control = game;
    game.startGame();

    control.pauseGame();
    EXPECT_EQ(game.getState(), GameState::Paused);

    control.resumeGame();
    EXPECT_EQ(game.getState(), GameState::Playing);
}

TEST(GameStateNameTest, NamesEveryState) {
    EXPECT_EQ(getGameStateName(GameState::Idle), "IDLE");
    EXPECT_EQ(getGameStateName(GameState::Playing), "PLAYING");
    EXPECT_EQ(getGameStateName(GameState::Paused), "PAUSED");
    EXPECT_EQ(getGameStateName(GameState::GameOver), "GAME_OVER");
}
