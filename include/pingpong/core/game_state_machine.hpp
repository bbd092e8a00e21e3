/**
 * @file game_state_machine.hpp
 * @brief Session lifecycle and score keeping.
 */

#pragma once

#include "pingpong/core/game_state.hpp"
#include "pingpong/core/i_game_control.hpp"

/**
 * @class GameStateMachine
 * @brief Owns the GameSession and the only API allowed to change it.
 *
 * Transitions:
 *  - startGame():  any state -> Playing
 *  - pauseGame():  Playing -> Paused, otherwise ignored
 *  - resumeGame(): Paused -> Playing, otherwise ignored
 *  - endGame():    any state -> GameOver
 *  - resetGame():  any state -> Idle, score and hits cleared
 *
 * recordHit() and handleGroundCollision() only act while Playing. Calls
 * from an inapplicable state are silently ignored; nothing here throws.
 *
 * Not thread-safe: every mutating call must come from the context that
 * drains the session's SerialExecutor.
 */
class GameStateMachine : public IGameControl {
public:
    GameStateMachine() = default;

    void startGame();
    void pauseGame() override;
    void resumeGame() override;
    void endGame();
    void resetGame();

    /**
     * @brief Counts a racket hit: consecutiveHits += 1, score = consecutiveHits.
     */
    void recordHit();

    /**
     * @brief Ends the rally: consecutiveHits = 0, state -> GameOver.
     *
     * The score of the finished rally is kept for display.
     */
    void handleGroundCollision();

    GameState getState() const { return session.state; }
    unsigned int getScore() const { return session.score; }
    unsigned int getConsecutiveHits() const { return session.consecutiveHits; }
    const GameSession& getSession() const { return session; }

    bool isGameActive() const { return session.state == GameState::Playing; }

private:
    void transitionTo(GameState next);

    GameSession session;
};
