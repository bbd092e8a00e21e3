#include "pingpong/core/game_state_machine.hpp"
#include "pingpong/core/debug.hpp"

std::string getGameStateName(GameState state) {
    switch (state) {
        case GameState::Idle:     return "IDLE";
        case GameState::Playing:  return "PLAYING";
        case GameState::Paused:   return "PAUSED";
        case GameState::GameOver: return "GAME_OVER";
    }
    return "UNKNOWN";
}

void GameStateMachine::transitionTo(GameState next) {
    if (session.state != next) {
        DEBUG_MSG(DEBUG_LEVEL_BASIC, "[GameState] " << getGameStateName(session.state)
                  << " -> " << getGameStateName(next) << "\n");
    }
    session.state = next;
}

void GameStateMachine::startGame() {
    transitionTo(GameState::Playing);
}

void GameStateMachine::pauseGame() {
    if (session.state != GameState::Playing) {
        return;
    }
    transitionTo(GameState::Paused);
}

void GameStateMachine::resumeGame() {
    if (session.state != GameState::Paused) {
        return;
    }
    transitionTo(GameState::Playing);
}

void GameStateMachine::endGame() {
    transitionTo(GameState::GameOver);
}

void GameStateMachine::resetGame() {
    session.score = 0;
    session.consecutiveHits = 0;
    transitionTo(GameState::Idle);
}

void GameStateMachine::recordHit() {
    if (!isGameActive()) {
        return;
    }

    session.consecutiveHits += 1;
    session.score = session.consecutiveHits;
    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "[GameState] hit #" << session.consecutiveHits << "\n");
}

void GameStateMachine::handleGroundCollision() {
    if (!isGameActive()) {
        return;
    }

    session.consecutiveHits = 0;
    endGame();
}
