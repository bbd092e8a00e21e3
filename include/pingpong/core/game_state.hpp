#pragma once

#include <string>

/**
 * @brief Lifecycle state of a play session
 */
enum class GameState {
    Idle,       ///< Not started yet
    Playing,    ///< Rally in progress
    Paused,     ///< Suspended, e.g. while hand tracking is lost
    GameOver    ///< Ball hit the ground
};

/**
 * @brief Bookkeeping for one play session
 *
 * score always equals the consecutiveHits value set by the most recent
 * successful hit; both return to zero only on reset.
 */
struct GameSession {
    GameState state = GameState::Idle;
    unsigned int score = 0;
    unsigned int consecutiveHits = 0;
};

std::string getGameStateName(GameState state);
