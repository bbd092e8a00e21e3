/**
 * @file session_manager.cpp
 * @brief Implementation of SessionManager.
 */

#include "pingpong/core/session_manager.hpp"

#include <iostream>

#include "pingpong/core/profile.hpp"

SessionManager::SessionManager(const GameConfig& config, IAudioCues& audio)
    : simulator(config, audio)
{
}

bool SessionManager::init(IHandTrackingProvider& provider)
{
  bool const tracking = simulator.startTracking(provider);
  if (!tracking)
  {
    std::cerr << "Continuing without hand tracking." << std::endl;
  }
  init();
  return tracking;
}

void SessionManager::init()
{
  simulator.newGame();
  lastState = simulator.getGameState().getState();
}

void SessionManager::tick()
{
  simulator.tick();

  // Report lifecycle changes once, when they happen
  GameState const state = simulator.getGameState().getState();
  if (state != lastState)
  {
    std::cout << "Game state: " << getGameStateName(state)
              << " (score " << simulator.getGameState().getScore() << ")" << std::endl;
    lastState = state;
  }
}

void SessionManager::run(std::uint64_t frameCount)
{
  PROFILE_SCOPE("SessionManager::run");

  for (std::uint64_t i = 0; i < frameCount; ++i)
  {
    tick();
  }
}

void SessionManager::togglePause()
{
  GameStateMachine& game = simulator.getGameState();
  if (game.getState() == GameState::Paused)
  {
    game.resumeGame();
  }
  else
  {
    game.pauseGame();
  }
}

void SessionManager::restart()
{
  simulator.newGame();
}

void SessionManager::shutdown()
{
  simulator.stopTracking();
}
