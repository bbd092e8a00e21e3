/**
 * @fileoverview session_manager.hpp
 * @brief High-level controller for the frame loop and tracking lifetime.
 */

#pragma once

#include <cstdint>

#include "pingpong/audio/i_audio_cues.hpp"
#include "pingpong/core/game_config.hpp"
#include "pingpong/core/game_simulator.hpp"
#include "pingpong/tracking/hand_tracking_provider.hpp"

/**
 * @class SessionManager
 * @brief Orchestrates one play session on the calling thread.
 *
 * Starts hand tracking, runs frames, and forwards user actions (pause
 * toggle, restart) to the state machine. Running without hand tracking is
 * allowed; the game then never pauses on its own.
 */
class SessionManager {
 public:
  SessionManager(const GameConfig& config, IAudioCues& audio);

  /**
   * @brief Starts tracking on the given provider and begins a rally.
   * @return false if tracking could not be started; the rally starts anyway.
   */
  bool init(IHandTrackingProvider& provider);

  /**
   * @brief Starts a rally without hand tracking.
   */
  void init();

  /**
   * @brief Runs one frame.
   */
  void tick();

  /**
   * @brief Runs frameCount frames back to back.
   */
  void run(std::uint64_t frameCount);

  /**
   * @brief Pauses a running rally or resumes a paused one.
   */
  void togglePause();

  /**
   * @brief Starts a fresh rally after a game over or on request.
   */
  void restart();

  /**
   * @brief Stops tracking; the session can no longer pause or resume on its own.
   */
  void shutdown();

  GameSimulator& getSimulator() { return simulator; }
  const GameSimulator& getSimulator() const { return simulator; }

 private:
  GameSimulator simulator;
  GameState lastState = GameState::Idle;
};
