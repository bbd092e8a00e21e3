/**
 * @file tracking_bridge.hpp
 * @brief Turns hand-tracking loss and recovery into pause and resume
 */

#ifndef PINGPONG_TRACKING_BRIDGE_HPP
#define PINGPONG_TRACKING_BRIDGE_HPP

#include "pingpong/core/i_game_control.hpp"
#include "pingpong/tracking/anchor_update.hpp"

/**
 * @class TrackingAvailabilityBridge
 * @brief Keeps TrackingStatus and drives pause/resume from it
 *
 * Rules:
 * - session started: mark active
 * - acquired/updated: if lost, clear lost and resume; mark active
 * - removed while active: mark lost and inactive, then pause
 *
 * The game's own guards decide whether pause/resume do anything, so a
 * stray removal outside of play only changes the local flags. The bridge
 * never touches score or hit count.
 *
 * The IGameControl is borrowed and must outlive the bridge. Not thread-safe:
 * events must be marshalled onto the game-state thread first.
 */
class TrackingAvailabilityBridge {
public:
    explicit TrackingAvailabilityBridge(IGameControl& game);

    /**
     * @brief Routes one provider event to the matching handler
     */
    void onAnchorUpdate(const AnchorUpdate& update);

    void onTrackingAcquired();
    void onTrackingRemoved();

    /**
     * @brief Marks tracking active once the provider session is running
     *
     * A removal can then pause the game before the first pose arrives.
     * A pending loss is left for the next pose to clear.
     */
    void onTrackingStarted();

    /**
     * @brief Marks tracking inactive after the session stops
     *
     * A deliberate stop is not a loss: lost is left as it is and the game
     * is not paused.
     */
    void onTrackingStopped();

    const TrackingStatus& getStatus() const { return status; }
    bool isTrackingActive() const { return status.active; }
    bool isTrackingLost() const { return status.lost; }

private:
    IGameControl& game;
    TrackingStatus status;
};

#endif // PINGPONG_TRACKING_BRIDGE_HPP
