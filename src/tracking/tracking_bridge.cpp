#include "pingpong/tracking/tracking_bridge.hpp"

#include <iostream>

TrackingAvailabilityBridge::TrackingAvailabilityBridge(IGameControl& game) : game(game) {}

void TrackingAvailabilityBridge::onAnchorUpdate(const AnchorUpdate& update) {
    switch (update.event) {
        case AnchorEvent::Added:
        case AnchorEvent::Updated:
            onTrackingAcquired();
            break;
        case AnchorEvent::Removed:
            onTrackingRemoved();
            break;
    }
}

void TrackingAvailabilityBridge::onTrackingAcquired() {
    if (status.lost) {
        status.lost = false;
        game.resumeGame();
        std::cout << "Hand tracking restored - game resumed" << std::endl;
    }
    status.active = true;
}

void TrackingAvailabilityBridge::onTrackingRemoved() {
    if (!status.active) {
        return;
    }

    status.lost = true;
    status.active = false;
    game.pauseGame();
    std::cout << "Hand tracking lost - game paused" << std::endl;
}

void TrackingAvailabilityBridge::onTrackingStarted() {
    status.active = true;
}

void TrackingAvailabilityBridge::onTrackingStopped() {
    status.active = false;
}
