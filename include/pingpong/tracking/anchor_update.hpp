#pragma once

#include "pingpong/math/vector_math.hpp"

/**
 * @brief Kind of hand-anchor event delivered by the tracking provider
 */
enum class AnchorEvent {
    Added,
    Updated,
    Removed
};

/**
 * @brief One item of the provider's ordered anchor-update stream
 *
 * wristPosition and timeSeconds are only meaningful for Added/Updated.
 */
struct AnchorUpdate {
    AnchorEvent event = AnchorEvent::Updated;
    Position wristPosition;
    double timeSeconds = 0.0;
};

/**
 * @brief Hand-tracking availability as seen by the game
 */
struct TrackingStatus {
    bool active = false;  ///< Tracking currently delivers poses
    bool lost = false;    ///< Tracking dropped while active and has not come back
};
