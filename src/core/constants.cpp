#include "pingpong/core/constants.hpp"

namespace GameConstants {

    const double DefaultRestitution         = 0.89;
    const double DefaultTransferCoefficient = 0.8;

    const double BoundsMargin          = 2.0;
    const double BoundsHeadroom        = 3.0;
    const double BallStartHeightOffset = 0.5;

    const double MinPoseInterval = 1e-4;

    const double GroundPlaneSize      = 20.0;
    const double GroundPlaneThickness = 0.01;

    const double RacketWidth     = 0.15;
    const double RacketHeight    = 0.25;
    const double RacketThickness = 0.01;
    const Position RacketRestPosition(0.3, 1.2, -0.5);

    const Vector UpNormal(0.0, 1.0, 0.0);
    const Vector ForwardNormal(0.0, 0.0, 1.0);

    const unsigned int StepsPerSecond = 90;
    const int SubstepsPerTick         = 4;

    std::string getBodyKindName(Components::BodyKind kind) {
        switch (kind) {
            case Components::BodyKind::Ball:   return "ball";
            case Components::BodyKind::Racket: return "racket";
            case Components::BodyKind::Table:  return "table";
            case Components::BodyKind::Wall:   return "wall";
            case Components::BodyKind::Ground: return "ground";
        }
        return "unknown";
    }

} // namespace GameConstants
