#ifndef PINGPONG_CONSTANTS_HPP
#define PINGPONG_CONSTANTS_HPP

#include <string>
#include "pingpong/components/basic.hpp"

namespace GameConstants {

    // Ball restitution against table and wall
    extern const double DefaultRestitution;
    // Fraction of racket velocity imparted to the ball
    extern const double DefaultTransferCoefficient;

    // Play-area box padding around the table and wall
    extern const double BoundsMargin;
    // Height of the play-area ceiling above the table position
    extern const double BoundsHeadroom;
    // Drop height of the ball start pose above the table
    extern const double BallStartHeightOffset;

    // Below this interval two racket pose samples give zero velocity
    extern const double MinPoseInterval;

    // Ground collider
    extern const double GroundPlaneSize;
    extern const double GroundPlaneThickness;

    // Racket collider and rest pose
    extern const double RacketWidth;
    extern const double RacketHeight;
    extern const double RacketThickness;
    extern const Position RacketRestPosition;

    // Surface normals used for table and wall bounces
    extern const Vector UpNormal;
    extern const Vector ForwardNormal;

    // Frame stepping
    extern const unsigned int StepsPerSecond;
    extern const int SubstepsPerTick;

    std::string getBodyKindName(Components::BodyKind kind);
}

#endif // PINGPONG_CONSTANTS_HPP
