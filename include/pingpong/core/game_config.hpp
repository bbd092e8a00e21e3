/**
 * @file game_config.hpp
 * @brief Immutable geometric and physical constants for one play session.
 */

#pragma once

#include "pingpong/core/constants.hpp"
#include "pingpong/math/vector_math.hpp"

/**
 * @brief Axis-aligned legal play volume
 */
struct PlayAreaBounds {
    Position min;
    Position max;
};

/**
 * @class GameConfig
 * @brief Table, wall, ball and physics constants.
 *
 * Built once per session and shared by const reference with every component.
 * All members are fixed at construction; derived values (start pose, play
 * area) are computed from them on demand.
 *
 * Defaults describe a regulation table (2.74m x 0.76m x 1.525m) with a
 * rebound wall at its far end.
 */
class GameConfig {
public:
    /**
     * @brief Tuning values for a GameConfig; every field has a default
     */
    struct Params {
        Vector tableSize{2.74, 0.76, 1.525};   ///< length x height x width
        Vector wallSize{1.525, 1.0, 0.05};     ///< width x height x thickness
        double ballRadius = 0.02;
        Vector gravity{0.0, -9.81, 0.0};       ///< m/s^2
        double maxBallSpeed = 15.0;            ///< m/s
        Position tablePosition{0.0, 0.76, -1.5};
        Position wallPosition{0.0, 1.26, -2.87};
        double groundLevel = 0.0;
        double restitution = GameConstants::DefaultRestitution;
        double transferCoefficient = GameConstants::DefaultTransferCoefficient;
    };

    GameConfig();
    explicit GameConfig(const Params& params);

    const Vector& getTableSize() const { return params.tableSize; }
    const Vector& getWallSize() const { return params.wallSize; }
    double getBallRadius() const { return params.ballRadius; }
    const Vector& getGravity() const { return params.gravity; }
    double getMaxBallSpeed() const { return params.maxBallSpeed; }
    const Position& getTablePosition() const { return params.tablePosition; }
    const Position& getWallPosition() const { return params.wallPosition; }
    double getGroundLevel() const { return params.groundLevel; }
    double getRestitution() const { return params.restitution; }
    double getTransferCoefficient() const { return params.transferCoefficient; }

    /**
     * @brief Canonical ball start pose, centred above the table
     */
    Position getBallStartPosition() const;

    /**
     * @brief Play-area box derived from table, wall and ground level
     *
     * Lower Y bound sits at ground level, upper Y bound above the table.
     */
    PlayAreaBounds getPlayAreaBounds() const;

private:
    const Params params;
};
