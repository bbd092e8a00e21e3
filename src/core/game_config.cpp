#include "pingpong/core/game_config.hpp"
#include "pingpong/core/constants.hpp"

#include <cassert>

GameConfig::GameConfig() : params() {}

GameConfig::GameConfig(const Params& p) : params(p) {
    assert(params.ballRadius > 0.0 && "Ball radius must be > 0.");
    assert(params.maxBallSpeed > 0.0 && "Max ball speed must be > 0.");
    assert(params.restitution > 0.0 && params.restitution <= 1.0 &&
           "Restitution must lie in (0, 1].");
}

Position GameConfig::getBallStartPosition() const {
    return {
        params.tablePosition.x,
        params.tablePosition.y + params.tableSize.y + params.ballRadius
            + GameConstants::BallStartHeightOffset,
        params.tablePosition.z
    };
}

PlayAreaBounds GameConfig::getPlayAreaBounds() const {
    const double margin = GameConstants::BoundsMargin;

    PlayAreaBounds bounds;
    bounds.min = Position(
        params.tablePosition.x - params.tableSize.x / 2 - margin,
        params.groundLevel,
        params.wallPosition.z - margin
    );
    bounds.max = Position(
        params.tablePosition.x + params.tableSize.x / 2 + margin,
        params.tablePosition.y + GameConstants::BoundsHeadroom,
        params.tablePosition.z + params.tableSize.z / 2 + margin
    );
    return bounds;
}
