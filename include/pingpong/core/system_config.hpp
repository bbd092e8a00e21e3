#pragma once

#include "pingpong/core/constants.hpp"

/**
 * @struct SystemConfig
 * @brief Frame stepping parameters shared by all physics systems.
 */
struct SystemConfig {
    double SecondsPerTick = 1.0 / GameConstants::StepsPerSecond;
    int Substeps = GameConstants::SubstepsPerTick;
};
