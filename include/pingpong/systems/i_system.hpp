/**
 * @file i_system.hpp
 * @brief Interface for the ECS systems that stand in for the physics backend
 */

#pragma once

#include <entt/entt.hpp>
#include "pingpong/core/game_config.hpp"
#include "pingpong/core/system_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for all ECS systems
 *
 * Every system reads the session's GameConfig and the frame's SystemConfig.
 * The GameConfig is held by reference and must outlive the system.
 */
class ISystem {
protected:
    const GameConfig& gameConfig;
    SystemConfig sysConfig;

public:
    explicit ISystem(const GameConfig& config) : gameConfig(config) {}

    virtual ~ISystem() = default;

    /**
     * @brief Updates the system for one simulation step
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Sets the frame stepping configuration
     */
    virtual void setSystemConfig(const SystemConfig& config) {
        sysConfig = config;
    }

    virtual const SystemConfig& getSystemConfig() const {
        return sysConfig;
    }
};

/**
 * @brief Template for system-specific configurations
 *
 * Used by systems that need settings beyond GameConfig and SystemConfig.
 */
template<typename SpecificConfig>
class ConfigurableSystem : public ISystem {
protected:
    SpecificConfig specificConfig;

public:
    explicit ConfigurableSystem(const GameConfig& config) : ISystem(config) {}

    void setSpecificConfig(const SpecificConfig& config) {
        specificConfig = config;
    }

    const SpecificConfig& getSpecificConfig() const {
        return specificConfig;
    }
};

} // namespace Systems
