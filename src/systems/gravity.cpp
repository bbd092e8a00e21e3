#include "pingpong/systems/gravity.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/profile.hpp"

namespace Systems {

GravitySystem::GravitySystem(const GameConfig& config) : ISystem(config) {}

void GravitySystem::update(entt::registry &registry) {
    PROFILE_SCOPE("GravitySystem");

    double const dt = sysConfig.SecondsPerTick / sysConfig.Substeps;
    Vector const dv = gameConfig.getGravity() * dt;

    auto view = registry.view<Components::Dynamic, Components::Velocity>();
    for (auto &&[entity, vel] : view.each()) {
        vel += dv;
    }
}

} // namespace Systems
