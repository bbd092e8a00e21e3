#include "pingpong/systems/movement.hpp"
#include "pingpong/components/basic.hpp"
#include "pingpong/core/profile.hpp"

namespace Systems {

MovementSystem::MovementSystem(const GameConfig& config) : ISystem(config) {}

void MovementSystem::update(entt::registry &registry) {
    PROFILE_SCOPE("MovementSystem");

    double const dt = sysConfig.SecondsPerTick / sysConfig.Substeps;

    auto view = registry.view<Components::Dynamic, Components::Position, Components::Velocity>();
    for (auto &&[entity, pos, vel] : view.each()) {
        pos += vel * dt;
    }
}

} // namespace Systems
