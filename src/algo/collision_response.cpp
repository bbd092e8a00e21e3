#include "pingpong/algo/collision_response.hpp"

#include <cassert>
#include <cmath>

namespace CollisionResponse {

namespace {
    // Tolerance on |n| - 1 for a normal to count as unit length
    constexpr double NORMAL_LENGTH_TOLERANCE = 1e-6;
}

Vector reflect(const Vector& velocity, const Vector& normal, double restitution) {
    assert(velocity.isFinite() && "Reflected velocity must be finite.");
    assert(std::fabs(normal.length() - 1.0) < NORMAL_LENGTH_TOLERANCE &&
           "Surface normal must be unit length.");
    assert(restitution > 0.0 && restitution <= 1.0 && "Restitution must lie in (0, 1].");

    Vector const normalComponent = velocity.projectOnto(normal);
    Vector const tangentialComponent = velocity - normalComponent;

    return tangentialComponent - normalComponent * restitution;
}

Vector racketTransfer(const Vector& ballVelocity, const Vector& racketVelocity,
                      double transferCoefficient) {
    assert(ballVelocity.isFinite() && racketVelocity.isFinite() &&
           "Transfer inputs must be finite.");
    assert(transferCoefficient >= 0.0 && "Transfer coefficient must be >= 0.");

    return ballVelocity + racketVelocity * transferCoefficient;
}

Vector clamp(const Vector& velocity, double maxSpeed) {
    assert(velocity.isFinite() && "Clamped velocity must be finite.");
    assert(maxSpeed > 0.0 && "Max speed must be > 0.");

    if (velocity.length() <= maxSpeed) {
        return velocity;
    }
    return velocity.scale(maxSpeed);
}

} // namespace CollisionResponse
