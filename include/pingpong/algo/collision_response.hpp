/**
 * @file collision_response.hpp
 * @brief Stateless velocity transforms applied when the ball touches something
 *
 * Three pure functions cover every ball response in the game:
 * - reflect: bounce off a surface with restitution (table, wall)
 * - racketTransfer: add a share of the racket's velocity (racket hit)
 * - clamp: cap the speed while keeping the direction
 *
 * None of them touch the registry or game state. Each is idempotent on input
 * that already satisfies its constraint.
 *
 * Contract violations (non-unit normal, non-finite vectors, coefficients out
 * of range) assert in debug builds and pass through best-effort in release.
 */

#ifndef PINGPONG_COLLISION_RESPONSE_HPP
#define PINGPONG_COLLISION_RESPONSE_HPP

#include "pingpong/math/vector_math.hpp"

namespace CollisionResponse {

/**
 * @brief Reflects a velocity off a surface
 *
 * The velocity is split into a normal part n(v.n) and a tangential part.
 * The tangential part passes through unchanged; the normal part reverses
 * and is scaled by the restitution coefficient.
 *
 * @param velocity Incoming velocity
 * @param normal Unit surface normal
 * @param restitution Fraction of normal speed kept, in (0, 1]
 * @return Outgoing velocity
 */
Vector reflect(const Vector& velocity, const Vector& normal, double restitution = 0.89);

/**
 * @brief Adds a fraction of the racket's velocity to the ball's
 *
 * @param ballVelocity Ball velocity before the hit
 * @param racketVelocity Racket velocity at contact
 * @param transferCoefficient Share of racket velocity imparted, >= 0
 * @return ballVelocity + transferCoefficient * racketVelocity
 */
Vector racketTransfer(const Vector& ballVelocity, const Vector& racketVelocity,
                      double transferCoefficient = 0.8);

/**
 * @brief Caps a velocity's magnitude at maxSpeed without changing its direction
 *
 * @param velocity Velocity to limit
 * @param maxSpeed Maximum allowed speed, > 0
 * @return velocity unchanged if |velocity| <= maxSpeed, otherwise rescaled
 */
Vector clamp(const Vector& velocity, double maxSpeed);

} // namespace CollisionResponse

#endif // PINGPONG_COLLISION_RESPONSE_HPP
