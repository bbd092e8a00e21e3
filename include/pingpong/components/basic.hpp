#ifndef PINGPONG_COMPONENTS_BASIC_HPP
#define PINGPONG_COMPONENTS_BASIC_HPP

#include <vector>
#include <entt/entt.hpp>
#include "pingpong/math/vector_math.hpp" // for Position, Vector

namespace Components {

    /**
     * @brief Closed set of body kinds that can take part in a collision
     */
    enum class BodyKind {
        Ball,
        Racket,
        Table,
        Wall,
        Ground
    };

    // Use the Position and Vector classes from vector_math.hpp
    using Position = ::Position;
    using Velocity = ::Vector;

    struct AngularVelocity {
        ::Vector omega; // radians per second about each axis

        AngularVelocity() = default;
        explicit AngularVelocity(const ::Vector& w) : omega(w) {}
    };

    struct Body {
        BodyKind kind = BodyKind::Ball;

        explicit Body(BodyKind k = BodyKind::Ball) : kind(k) {}
    };

    struct Radius {
        double value = 0.02;

        explicit Radius(double v = 0.02) : value(v) {}
    };

    // Axis-aligned box collider, centred on the entity Position
    struct BoxExtents {
        ::Vector halfSize;

        BoxExtents() = default;
        explicit BoxExtents(const ::Vector& fullSize) : halfSize(fullSize * 0.5) {}
    };

    // Marks bodies that gravity acts on
    struct Dynamic {};

    // Bodies currently overlapping this one, used to report contact onsets once
    struct Contacts {
        std::vector<entt::entity> touching;
    };

    // Last pose sample used to estimate the racket's velocity
    struct PoseSample {
        ::Position position;
        double timeSeconds = 0.0;
        bool valid = false;
    };

} // namespace Components

#endif // PINGPONG_COMPONENTS_BASIC_HPP
