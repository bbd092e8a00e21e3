/**
 * @file vector_math.hpp
 * @brief 3D vector and position mathematics library
 *
 * This file provides fundamental 3D geometric primitives and operations:
 * - Vector class for velocities, normals and other directed quantities
 * - Position class for point locations in world space (metres, Y up)
 * - Geometric operations (dot product, projection, rescaling)
 * - Utility functions for floating point comparison
 */

#ifndef PINGPONG_VECTOR_MATH_HPP
#define PINGPONG_VECTOR_MATH_HPP

// Forward declarations
class Vector;

/**
 * @brief Constants for floating-point comparisons
 */
constexpr double EPSILON = 1e-9;  ///< Threshold for floating point equality tests

/**
 * @brief Utility function for safe square root computation
 *
 * @param d Input value
 * @return double Square root of input, warns if input is negative
 */
double my_sqrt(double d);

/**
 * @brief Compares two doubles for approximate equality
 *
 * @param a First value
 * @param b Second value
 * @param epsilon Maximum allowed difference
 * @return true if |a-b| < epsilon
 */
bool nearlyEqual(double a, double b, double epsilon=EPSILON);

/**
 * @brief Represents a 3D point in world space
 *
 * Position class is used for absolute locations.
 * Supports basic arithmetic and conversion to/from Vector.
 */
class Position {
public:
    double x;  ///< X coordinate (lateral)
    double y;  ///< Y coordinate (up)
    double z;  ///< Z coordinate (toward the player)

    /** @brief Constructs a Position at the origin */
    Position();

    /**
     * @brief Constructs a Position at specified coordinates
     */
    Position(double x, double y, double z);

    /** @brief Converts Position to Vector */
    operator Vector() const;

    Position operator+(const Position& b) const;
    Position operator-(const Position& b) const;

    /**
     * @brief Offsets position by a vector
     * @param v Displacement
     * @return New position moved by v
     */
    Position operator+(const Vector& v) const;

    Position operator*(double scalar) const;

    Position& operator+=(const Vector& v);

    bool operator==(const Position& p) const;
    bool operator!=(const Position& p) const;
};

/**
 * @brief Represents a 3D vector with direction and magnitude
 *
 * Vector class provides the operations needed by the collision response
 * functions and the physics backend systems.
 */
class Vector {
public:
    double x;  ///< X component
    double y;  ///< Y component
    double z;  ///< Z component

    /** @brief Constructs a zero vector (0,0,0) */
    Vector();

    /**
     * @brief Constructs a vector with given components
     */
    Vector(double x, double y, double z);

    /**
     * @brief Constructs a vector from a position
     * @param p Position to convert
     */
    Vector(const Position& p);

    /** @brief Converts Vector to Position */
    operator Position() const;

    /** @brief Returns negation of this vector */
    Vector operator-() const;

    Vector operator+(const Vector& b) const;
    Vector operator-(const Vector& b) const;
    Vector operator*(double scalar) const;

    /**
     * @brief Divides vector by scalar value
     * @param scalar Divisor
     * @return Divided vector
     */
    Vector operator/(double scalar) const;

    Vector& operator+=(const Vector& v);
    Vector& operator-=(const Vector& v);

    bool operator==(const Vector& v) const;
    bool operator!=(const Vector& v) const;

    /** @brief Returns vector magnitude */
    double length() const;

    /** @brief Returns squared magnitude, avoiding the square root */
    double lengthSquared() const;

    /**
     * @brief Scales vector to specified length
     * @param length Target length
     * @return Vector with same direction but new length
     */
    Vector scale(double length) const;

    /**
     * @brief Calculates dot product with another vector
     * @param v Other vector
     * @return Dot product value
     */
    double dotProduct(const Vector& v) const;

    /** @brief Returns normalized vector (length = 1), +X for a zero vector */
    Vector normalized() const;

    /**
     * @brief Projects vector onto another vector
     * @param onto Vector to project onto
     * @return Projected vector
     */
    Vector projectOnto(const Vector &onto) const;

    /** @brief True when every component is a finite number */
    bool isFinite() const;

    /** @brief True when every component is exactly zero */
    bool isZero() const;
};

/**
 * @brief Component-wise approximate equality of two vectors
 */
bool nearlyEqual(const Vector &a, const Vector &b, double epsilon=EPSILON);

#endif // PINGPONG_VECTOR_MATH_HPP
