#include "pingpong/math/vector_math.hpp"

#include <iostream>
#include <cmath>

double my_sqrt(double d) {
  if (d < 0) {
    std::cerr << "[vector_math] Warning: sqrt of negative value " << d << std::endl;
  }
  return std::sqrt(d);
}

bool nearlyEqual(double a, double b, double epsilon) {
  return std::fabs(a-b) < epsilon;
}

bool nearlyEqual(const Vector &a, const Vector &b, double epsilon) {
  return nearlyEqual(a.x, b.x, epsilon) &&
         nearlyEqual(a.y, b.y, epsilon) &&
         nearlyEqual(a.z, b.z, epsilon);
}

// Position

Position::Position() : x(0), y(0), z(0) {}
Position::Position(double x, double y, double z) : x(x), y(y), z(z) {}

Position::operator Vector() const {
  return {this->x, this->y, this->z};
}

Position Position::operator+(const Position& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Position Position::operator-(const Position& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Position Position::operator+(const Vector& v) const {
  return {this->x + v.x, this->y + v.y, this->z + v.z};
}

Position Position::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Position& Position::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

bool Position::operator==(const Position& p) const {
  return this->x == p.x && this->y == p.y && this->z == p.z;
}

bool Position::operator!=(const Position& p) const {
  return !(*this == p);
}

// Vector

Vector::Vector() : x(0), y(0), z(0) {}
Vector::Vector(double x, double y, double z) : x(x), y(y), z(z) {}
Vector::Vector(const Position& p) : x(p.x), y(p.y), z(p.z) {}

Vector::operator Position() const {
  return {this->x, this->y, this->z};
}

Vector Vector::operator-() const {
  return {-this->x, -this->y, -this->z};
}

Vector Vector::operator+(const Vector& b) const {
  return {this->x + b.x, this->y + b.y, this->z + b.z};
}

Vector Vector::operator-(const Vector& b) const {
  return {this->x - b.x, this->y - b.y, this->z - b.z};
}

Vector Vector::operator*(double scalar) const {
  return {this->x * scalar, this->y * scalar, this->z * scalar};
}

Vector Vector::operator/(double scalar) const {
  return {this->x / scalar, this->y / scalar, this->z / scalar};
}

Vector& Vector::operator+=(const Vector& v) {
  this->x += v.x;
  this->y += v.y;
  this->z += v.z;
  return *this;
}

Vector& Vector::operator-=(const Vector& v) {
  this->x -= v.x;
  this->y -= v.y;
  this->z -= v.z;
  return *this;
}

bool Vector::operator==(const Vector& v) const {
  return this->x == v.x && this->y == v.y && this->z == v.z;
}

bool Vector::operator!=(const Vector& v) const {
  return !(*this == v);
}

double Vector::length() const {
  return my_sqrt(this->lengthSquared());
}

double Vector::lengthSquared() const {
  return this->x * this->x + this->y * this->y + this->z * this->z;
}

Vector Vector::scale(double length) const {
  return this->normalized() * length;
}

double Vector::dotProduct(const Vector& v) const {
  return this->x * v.x + this->y * v.y + this->z * v.z;
}

Vector Vector::normalized() const {
  double const len = this->length();
  if (len > EPSILON) {
    return {this->x / len, this->y / len, this->z / len};
  }
  // default direction if zero-length vector
  return {1.0, 0.0, 0.0};
}

Vector Vector::projectOnto(const Vector &onto) const {
  double const denom = onto.lengthSquared();
  if (denom < EPSILON) {
    return {};
  }
  return onto * (this->dotProduct(onto) / denom);
}

bool Vector::isFinite() const {
  return std::isfinite(this->x) && std::isfinite(this->y) && std::isfinite(this->z);
}

bool Vector::isZero() const {
  return this->x == 0.0 && this->y == 0.0 && this->z == 0.0;
}
