#pragma once

#include <cmath>
#include <ostream>

namespace warpcore::math {

// Scene-space vector. Frame: +Y up, +X right, local forward is -Z.
struct Vec3d {
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Vec3d() = default;
  constexpr Vec3d(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

  static constexpr Vec3d unitX() { return {1.0, 0.0, 0.0}; }
  static constexpr Vec3d unitY() { return {0.0, 1.0, 0.0}; }
  static constexpr Vec3d unitZ() { return {0.0, 0.0, 1.0}; }

  constexpr Vec3d& operator+=(const Vec3d& v) {
    x += v.x;
    y += v.y;
    z += v.z;
    return *this;
  }
  constexpr Vec3d& operator-=(const Vec3d& v) {
    x -= v.x;
    y -= v.y;
    z -= v.z;
    return *this;
  }
  constexpr Vec3d& operator*=(double s) {
    x *= s;
    y *= s;
    z *= s;
    return *this;
  }

  double lengthSq() const { return x * x + y * y + z * z; }
  double length() const { return std::sqrt(lengthSq()); }
  double distanceTo(const Vec3d& o) const;

  // Zero vector stays zero.
  Vec3d normalized() const;

  bool isFinite() const { return std::isfinite(x) && std::isfinite(y) && std::isfinite(z); }
};

// Camera and flight offsets are written in this frame.
inline constexpr Vec3d kWorldUp{0.0, 1.0, 0.0};
inline constexpr Vec3d kLocalForward{0.0, 0.0, -1.0};

constexpr Vec3d operator+(Vec3d a, const Vec3d& b) { return a += b; }
constexpr Vec3d operator-(Vec3d a, const Vec3d& b) { return a -= b; }
constexpr Vec3d operator-(const Vec3d& v) { return {-v.x, -v.y, -v.z}; }
constexpr Vec3d operator*(Vec3d v, double s) { return v *= s; }
constexpr Vec3d operator*(double s, Vec3d v) { return v *= s; }
constexpr Vec3d operator/(const Vec3d& v, double s) { return {v.x / s, v.y / s, v.z / s}; }

constexpr bool operator==(const Vec3d& a, const Vec3d& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
constexpr bool operator!=(const Vec3d& a, const Vec3d& b) { return !(a == b); }

constexpr double dot(const Vec3d& a, const Vec3d& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }

constexpr Vec3d cross(const Vec3d& a, const Vec3d& b) {
  return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline double Vec3d::distanceTo(const Vec3d& o) const { return (*this - o).length(); }

inline Vec3d Vec3d::normalized() const {
  const double len = length();
  return (len > 0.0) ? *this / len : Vec3d{};
}

// Unclamped: t outside [0, 1] extrapolates.
constexpr Vec3d lerp(const Vec3d& a, const Vec3d& b, double t) { return a + (b - a) * t; }

inline std::ostream& operator<<(std::ostream& os, const Vec3d& v) {
  return os << "(" << v.x << ", " << v.y << ", " << v.z << ")";
}

} // namespace warpcore::math
