#pragma once

#include "warpcore/math/Vec3.h"

#include <cmath>
#include <ostream>

namespace warpcore::math {

// Euler angles in radians, applied in Y (yaw), X (pitch), Z (roll) order.
// Derived on demand from a quaternion; never the stored orientation.
struct EulerAngles {
  double pitch = 0.0; // about X
  double yaw = 0.0;   // about Y
  double roll = 0.0;  // about Z
};

// Orientation quaternion. Frame convention: +Y up, local forward is -Z,
// local right is +X.
struct Quatd {
  double w = 1.0;
  double x = 0.0;
  double y = 0.0;
  double z = 0.0;

  constexpr Quatd() = default;
  constexpr Quatd(double w_, double x_, double y_, double z_) : w(w_), x(x_), y(y_), z(z_) {}

  static constexpr Quatd identity() { return {1.0, 0.0, 0.0, 0.0}; }

  static Quatd fromAxisAngle(const Vec3d& axis, double angleRad) {
    const Vec3d n = axis.normalized();
    const double half = angleRad * 0.5;
    const double s = std::sin(half);
    return {std::cos(half), n.x * s, n.y * s, n.z * s};
  }

  static Quatd fromEuler(const EulerAngles& e);

  // Rotation whose local forward (-Z) points along `forward`, keeping local +Y
  // as close to `up` as possible.
  static Quatd lookRotation(const Vec3d& forward, const Vec3d& up = kWorldUp);

  // Shortest-path spherical interpolation, t in [0,1].
  static Quatd slerp(const Quatd& a, const Quatd& b, double t);

  constexpr Quatd operator*(const Quatd& q) const {
    return {
      w*q.w - x*q.x - y*q.y - z*q.z,
      w*q.x + x*q.w + y*q.z - z*q.y,
      w*q.y - x*q.z + y*q.w + z*q.x,
      w*q.z + x*q.y - y*q.x + z*q.w
    };
  }

  constexpr Quatd conjugate() const { return {w, -x, -y, -z}; }

  double length() const { return std::sqrt(w*w + x*x + y*y + z*z); }

  Quatd normalized() const {
    const double len = length();
    if (len <= 0.0) return identity();
    return {w / len, x / len, y / len, z / len};
  }

  Vec3d rotate(const Vec3d& v) const {
    const Vec3d u{x, y, z};
    return u * (2.0 * math::dot(u, v))
         + v * (w*w - math::dot(u, u))
         + math::cross(u, v) * (2.0 * w);
  }

  Vec3d forward() const { return rotate(kLocalForward); }
  Vec3d right() const { return rotate(Vec3d::unitX()); }
  Vec3d up() const { return rotate(kWorldUp); }

  EulerAngles toEuler() const;
};

inline double dot(const Quatd& a, const Quatd& b) {
  return a.w*b.w + a.x*b.x + a.y*b.y + a.z*b.z;
}

// Angle in radians between two orientations.
double angleBetween(const Quatd& a, const Quatd& b);

inline std::ostream& operator<<(std::ostream& os, const Quatd& q) {
  os << "(w=" << q.w << ", " << q.x << ", " << q.y << ", " << q.z << ")";
  return os;
}

} // namespace warpcore::math
