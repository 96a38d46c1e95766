#include "warpcore/math/Quat.h"

#include <algorithm>

namespace warpcore::math {
namespace {
  // Rotation matrix (row r, column c) -> quaternion.
  Quatd fromBasis(const Vec3d& xAxis, const Vec3d& yAxis, const Vec3d& zAxis) {
    const double m11 = xAxis.x, m12 = yAxis.x, m13 = zAxis.x;
    const double m21 = xAxis.y, m22 = yAxis.y, m23 = zAxis.y;
    const double m31 = xAxis.z, m32 = yAxis.z, m33 = zAxis.z;

    const double trace = m11 + m22 + m33;
    Quatd q;
    if (trace > 0.0) {
      const double s = 0.5 / std::sqrt(trace + 1.0);
      q = {0.25 / s, (m32 - m23) * s, (m13 - m31) * s, (m21 - m12) * s};
    } else if (m11 > m22 && m11 > m33) {
      const double s = 2.0 * std::sqrt(1.0 + m11 - m22 - m33);
      q = {(m32 - m23) / s, 0.25 * s, (m12 + m21) / s, (m13 + m31) / s};
    } else if (m22 > m33) {
      const double s = 2.0 * std::sqrt(1.0 + m22 - m11 - m33);
      q = {(m13 - m31) / s, (m12 + m21) / s, 0.25 * s, (m23 + m32) / s};
    } else {
      const double s = 2.0 * std::sqrt(1.0 + m33 - m11 - m22);
      q = {(m21 - m12) / s, (m13 + m31) / s, (m23 + m32) / s, 0.25 * s};
    }
    return q.normalized();
  }
} // namespace

Quatd Quatd::fromEuler(const EulerAngles& e) {
  const double c1 = std::cos(e.pitch * 0.5), s1 = std::sin(e.pitch * 0.5);
  const double c2 = std::cos(e.yaw * 0.5),   s2 = std::sin(e.yaw * 0.5);
  const double c3 = std::cos(e.roll * 0.5),  s3 = std::sin(e.roll * 0.5);

  // YXZ order
  return {
    c1*c2*c3 + s1*s2*s3,
    s1*c2*c3 + c1*s2*s3,
    c1*s2*c3 - s1*c2*s3,
    c1*c2*s3 - s1*s2*c3
  };
}

EulerAngles Quatd::toEuler() const {
  const Quatd q = normalized();
  const double xx = q.x*q.x, yy = q.y*q.y, zz = q.z*q.z;
  const double xy = q.x*q.y, xz = q.x*q.z, yz = q.y*q.z;
  const double wx = q.w*q.x, wy = q.w*q.y, wz = q.w*q.z;

  const double m11 = 1.0 - 2.0 * (yy + zz);
  const double m13 = 2.0 * (xz + wy);
  const double m21 = 2.0 * (xy + wz);
  const double m22 = 1.0 - 2.0 * (xx + zz);
  const double m23 = 2.0 * (yz - wx);
  const double m31 = 2.0 * (xz - wy);
  const double m33 = 1.0 - 2.0 * (xx + yy);

  EulerAngles e;
  e.pitch = std::asin(-std::clamp(m23, -1.0, 1.0));
  if (std::abs(m23) < 0.9999999) {
    e.yaw = std::atan2(m13, m33);
    e.roll = std::atan2(m21, m22);
  } else {
    // Gimbal lock: fold roll into yaw.
    e.yaw = std::atan2(-m31, m11);
    e.roll = 0.0;
  }
  return e;
}

Quatd Quatd::lookRotation(const Vec3d& forward, const Vec3d& up) {
  const Vec3d f = forward.normalized();
  if (f.lengthSq() <= 0.0) return identity();

  // Local +Z points away from the target.
  const Vec3d zAxis = -f;
  Vec3d xAxis = cross(up, zAxis);
  if (xAxis.lengthSq() < 1e-12) {
    // Looking straight along the up hint: pick any perpendicular.
    xAxis = cross(std::abs(zAxis.z) < 0.9 ? Vec3d::unitZ() : Vec3d::unitX(), zAxis);
  }
  xAxis = xAxis.normalized();
  const Vec3d yAxis = cross(zAxis, xAxis);
  return fromBasis(xAxis, yAxis, zAxis);
}

Quatd Quatd::slerp(const Quatd& a, const Quatd& b, double t) {
  t = std::clamp(t, 0.0, 1.0);

  double cosHalf = dot(a, b);
  Quatd end = b;
  if (cosHalf < 0.0) {
    end = {-b.w, -b.x, -b.y, -b.z};
    cosHalf = -cosHalf;
  }

  if (cosHalf >= 1.0 - 1e-12) return end;

  const double halfTheta = std::acos(std::min(cosHalf, 1.0));
  const double sinHalf = std::sqrt(1.0 - cosHalf * cosHalf);

  if (sinHalf < 1e-6) {
    return Quatd{
      a.w * 0.5 + end.w * 0.5,
      a.x * 0.5 + end.x * 0.5,
      a.y * 0.5 + end.y * 0.5,
      a.z * 0.5 + end.z * 0.5
    }.normalized();
  }

  const double ra = std::sin((1.0 - t) * halfTheta) / sinHalf;
  const double rb = std::sin(t * halfTheta) / sinHalf;
  return Quatd{
    a.w * ra + end.w * rb,
    a.x * ra + end.x * rb,
    a.y * ra + end.y * rb,
    a.z * ra + end.z * rb
  }.normalized();
}

double angleBetween(const Quatd& a, const Quatd& b) {
  const double d = std::min(std::abs(dot(a.normalized(), b.normalized())), 1.0);
  return 2.0 * std::acos(d);
}

} // namespace warpcore::math
