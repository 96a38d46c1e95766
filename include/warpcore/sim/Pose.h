#pragma once

#include "warpcore/math/Quat.h"
#include "warpcore/math/Vec3.h"

namespace warpcore::sim {

// Ship kinematic state. The quaternion is the only stored orientation;
// Euler angles are derived when needed.
struct Pose {
  math::Vec3d position{0, 0, 0};
  math::Quatd rotation{1, 0, 0, 0};
  math::Vec3d velocity{0, 0, 0};        // units/s
  math::Vec3d angularVelocity{0, 0, 0}; // rad/s about (pitch, yaw, roll)

  math::EulerAngles euler() const { return rotation.toEuler(); }
  math::Vec3d forward() const { return rotation.forward(); }
  math::Vec3d right() const { return rotation.right(); }
  math::Vec3d up() const { return rotation.up(); }

  // Local-frame offset to world space.
  math::Vec3d toWorld(const math::Vec3d& local) const { return position + rotation.rotate(local); }
};

} // namespace warpcore::sim
