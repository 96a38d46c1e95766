#include "warpcore/sim/FlightController.h"

#include <algorithm>
#include <cmath>

namespace warpcore::sim {

void FlightController::fullStop() {
  state_.targetImpulse = 0.0;
  state_.impulsePercent = 0.0;
  state_.speed = 0.0;
}

Pose FlightController::initialPose(const FlightParams& params) {
  Pose p;
  p.rotation = math::Quatd::fromEuler({0.0, params.initialYaw, 0.0});
  return p;
}

void FlightController::update(double dtSeconds, const FlightInput& input, Pose& pose) {
  if (state_.warping || !input.enabled) return;

  const double dt = math::clamp(dtSeconds, 0.0, params_.maxDeltaSeconds);
  if (dt <= 0.0) return;

  const double thrust = math::clamp(input.thrust, -1.0, 1.0);
  const double strafe = math::clamp(input.strafe, -1.0, 1.0);
  const double yaw = math::clamp(input.yaw, -1.0, 1.0);
  const double pitch = math::clamp(input.pitch, -1.0, 1.0);
  const double roll = math::clamp(input.roll, -1.0, 1.0);

  // Rotation
  const math::Vec3d rates{pitch * params_.turnRate, yaw * params_.turnRate, roll * params_.rollRate};

  math::EulerAngles e = pose.rotation.toEuler();
  e.pitch = math::clamp(e.pitch + rates.x * dt, -params_.maxPitch, params_.maxPitch);
  e.yaw += rates.y * dt;
  e.roll = math::clamp(e.roll + rates.z * dt, -params_.maxRoll, params_.maxRoll);
  if (e.yaw > math::pi) e.yaw -= math::twoPi;
  if (e.yaw < -math::pi) e.yaw += math::twoPi;

  pose.rotation = math::Quatd::fromEuler(e).normalized();
  pose.angularVelocity = rates;

  // Throttle
  if (thrust > 0.0) {
    state_.targetImpulse = std::min(state_.targetImpulse + params_.acceleration * dt * 10.0 * thrust, 100.0);
  } else if (thrust < 0.0) {
    state_.targetImpulse = std::max(state_.targetImpulse + params_.deceleration * dt * 10.0 * thrust, 0.0);
  }

  if (input.fullStop) {
    state_.targetImpulse = 0.0;
    state_.impulsePercent = 0.0;
  }

  const double diff = state_.targetImpulse - state_.impulsePercent;
  if (std::abs(diff) > 0.1) {
    const double rate = (diff > 0.0) ? params_.acceleration : params_.deceleration;
    const double step = rate * dt * 5.0;
    if (step >= std::abs(diff)) {
      state_.impulsePercent = state_.targetImpulse;
    } else {
      state_.impulsePercent = math::clamp(state_.impulsePercent + math::sign(diff) * step, 0.0, 100.0);
    }
  } else {
    state_.impulsePercent = state_.targetImpulse;
  }

  state_.speed = (state_.impulsePercent / 100.0) * params_.maxImpulseSpeed;

  // Translation
  const double lateral = strafe * params_.strafeFactor * params_.maxImpulseSpeed;
  pose.velocity = pose.rotation.forward() * state_.speed + pose.rotation.right() * lateral;
  pose.position += pose.velocity * dt;

  // Coasting bleeds the throttle target.
  if (thrust == 0.0) {
    state_.targetImpulse *= std::pow(params_.damping, dt * 60.0);
    if (state_.targetImpulse < 0.5) state_.targetImpulse = 0.0;
  }
}

} // namespace warpcore::sim
