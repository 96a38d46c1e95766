#pragma once

#include "warpcore/math/Math.h"
#include "warpcore/sim/Pose.h"

namespace warpcore::sim {

struct FlightParams {
  double maxImpulseSpeed{20.0}; // units/s at 100% impulse
  double acceleration{10.0};
  double deceleration{5.0};
  double turnRate{0.6};         // rad/s (yaw and pitch)
  double rollRate{0.8};         // rad/s
  double damping{0.98};         // throttle decay per 60 Hz frame while coasting
  double strafeFactor{0.5};     // lateral speed as a fraction of max impulse
  double maxRoll{math::pi / 4.0};
  double maxPitch{85.0 * math::pi / 180.0};
  double maxDeltaSeconds{0.1};
  double initialYaw{0.1 * math::pi};
};

// Per-frame pilot intent. Axes are in [-1, 1]; larger values are clamped.
struct FlightInput {
  double thrust{0.0}; // + forward, - backward
  double strafe{0.0}; // + right
  double yaw{0.0};    // + turn left
  double pitch{0.0};  // + nose up
  double roll{0.0};   // + roll left
  bool fullStop{false};
  bool enabled{true};
};

struct FlightState {
  double targetImpulse{0.0};  // percent
  double impulsePercent{0.0}; // percent
  double speed{0.0};          // units/s along forward
  bool warping{false};
};

// Sub-light flight. Integrates throttle into impulse speed and stick input
// into orientation. While warping it does nothing, so impulse neither builds
// nor decays until warp ends.
class FlightController {
public:
  explicit FlightController(FlightParams params = {}) : params_(params) {}

  void update(double dtSeconds, const FlightInput& input, Pose& pose);

  void setWarping(bool warping) { state_.warping = warping; }
  bool warping() const { return state_.warping; }

  void fullStop();

  double impulsePercent() const { return state_.impulsePercent; }
  double speed() const { return state_.speed; }

  const FlightState& state() const { return state_; }
  void setState(const FlightState& s) { state_ = s; }

  const FlightParams& params() const { return params_; }
  void setParams(const FlightParams& p) { params_ = p; }

  // Spawn pose: origin, level, yawed by params.initialYaw.
  static Pose initialPose(const FlightParams& params);

private:
  FlightParams params_{};
  FlightState state_{};
};

} // namespace warpcore::sim
