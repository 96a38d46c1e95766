#pragma once

#include "warpcore/core/Random.h"
#include "warpcore/core/Types.h"
#include "warpcore/math/Vec3.h"
#include "warpcore/sim/Pose.h"
#include "warpcore/sim/WarpDrive.h"

#include <algorithm>
#include <optional>
#include <string_view>

namespace warpcore::sim {

enum class CameraMode : core::u8 {
  Flight = 0,
  FreeLook,
  Cinematic,
  Photo,
};

std::string_view toString(CameraMode m);

struct CameraModeState {
  CameraMode mode{CameraMode::Flight};
  CameraMode previousMode{CameraMode::Flight};

  bool flightEnabled() const { return mode == CameraMode::Flight; }
  bool orbitEnabled() const { return mode == CameraMode::FreeLook || mode == CameraMode::Photo; }
  bool showUi() const { return mode != CameraMode::Photo; }
};

// Pure transitions.
CameraModeState setMode(const CameraModeState& s, CameraMode mode);
// Selecting the active mode again goes back to the previous one (or flight).
CameraModeState toggleMode(const CameraModeState& s, CameraMode mode);

enum class CameraRigKind : core::u8 {
  Chase = 0,
  Cinematic,
  WarpCinematic,
  Orbit,
};

std::string_view toString(CameraRigKind k);

// Exactly one rig per frame: orbit modes win, then any warp phase, then the
// cinematic mode, otherwise chase.
CameraRigKind selectRig(const CameraModeState& mode, WarpPhase phase);

// All rates are per second.
struct CameraParams {
  math::Vec3d chaseOffset{0.0, 0.7, 2.5};      // ship frame, behind and above
  math::Vec3d chaseLookAhead{0.0, 0.3, -8.0};
  double chaseLookRate{16.5};

  double cinematicOrbitSpeed{0.2};             // rad/s
  double cinematicFollowRate{2.0};

  double warpFollowRate{3.08};                 // non-snapping warp phases
  double warpPullBackSeconds{1.0};             // accelerating pull-back ramp
  double warpSettleSeconds{1.2};               // decelerating return ramp

  math::Vec3d orbitInitialOffset{2.5, 1.8, 3.5};
  double orbitMinDistance{0.5};
  double orbitMaxDistance{30.0};
  double orbitPolarMargin{0.1};                // keep off the poles
  bool orbitFreezeTarget{true};

  double shakeDecay{2.0};                      // intensity/s
};

struct CameraView {
  math::Vec3d position{0.0, 1.2, 4.0};
  math::Vec3d lookAt{0.0, 0.0, 0.0};
  CameraRigKind rig{CameraRigKind::Chase};
};

// Read-side camera driver. Reads the ship pose and discrete state, never
// writes simulation state.
class CameraRig {
public:
  explicit CameraRig(CameraParams params = {}, core::RandomSource* rng = nullptr)
      : params_(params), rng_(rng) {}

  const CameraView& update(double dtSeconds, const Pose& ship, WarpPhase phase, const CameraModeState& mode);

  void addShake(double intensity) { shake_ = std::max(shake_, intensity); }
  double shake() const { return shake_; }

  // Orbit-rig input (drag / wheel). Ignored by the other rigs.
  void orbitRotate(double dAzimuth, double dPolar);
  void orbitZoom(double factor);
  double orbitDistance() const { return orbitDistance_; }
  const std::optional<math::Vec3d>& frozenTarget() const { return frozenTarget_; }

  const CameraView& view() const { return view_; }

  const CameraParams& params() const { return params_; }
  void setParams(const CameraParams& p) { params_ = p; }

  void setRandom(core::RandomSource* rng) { rng_ = rng; }

private:
  void enterRig(CameraRigKind rig, const Pose& ship, const CameraModeState& mode);
  void updateChase(double dt, const Pose& ship);
  void updateCinematic(double dt, const Pose& ship);
  void updateWarp(double dt, const Pose& ship, WarpPhase phase);
  void updateOrbit(const Pose& ship);

  CameraParams params_{};
  core::RandomSource* rng_{nullptr};

  CameraView view_{};
  bool started_{false};
  double clock_{0.0};
  double shake_{0.0};

  double cinematicAngle_{0.0};

  WarpPhase lastWarpPhase_{WarpPhase::Idle};
  double warpPhaseTime_{0.0};

  double orbitAzimuth_{0.0};
  double orbitPolar_{1.0};
  double orbitDistance_{5.0};
  std::optional<math::Vec3d> frozenTarget_;
};

} // namespace warpcore::sim
