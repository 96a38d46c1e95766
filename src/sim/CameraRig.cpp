#include "warpcore/sim/CameraRig.h"

#include "warpcore/math/Math.h"

#include <cmath>

namespace warpcore::sim {

std::string_view toString(CameraMode m) {
  switch (m) {
    case CameraMode::Flight: return "flight";
    case CameraMode::FreeLook: return "freelook";
    case CameraMode::Cinematic: return "cinematic";
    case CameraMode::Photo: return "photo";
  }
  return "unknown";
}

std::string_view toString(CameraRigKind k) {
  switch (k) {
    case CameraRigKind::Chase: return "chase";
    case CameraRigKind::Cinematic: return "cinematic";
    case CameraRigKind::WarpCinematic: return "warp-cinematic";
    case CameraRigKind::Orbit: return "orbit";
  }
  return "unknown";
}

CameraModeState setMode(const CameraModeState& s, CameraMode mode) {
  if (s.mode == mode) return s;
  CameraModeState next;
  next.mode = mode;
  next.previousMode = s.mode;
  return next;
}

CameraModeState toggleMode(const CameraModeState& s, CameraMode mode) {
  CameraModeState next;
  if (s.mode == mode) {
    next.mode = (s.previousMode != mode) ? s.previousMode : CameraMode::Flight;
  } else {
    next.mode = mode;
  }
  next.previousMode = s.mode;
  return next;
}

CameraRigKind selectRig(const CameraModeState& mode, WarpPhase phase) {
  if (mode.orbitEnabled()) return CameraRigKind::Orbit;
  if (phase != WarpPhase::Idle) return CameraRigKind::WarpCinematic;
  if (mode.mode == CameraMode::Cinematic) return CameraRigKind::Cinematic;
  return CameraRigKind::Chase;
}

void CameraRig::orbitRotate(double dAzimuth, double dPolar) {
  orbitAzimuth_ += dAzimuth;
  orbitPolar_ = math::clamp(orbitPolar_ + dPolar, params_.orbitPolarMargin, math::pi - params_.orbitPolarMargin);
}

void CameraRig::orbitZoom(double factor) {
  if (factor <= 0.0) return;
  orbitDistance_ = math::clamp(orbitDistance_ * factor, params_.orbitMinDistance, params_.orbitMaxDistance);
}

void CameraRig::enterRig(CameraRigKind rig, const Pose& ship, const CameraModeState& mode) {
  switch (rig) {
    case CameraRigKind::Chase:
      view_.lookAt = ship.toWorld(params_.chaseLookAhead);
      break;

    case CameraRigKind::Orbit: {
      const math::Vec3d o = params_.orbitInitialOffset;
      orbitDistance_ = math::clamp(o.length(), params_.orbitMinDistance, params_.orbitMaxDistance);
      orbitPolar_ = math::clamp(std::acos(o.y / std::max(o.length(), 1e-9)),
                                params_.orbitPolarMargin, math::pi - params_.orbitPolarMargin);
      orbitAzimuth_ = std::atan2(o.x, o.z);
      // Inspecting modes hold the subject still.
      if (params_.orbitFreezeTarget && mode.orbitEnabled()) {
        frozenTarget_ = ship.position;
      }
      break;
    }

    default:
      break;
  }
}

const CameraView& CameraRig::update(double dtSeconds, const Pose& ship, WarpPhase phase, const CameraModeState& mode) {
  const double dt = std::max(0.0, dtSeconds);
  clock_ += dt;

  const CameraRigKind rig = selectRig(mode, phase);
  if (!started_ || rig != view_.rig) {
    if (view_.rig == CameraRigKind::Orbit && rig != CameraRigKind::Orbit) frozenTarget_.reset();
    view_.rig = rig;
    enterRig(rig, ship, mode);
    started_ = true;
  }

  if (phase != lastWarpPhase_) {
    lastWarpPhase_ = phase;
    warpPhaseTime_ = 0.0;
  } else {
    warpPhaseTime_ += dt;
  }

  switch (rig) {
    case CameraRigKind::Chase: updateChase(dt, ship); break;
    case CameraRigKind::Cinematic: updateCinematic(dt, ship); break;
    case CameraRigKind::WarpCinematic: updateWarp(dt, ship, phase); break;
    case CameraRigKind::Orbit: updateOrbit(ship); break;
  }

  shake_ = std::max(0.0, shake_ - params_.shakeDecay * dt);
  return view_;
}

void CameraRig::updateChase(double dt, const Pose& ship) {
  // Translation is locked to the ship; only the look target is smoothed.
  math::Vec3d target = ship.toWorld(params_.chaseOffset);
  if (shake_ > 0.0 && rng_) {
    target += math::Vec3d{(rng_->nextDouble01() - 0.5) * shake_,
                          (rng_->nextDouble01() - 0.5) * shake_,
                          (rng_->nextDouble01() - 0.5) * shake_};
  }
  view_.position = target;

  const math::Vec3d lookAhead = ship.toWorld(params_.chaseLookAhead);
  view_.lookAt = math::lerp(view_.lookAt, lookAhead, math::smoothingAlpha(params_.chaseLookRate, dt));
}

void CameraRig::updateCinematic(double dt, const Pose& ship) {
  cinematicAngle_ += params_.cinematicOrbitSpeed * dt;

  const double radius = 5.0 + std::sin(clock_ * 0.1) * 1.5;
  const double height = 2.0 + std::sin(clock_ * 0.15);

  const math::Vec3d target = ship.position + math::Vec3d{std::cos(cinematicAngle_) * radius,
                                                          height,
                                                          std::sin(cinematicAngle_) * radius};
  view_.position = math::lerp(view_.position, target, math::smoothingAlpha(params_.cinematicFollowRate, dt));
  view_.lookAt = ship.position;
}

void CameraRig::updateWarp(double dt, const Pose& ship, WarpPhase phase) {
  const double t = warpPhaseTime_;
  math::Vec3d target;
  math::Vec3d look;

  // World angle pi/2 is +Z, behind a ship at rest heading.
  switch (phase) {
    case WarpPhase::Charging: {
      const double angle = math::halfPi + std::sin(t * 0.5) * 0.5;
      const double height = 1.5 + std::sin(t * 0.5) * 0.3;
      target = ship.position + math::Vec3d{std::cos(angle) * 5.0, height, std::sin(angle) * 5.0};
      look = ship.position;
      break;
    }
    case WarpPhase::Accelerating: {
      const double p = std::min(t / std::max(params_.warpPullBackSeconds, 1e-6), 1.0);
      target = ship.toWorld({0.0, 2.0, 4.0 + p * 8.0});
      look = ship.toWorld({0.0, 0.0, -5.0});
      break;
    }
    case WarpPhase::Cruising: {
      const double angle = math::halfPi + std::sin(clock_ * 0.2) * 0.8;
      const double radius = 5.0 + std::sin(clock_ * 0.2) * 2.0;
      const double height = 1.5 + std::sin(clock_ * 0.3);
      target = ship.position + math::Vec3d{std::cos(angle) * radius, height, std::sin(angle) * radius};
      look = ship.position;
      break;
    }
    case WarpPhase::Decelerating: {
      const double p = std::min(t / std::max(params_.warpSettleSeconds, 1e-6), 1.0);
      target = ship.toWorld({0.0, 1.5, 6.0 - p * 2.0});
      look = ship.position;
      break;
    }
    case WarpPhase::Arriving:
      target = ship.toWorld({0.0, 1.5, 5.0});
      look = ship.toWorld({0.0, 0.0, -10.0});
      break;
    case WarpPhase::Idle:
      target = ship.toWorld({0.0, 1.2, 4.0});
      look = ship.position;
      break;
  }

  // The ship outruns any smoothing at warp speed, so snap.
  const bool snap = (phase == WarpPhase::Accelerating || phase == WarpPhase::Cruising);
  const double alpha = snap ? 1.0 : math::smoothingAlpha(params_.warpFollowRate, dt);
  view_.position = math::lerp(view_.position, target, alpha);
  view_.lookAt = math::lerp(view_.lookAt, look, alpha);
}

void CameraRig::updateOrbit(const Pose& ship) {
  const math::Vec3d center = frozenTarget_ ? *frozenTarget_ : ship.position;
  const double s = std::sin(orbitPolar_);
  view_.position = center + math::Vec3d{orbitDistance_ * s * std::sin(orbitAzimuth_),
                                        orbitDistance_ * std::cos(orbitPolar_),
                                        orbitDistance_ * s * std::cos(orbitAzimuth_)};
  view_.lookAt = center;
}

} // namespace warpcore::sim
