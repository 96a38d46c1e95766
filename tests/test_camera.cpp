#include "warpcore/math/Math.h"
#include "warpcore/sim/CameraRig.h"

#include <cmath>
#include <iostream>

static bool nearly(const warpcore::math::Vec3d& a, const warpcore::math::Vec3d& b, double eps = 1e-9) {
  return std::abs(a.x - b.x) <= eps && std::abs(a.y - b.y) <= eps && std::abs(a.z - b.z) <= eps;
}

int test_camera() {
  int fails = 0;

  using namespace warpcore;
  using namespace warpcore::sim;

  // Mode transitions
  {
    CameraModeState s;
    const CameraModeState cine = setMode(s, CameraMode::Cinematic);
    if (cine.mode != CameraMode::Cinematic || cine.previousMode != CameraMode::Flight || cine.flightEnabled()) {
      std::cerr << "[test_camera] setMode cinematic wrong\n";
      ++fails;
    }
    const CameraModeState same = setMode(cine, CameraMode::Cinematic);
    if (same.mode != CameraMode::Cinematic || same.previousMode != CameraMode::Flight) {
      std::cerr << "[test_camera] setMode to the active mode should change nothing\n";
      ++fails;
    }

    const CameraModeState look = toggleMode(s, CameraMode::FreeLook);
    const CameraModeState back = toggleMode(look, CameraMode::FreeLook);
    if (look.mode != CameraMode::FreeLook || !look.orbitEnabled() || back.mode != CameraMode::Flight
        || back.previousMode != CameraMode::FreeLook) {
      std::cerr << "[test_camera] free-look toggle should round trip through flight\n";
      ++fails;
    }

    const CameraModeState photo = toggleMode(cine, CameraMode::Photo);
    if (photo.mode != CameraMode::Photo || photo.showUi() || !photo.orbitEnabled()
        || toggleMode(photo, CameraMode::Photo).mode != CameraMode::Cinematic) {
      std::cerr << "[test_camera] photo toggle should hide the UI and return to cinematic\n";
      ++fails;
    }
  }

  // Rig priority: orbit, then warp, then cinematic, then chase.
  {
    CameraModeState flight;
    const CameraModeState freeLook = setMode(flight, CameraMode::FreeLook);
    const CameraModeState cine = setMode(flight, CameraMode::Cinematic);

    if (selectRig(freeLook, WarpPhase::Cruising) != CameraRigKind::Orbit
        || selectRig(cine, WarpPhase::Charging) != CameraRigKind::WarpCinematic
        || selectRig(flight, WarpPhase::Arriving) != CameraRigKind::WarpCinematic
        || selectRig(cine, WarpPhase::Idle) != CameraRigKind::Cinematic
        || selectRig(flight, WarpPhase::Idle) != CameraRigKind::Chase) {
      std::cerr << "[test_camera] selectRig priority wrong\n";
      ++fails;
    }
  }

  // Chase translation is hard-locked to the ship.
  {
    CameraRig rig;
    Pose ship;
    const CameraModeState flight;
    rig.update(1.0 / 60.0, ship, WarpPhase::Idle, flight);
    if (rig.view().rig != CameraRigKind::Chase || !nearly(rig.view().position, {0.0, 0.7, 2.5})) {
      std::cerr << "[test_camera] chase should sit behind and above\n";
      ++fails;
    }

    // Yawed left 90 degrees: behind the ship is now +X.
    ship.rotation = math::Quatd::fromEuler({0.0, math::halfPi, 0.0});
    ship.position = {5.0, 0.0, 0.0};
    rig.update(1.0 / 60.0, ship, WarpPhase::Idle, flight);
    if (!nearly(rig.view().position, {7.5, 0.7, 0.0}, 1e-9)) {
      std::cerr << "[test_camera] chase did not follow the turn\n";
      ++fails;
    }
  }

  // Warp pull-back snaps to the ship while accelerating.
  {
    CameraRig rig;
    Pose ship;
    const CameraModeState flight;
    rig.update(0.1, ship, WarpPhase::Accelerating, flight);
    if (rig.view().rig != CameraRigKind::WarpCinematic || !nearly(rig.view().position, {0.0, 2.0, 4.0})) {
      std::cerr << "[test_camera] accelerating should start close behind\n";
      ++fails;
    }
    rig.update(0.5, ship, WarpPhase::Accelerating, flight);
    if (!nearly(rig.view().position, {0.0, 2.0, 8.0})) {
      std::cerr << "[test_camera] accelerating pull-back should be half way after 0.5s\n";
      ++fails;
    }
  }

  // Orbit freezes its subject and unfreezes on leaving.
  {
    CameraRig rig;
    Pose ship;
    ship.position = {10.0, 0.0, 0.0};
    const CameraModeState freeLook = setMode(CameraModeState{}, CameraMode::FreeLook);

    rig.update(0.1, ship, WarpPhase::Idle, freeLook);
    if (!rig.frozenTarget() || !nearly(*rig.frozenTarget(), {10.0, 0.0, 0.0})) {
      std::cerr << "[test_camera] orbit should freeze the ship position\n";
      ++fails;
    }
    const double expectedDistance = math::Vec3d{2.5, 1.8, 3.5}.length();
    if (std::abs(rig.view().position.distanceTo({10.0, 0.0, 0.0}) - expectedDistance) > 1e-9) {
      std::cerr << "[test_camera] orbit should start at the initial offset distance\n";
      ++fails;
    }

    ship.position = {20.0, 0.0, 0.0};
    rig.update(0.1, ship, WarpPhase::Idle, freeLook);
    if (!nearly(rig.view().lookAt, {10.0, 0.0, 0.0})) {
      std::cerr << "[test_camera] frozen orbit followed the ship\n";
      ++fails;
    }

    rig.orbitZoom(100.0);
    if (rig.orbitDistance() != 30.0) {
      std::cerr << "[test_camera] zoom should clamp to the max distance\n";
      ++fails;
    }
    rig.orbitZoom(0.0);
    rig.orbitZoom(0.001);
    if (rig.orbitDistance() != 0.5) {
      std::cerr << "[test_camera] zoom should clamp to the min distance\n";
      ++fails;
    }

    rig.update(0.1, ship, WarpPhase::Idle, CameraModeState{});
    if (rig.frozenTarget() || rig.view().rig != CameraRigKind::Chase) {
      std::cerr << "[test_camera] leaving orbit should release the frozen target\n";
      ++fails;
    }
  }

  // Shake keeps the strongest request and decays linearly.
  {
    CameraRig rig;
    const Pose ship;
    const CameraModeState flight;
    rig.addShake(5.0);
    rig.update(1.0, ship, WarpPhase::Idle, flight);
    rig.addShake(1.0);
    if (std::abs(rig.shake() - 3.0) > 1e-12) {
      std::cerr << "[test_camera] shake expected 3 got " << rig.shake() << "\n";
      ++fails;
    }
    rig.update(2.0, ship, WarpPhase::Idle, flight);
    if (rig.shake() != 0.0) {
      std::cerr << "[test_camera] shake should decay to zero\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_camera] pass\n";
  return fails;
}
