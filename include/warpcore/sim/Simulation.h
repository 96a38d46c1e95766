#pragma once

#include "warpcore/core/Random.h"
#include "warpcore/core/Types.h"
#include "warpcore/sim/CameraRig.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/Events.h"
#include "warpcore/sim/FlightController.h"
#include "warpcore/sim/Pose.h"
#include "warpcore/sim/SaveGame.h"
#include "warpcore/sim/Scanner.h"
#include "warpcore/sim/ShipSystems.h"
#include "warpcore/sim/TargetHealth.h"
#include "warpcore/sim/Tuning.h"
#include "warpcore/sim/WarpDrive.h"
#include "warpcore/sim/Weapons.h"

#include <optional>
#include <string>
#include <string_view>

namespace warpcore::sim {

// One ship in one catalog. Owns the pose and hands it to exactly one writer
// per tick: the flight controller while the warp drive is idle, the drive
// otherwise. Components report through events(); attach an Announcer or a
// RecordingEventSink there.
class Simulation {
public:
  explicit Simulation(Catalog catalog, SimTuning tuning = {}, core::u64 seed = 1);

  // Components keep pointers into this object.
  Simulation(const Simulation&) = delete;
  Simulation& operator=(const Simulation&) = delete;

  void tick(double dtSeconds, const FlightInput& input = {});

  // Helm
  bool engageWarp(std::string_view destinationId);
  bool disengageWarp();
  bool skipToDestination();
  void setWarpLevel(int level);

  // Tactical
  bool cycleTarget();
  void clearTarget() { weapons_.clearTarget(); }
  bool setPhasers(bool active);
  bool fireTorpedo();

  // Science. Scans the selected target, or selects and scans the nearest body.
  bool startScan();
  void cancelScan() { scanner_.cancelScan(); }
  void resetScanner() { scanner_.reset(); }

  // Damage sources
  void handleDebrisCollision();
  void damageShields(double amount, std::optional<ShieldQuadrant> quadrant = std::nullopt);
  void damageHull(double amount);

  // Engineering
  void damageSystem(std::string_view id, double amount) { ship_.damageSystem(id, amount); }
  bool toggleSystem(std::string_view id, std::optional<bool> active = std::nullopt) {
    return ship_.toggleSystem(id, active);
  }
  void repairSystem(std::string_view id, double amount) { ship_.repairSystem(id, amount); }
  void repairHull(double amount) { ship_.repairHull(amount); }
  void resetSystems() { ship_.resetSystems(); }

  // Hostile contacts are scripted by the host; new ones become destructible.
  void addContact(Contact contact);
  bool moveContact(std::string_view id, const math::Vec3d& position);

  // Camera
  void setCameraMode(CameraMode mode) { cameraMode_ = setMode(cameraMode_, mode); }
  void toggleCameraMode(CameraMode mode) { cameraMode_ = toggleMode(cameraMode_, mode); }
  const CameraModeState& cameraMode() const { return cameraMode_; }
  CameraRig& camera() { return camera_; }
  const CameraRig& camera() const { return camera_; }

  // Selected target resolved against the catalog, if it still exists.
  std::optional<TargetRef> selectedTarget() const;

  const Pose& pose() const { return pose_; }
  const Catalog& catalog() const { return catalog_; }
  const FlightController& flight() const { return flight_; }
  const WarpDrive& warp() const { return warp_; }
  const ShipSystems& ship() const { return ship_; }
  const Weapons& weapons() const { return weapons_; }
  const Scanner& scanner() const { return scanner_; }
  const TargetHealth& targets() const { return targets_; }

  EventFanout& events() { return events_; }

  double elapsedSeconds() const { return elapsed_; }
  core::u64 tickCount() const { return ticks_; }
  core::u64 seed() const { return seed_; }

  const SimTuning& tuning() const { return tuning_; }
  void setTuning(const SimTuning& tuning);

  SimSnapshot snapshot() const;
  // Refuses snapshots from a newer format. Contacts are matched by id.
  bool restore(const SimSnapshot& s, std::string* outError = nullptr);

private:
  std::optional<TargetCandidate> candidateFor(std::string_view id) const;
  bool targetable(std::string_view id) const;
  void setActivity(std::string_view id, bool active);

  SimTuning tuning_{};
  Catalog catalog_;
  core::u64 seed_{1};

  core::SplitMix64 systemsRng_;
  core::SplitMix64 cameraRng_;

  EventFanout events_;

  Pose pose_{};
  FlightController flight_;
  WarpDrive warp_;
  ShipSystems ship_;
  Weapons weapons_;
  Scanner scanner_;
  TargetHealth targets_;

  CameraModeState cameraMode_{};
  CameraRig camera_;

  double elapsed_{0.0};
  core::u64 ticks_{0};
};

} // namespace warpcore::sim
