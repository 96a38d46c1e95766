#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/sim/CameraRig.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/FlightController.h"
#include "warpcore/sim/Pose.h"
#include "warpcore/sim/Scanner.h"
#include "warpcore/sim/ShipSystems.h"
#include "warpcore/sim/TargetHealth.h"
#include "warpcore/sim/WarpDrive.h"
#include "warpcore/sim/Weapons.h"

#include <string>
#include <vector>

namespace warpcore::sim {

inline constexpr int kSaveVersion = 1;

// Everything needed to resume a session and reproduce the same future ticks.
// The selected target lives in weapons.targetId.
struct SimSnapshot {
  int version{kSaveVersion};

  core::u64 seed{0};
  core::u64 systemsRngState{0}; // cascade and debris rolls
  core::u64 cameraRngState{0};

  double elapsedSeconds{0.0};
  core::u64 tickCount{0};

  Pose pose{};
  FlightState flight{};
  WarpSession warp{};
  ShipSystemsState ship{};
  WeaponsState weapons{};
  ScanSession scan{};
  TargetHealthMap targets{};

  // Host-scripted hostiles as they were at save time.
  std::vector<Contact> contacts{};

  CameraModeState cameraMode{};
};

// Text format: a "WarpcoreSave <version>" header, then one keyed record per
// line. Unknown keys are skipped so older readers tolerate newer files.
bool saveToFile(const SimSnapshot& s, const std::string& path, std::string* outError = nullptr);
bool loadFromFile(const std::string& path, SimSnapshot& out, std::string* outError = nullptr);

} // namespace warpcore::sim
