#pragma once

#include "warpcore/sim/CameraRig.h"
#include "warpcore/sim/FlightController.h"
#include "warpcore/sim/Scanner.h"
#include "warpcore/sim/ShipSystems.h"
#include "warpcore/sim/TargetHealth.h"
#include "warpcore/sim/VoiceLines.h"
#include "warpcore/sim/WarpDrive.h"
#include "warpcore/sim/Weapons.h"

#include <string>

namespace warpcore::sim {

struct SimulationParams {
  double maxTickSeconds{0.25};        // longer frames are clamped
  double impactShake{5.0};            // camera shake on torpedo hits and debris
};

// Every balance constant in one place.
struct SimTuning {
  SimulationParams sim{};
  FlightParams flight{};
  WarpParams warp{};
  ShipSystemsParams ship{};
  WeaponsParams weapons{};
  ScannerParams scanner{};
  TargetHealthParams targets{};
  CameraParams camera{};
  AnnouncerParams announcer{};
};

// Plain text, one `section.key value` per line, '#' starts a comment.
// Vector values take three numbers. Unknown keys are logged and skipped; a
// malformed value fails the whole load and leaves `out` untouched.
bool loadTuning(const std::string& path, SimTuning& out, std::string* outError = nullptr);

// Writes every key with its current value.
bool saveTuning(const SimTuning& tuning, const std::string& path, std::string* outError = nullptr);

} // namespace warpcore::sim
