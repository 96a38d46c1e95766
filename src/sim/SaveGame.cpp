#include "warpcore/sim/SaveGame.h"

#include "warpcore/core/Log.h"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace warpcore::sim {
namespace {

// Reals go through strtod so "inf" (an undefined ETA) survives a round trip.
// A token that is not entirely a number fails the stream.
double readReal(std::istream& in) {
  std::string tok;
  if (!(in >> tok)) return 0.0;
  char* end = nullptr;
  const double v = std::strtod(tok.c_str(), &end);
  if (end == tok.c_str() || *end != '\0') {
    in.setstate(std::ios::failbit);
    return 0.0;
  }
  return v;
}

void readVec(std::istream& in, math::Vec3d& v) {
  v.x = readReal(in);
  v.y = readReal(in);
  v.z = readReal(in);
}

void readQuat(std::istream& in, math::Quatd& q) {
  q.w = readReal(in);
  q.x = readReal(in);
  q.y = readReal(in);
  q.z = readReal(in);
}

bool readBool(std::istream& in) {
  int v = 0;
  in >> v;
  return v != 0;
}

template <typename E>
E readEnum(std::istream& in, int maxValue) {
  int v = 0;
  in >> v;
  return (E)std::clamp(v, 0, maxValue);
}

void writeVec(std::ostream& f, const math::Vec3d& v) {
  f << v.x << " " << v.y << " " << v.z;
}

void writeQuat(std::ostream& f, const math::Quatd& q) {
  f << q.w << " " << q.x << " " << q.y << " " << q.z;
}

void fail(std::string* outError, const std::string& msg, core::LogLevel level) {
  core::log(level, "SaveGame: " + msg);
  if (outError) *outError = msg;
}

} // namespace

bool saveToFile(const SimSnapshot& s, const std::string& path, std::string* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    fail(outError, "failed to open file for writing: " + path, core::LogLevel::Error);
    return false;
  }

  // Full precision: a restored session must tick exactly like the original.
  f.precision(17);

  f << "WarpcoreSave " << s.version << "\n";
  f << "seed " << s.seed << "\n";
  f << "rng " << s.systemsRngState << " " << s.cameraRngState << "\n";
  f << "elapsed " << s.elapsedSeconds << " " << s.tickCount << "\n";

  // Ship
  f << "pose ";
  writeVec(f, s.pose.position);
  f << " ";
  writeQuat(f, s.pose.rotation);
  f << " ";
  writeVec(f, s.pose.velocity);
  f << " ";
  writeVec(f, s.pose.angularVelocity);
  f << "\n";

  f << "flight " << s.flight.targetImpulse << " " << s.flight.impulsePercent << " "
    << s.flight.speed << " " << (s.flight.warping ? 1 : 0) << "\n";

  // Warp
  const WarpSession& w = s.warp;
  f << "warp " << (int)w.phase << " " << w.warpLevel << " " << w.warpSpeed << " "
    << std::quoted(w.destinationId) << "\n";
  f << "warpPath ";
  writeVec(f, w.origin);
  f << " ";
  writeVec(f, w.destinationCenter);
  f << " ";
  writeVec(f, w.destinationArrival);
  f << " ";
  writeQuat(f, w.facing);
  f << "\n";
  f << "warpProgress " << w.totalDistance << " " << w.distanceRemaining << " " << w.progress << " "
    << w.elapsedInPhase << " " << w.eta << " " << (w.aligned ? 1 : 0) << " "
    << (w.braceAnnounced ? 1 : 0) << "\n";

  // Shields, hull, subsystems
  const ShipSystemsState& sh = s.ship;
  f << "shields";
  for (double q : sh.shields.quadrants) f << " " << q;
  f << " " << (sh.shieldsOnline ? 1 : 0) << "\n";
  f << "hull " << sh.hull << " " << sh.secondsSinceDamage << " " << (int)sh.lastAlert << "\n";
  f << "subsystems " << sh.subsystems.size() << "\n";
  for (const auto& [id, sys] : sh.subsystems) {
    f << "subsystem " << id << " " << std::quoted(sys.name) << " "
      << (int)sys.status << " " << sys.power << " " << sys.maxPower << " "
      << sys.chargeRate << " " << sys.drainRate << " " << (sys.active ? 1 : 0) << "\n";
  }

  // Weapons
  const WeaponsState& wp = s.weapons;
  f << "phasers " << wp.phaserHeat << " " << (wp.phaserOverheated ? 1 : 0) << " "
    << (wp.firingPhasers ? 1 : 0) << "\n";
  f << "launcher " << wp.torpedoCount << " " << (wp.torpedoLoading ? 1 : 0) << " "
    << wp.reloadRemaining << " " << wp.nextTorpedoId << "\n";
  f << "target " << std::quoted(wp.targetId) << "\n";
  f << "torpedoes " << wp.torpedoes.size() << "\n";
  for (const auto& t : wp.torpedoes) {
    f << "torpedo " << t.id << " ";
    writeVec(f, t.position);
    f << " ";
    writeVec(f, t.velocity);
    f << " " << std::quoted(t.targetId) << " " << t.age << "\n";
  }

  // Scanner
  const ScanSession& sc = s.scan;
  f << "scan " << (sc.scanning ? 1 : 0) << " " << sc.progress << " " << std::quoted(sc.targetId) << " "
    << (sc.complete ? 1 : 0) << " " << (int)sc.error << "\n";
  if (sc.result) {
    const ScanPayload& p = *sc.result;
    f << "scanResult " << std::quoted(p.population) << " " << std::quoted(p.atmosphereDetails) << " "
      << std::quoted(p.threatLevel) << " " << std::quoted(p.lifeSigns) << " "
      << std::quoted(p.tacticalAnalysis) << " " << p.resources.size();
    for (const auto& r : p.resources) f << " " << std::quoted(r);
    f << "\n";
  }

  // Destructible targets
  f << "healthRecords " << s.targets.size() << "\n";
  for (const auto& [id, r] : s.targets) {
    f << "health " << id << " " << r.health << " " << r.maxHealth << " " << (int)r.state << " "
      << r.explosionProgress << " " << r.debrisElapsed << " " << r.respawnProgress << "\n";
  }

  f << "contacts " << s.contacts.size() << "\n";
  for (const auto& c : s.contacts) {
    f << "contact " << c.id << " " << std::quoted(c.name) << " ";
    writeVec(f, c.position);
    f << " " << c.radius << " " << (c.alive ? 1 : 0) << "\n";
  }

  f << "cameraMode " << (int)s.cameraMode.mode << " " << (int)s.cameraMode.previousMode << "\n";

  if (!f) {
    fail(outError, "write failed: " + path, core::LogLevel::Error);
    return false;
  }
  return true;
}

bool loadFromFile(const std::string& path, SimSnapshot& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    fail(outError, "file not found: " + path, core::LogLevel::Warn);
    return false;
  }

  std::string header;
  if (!(f >> header) || header != "WarpcoreSave") {
    fail(outError, "bad header in " + path, core::LogLevel::Error);
    return false;
  }

  int version = 0;
  if (!(f >> version)) {
    fail(outError, "missing version in " + path, core::LogLevel::Error);
    return false;
  }
  if (version > kSaveVersion) {
    fail(outError, "unsupported save version " + std::to_string(version), core::LogLevel::Error);
    return false;
  }

  SimSnapshot s{};
  s.version = version;

  std::string key;
  while (f >> key) {
    if (key == "seed") {
      f >> s.seed;
    } else if (key == "rng") {
      f >> s.systemsRngState >> s.cameraRngState;
    } else if (key == "elapsed") {
      s.elapsedSeconds = readReal(f);
      f >> s.tickCount;
    } else if (key == "pose") {
      readVec(f, s.pose.position);
      readQuat(f, s.pose.rotation);
      readVec(f, s.pose.velocity);
      readVec(f, s.pose.angularVelocity);
    } else if (key == "flight") {
      s.flight.targetImpulse = readReal(f);
      s.flight.impulsePercent = readReal(f);
      s.flight.speed = readReal(f);
      s.flight.warping = readBool(f);
    } else if (key == "warp") {
      s.warp.phase = readEnum<WarpPhase>(f, (int)WarpPhase::Arriving);
      f >> s.warp.warpLevel;
      s.warp.warpSpeed = readReal(f);
      f >> std::quoted(s.warp.destinationId);
    } else if (key == "warpPath") {
      readVec(f, s.warp.origin);
      readVec(f, s.warp.destinationCenter);
      readVec(f, s.warp.destinationArrival);
      readQuat(f, s.warp.facing);
    } else if (key == "warpProgress") {
      s.warp.totalDistance = readReal(f);
      s.warp.distanceRemaining = readReal(f);
      s.warp.progress = readReal(f);
      s.warp.elapsedInPhase = readReal(f);
      s.warp.eta = readReal(f);
      s.warp.aligned = readBool(f);
      s.warp.braceAnnounced = readBool(f);
    } else if (key == "shields") {
      for (double& q : s.ship.shields.quadrants) q = readReal(f);
      s.ship.shields.recompute();
      s.ship.shieldsOnline = readBool(f);
    } else if (key == "hull") {
      s.ship.hull = readReal(f);
      s.ship.secondsSinceDamage = readReal(f);
      s.ship.lastAlert = readEnum<AlertLevel>(f, (int)AlertLevel::Red);
    } else if (key == "subsystems") {
      std::size_t count = 0;
      f >> count;
      s.ship.subsystems.clear();
    } else if (key == "subsystem") {
      Subsystem sys;
      f >> sys.id >> std::quoted(sys.name);
      sys.status = readEnum<SystemStatus>(f, (int)SystemStatus::Charging);
      sys.power = readReal(f);
      sys.maxPower = readReal(f);
      sys.chargeRate = readReal(f);
      sys.drainRate = readReal(f);
      sys.active = readBool(f);
      std::string id = sys.id;
      s.ship.subsystems[id] = std::move(sys);
    } else if (key == "phasers") {
      s.weapons.phaserHeat = readReal(f);
      s.weapons.phaserOverheated = readBool(f);
      s.weapons.firingPhasers = readBool(f);
    } else if (key == "launcher") {
      f >> s.weapons.torpedoCount;
      s.weapons.torpedoLoading = readBool(f);
      s.weapons.reloadRemaining = readReal(f);
      f >> s.weapons.nextTorpedoId;
    } else if (key == "target") {
      f >> std::quoted(s.weapons.targetId);
    } else if (key == "torpedoes") {
      std::size_t count = 0;
      f >> count;
      s.weapons.torpedoes.clear();
      s.weapons.torpedoes.reserve(count);
    } else if (key == "torpedo") {
      Torpedo t;
      f >> t.id;
      readVec(f, t.position);
      readVec(f, t.velocity);
      f >> std::quoted(t.targetId);
      t.age = readReal(f);
      s.weapons.torpedoes.push_back(std::move(t));
    } else if (key == "scan") {
      s.scan.scanning = readBool(f);
      s.scan.progress = readReal(f);
      f >> std::quoted(s.scan.targetId);
      s.scan.complete = readBool(f);
      s.scan.error = readEnum<ScanError>(f, (int)ScanError::SignalLost);
    } else if (key == "scanResult") {
      ScanPayload p;
      std::size_t count = 0;
      f >> std::quoted(p.population) >> std::quoted(p.atmosphereDetails) >> std::quoted(p.threatLevel)
        >> std::quoted(p.lifeSigns) >> std::quoted(p.tacticalAnalysis) >> count;
      for (std::size_t i = 0; i < count && f; ++i) {
        std::string r;
        f >> std::quoted(r);
        p.resources.push_back(std::move(r));
      }
      s.scan.result = std::move(p);
    } else if (key == "healthRecords") {
      std::size_t count = 0;
      f >> count;
      s.targets.clear();
    } else if (key == "health") {
      TargetHealthRecord r;
      f >> r.id;
      r.health = readReal(f);
      r.maxHealth = readReal(f);
      r.state = readEnum<DamageState>(f, (int)DamageState::Respawning);
      r.explosionProgress = readReal(f);
      r.debrisElapsed = readReal(f);
      r.respawnProgress = readReal(f);
      std::string id = r.id;
      s.targets[id] = std::move(r);
    } else if (key == "contacts") {
      std::size_t count = 0;
      f >> count;
      s.contacts.clear();
      s.contacts.reserve(count);
    } else if (key == "contact") {
      Contact c;
      f >> c.id >> std::quoted(c.name);
      readVec(f, c.position);
      c.radius = readReal(f);
      c.alive = readBool(f);
      s.contacts.push_back(std::move(c));
    } else if (key == "cameraMode") {
      s.cameraMode.mode = readEnum<CameraMode>(f, (int)CameraMode::Photo);
      s.cameraMode.previousMode = readEnum<CameraMode>(f, (int)CameraMode::Photo);
    } else {
      // Unknown key: skip rest of line
      std::string line;
      std::getline(f, line);
    }

    if (f.fail()) {
      fail(outError, "malformed record '" + key + "' in " + path, core::LogLevel::Error);
      return false;
    }
  }

  out = std::move(s);
  return true;
}

} // namespace warpcore::sim
