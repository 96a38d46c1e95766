#include "warpcore/sim/Tuning.h"

#include "warpcore/core/Log.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <type_traits>
#include <variant>
#include <vector>

namespace warpcore::sim {
namespace {

using FieldPtr = std::variant<double*, int*, bool*, math::Vec3d*>;

struct Field {
  const char* key;
  FieldPtr ptr;
};

std::vector<Field> bindFields(SimTuning& t) {
  return {
    {"sim.maxTickSeconds", &t.sim.maxTickSeconds},
    {"sim.impactShake", &t.sim.impactShake},

    {"flight.maxImpulseSpeed", &t.flight.maxImpulseSpeed},
    {"flight.acceleration", &t.flight.acceleration},
    {"flight.deceleration", &t.flight.deceleration},
    {"flight.turnRate", &t.flight.turnRate},
    {"flight.rollRate", &t.flight.rollRate},
    {"flight.damping", &t.flight.damping},
    {"flight.strafeFactor", &t.flight.strafeFactor},
    {"flight.maxRoll", &t.flight.maxRoll},
    {"flight.maxPitch", &t.flight.maxPitch},
    {"flight.maxDeltaSeconds", &t.flight.maxDeltaSeconds},
    {"flight.initialYaw", &t.flight.initialYaw},

    {"warp.baseSpeed", &t.warp.baseSpeed},
    {"warp.chargeSeconds", &t.warp.chargeSeconds},
    {"warp.accelerateSeconds", &t.warp.accelerateSeconds},
    {"warp.decelerateSeconds", &t.warp.decelerateSeconds},
    {"warp.arriveSeconds", &t.warp.arriveSeconds},
    {"warp.arrivalBuffer", &t.warp.arrivalBuffer},
    {"warp.alignRate", &t.warp.alignRate},
    {"warp.alignDot", &t.warp.alignDot},
    {"warp.braceAfterSeconds", &t.warp.braceAfterSeconds},

    {"ship.shieldRechargeRate", &t.ship.shieldRechargeRate},
    {"ship.shieldDamageCooldown", &t.ship.shieldDamageCooldown},
    {"ship.bleedThroughFraction", &t.ship.bleedThroughFraction},
    {"ship.cascadeThreshold", &t.ship.cascadeThreshold},
    {"ship.cascadeChance", &t.ship.cascadeChance},
    {"ship.cascadeFraction", &t.ship.cascadeFraction},
    {"ship.debrisShieldDamage", &t.ship.debrisShieldDamage},
    {"ship.debrisHullFraction", &t.ship.debrisHullFraction},
    {"ship.hullCriticalThreshold", &t.ship.hullCriticalThreshold},

    {"weapons.phaserHeatRate", &t.weapons.phaserHeatRate},
    {"weapons.phaserCoolRate", &t.weapons.phaserCoolRate},
    {"weapons.phaserRange", &t.weapons.phaserRange},
    {"weapons.phaserDamagePerSecond", &t.weapons.phaserDamagePerSecond},
    {"weapons.maxTorpedoes", &t.weapons.maxTorpedoes},
    {"weapons.torpedoReloadSeconds", &t.weapons.torpedoReloadSeconds},
    {"weapons.torpedoSpeed", &t.weapons.torpedoSpeed},
    {"weapons.torpedoLifetime", &t.weapons.torpedoLifetime},
    {"weapons.torpedoDamage", &t.weapons.torpedoDamage},
    {"weapons.targetRelevanceRadius", &t.weapons.targetRelevanceRadius},

    {"scanner.scanDurationMs", &t.scanner.scanDurationMs},
    {"scanner.maxScanDistance", &t.scanner.maxScanDistance},

    {"targets.defaultMaxHealth", &t.targets.defaultMaxHealth},
    {"targets.explosionSeconds", &t.targets.explosionSeconds},
    {"targets.debrisSeconds", &t.targets.debrisSeconds},
    {"targets.respawnSeconds", &t.targets.respawnSeconds},

    {"camera.chaseOffset", &t.camera.chaseOffset},
    {"camera.chaseLookAhead", &t.camera.chaseLookAhead},
    {"camera.chaseLookRate", &t.camera.chaseLookRate},
    {"camera.cinematicOrbitSpeed", &t.camera.cinematicOrbitSpeed},
    {"camera.cinematicFollowRate", &t.camera.cinematicFollowRate},
    {"camera.warpFollowRate", &t.camera.warpFollowRate},
    {"camera.warpPullBackSeconds", &t.camera.warpPullBackSeconds},
    {"camera.warpSettleSeconds", &t.camera.warpSettleSeconds},
    {"camera.orbitInitialOffset", &t.camera.orbitInitialOffset},
    {"camera.orbitMinDistance", &t.camera.orbitMinDistance},
    {"camera.orbitMaxDistance", &t.camera.orbitMaxDistance},
    {"camera.orbitPolarMargin", &t.camera.orbitPolarMargin},
    {"camera.orbitFreezeTarget", &t.camera.orbitFreezeTarget},
    {"camera.shakeDecay", &t.camera.shakeDecay},

    {"announcer.debounceSeconds", &t.announcer.debounceSeconds},
    {"announcer.minDisplaySeconds", &t.announcer.minDisplaySeconds},
    {"announcer.secondsPerCharacter", &t.announcer.secondsPerCharacter},
  };
}

bool parseDouble(const std::string& tok, double& out) {
  if (tok.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(tok.c_str(), &end);
  if (end != tok.c_str() + tok.size()) return false;
  out = v;
  return true;
}

bool parseValue(std::istringstream& in, const FieldPtr& field) {
  std::string a;
  if (!(in >> a)) return false;

  if (auto p = std::get_if<double*>(&field)) return parseDouble(a, **p);

  if (auto p = std::get_if<int*>(&field)) {
    char* end = nullptr;
    const long v = std::strtol(a.c_str(), &end, 10);
    if (end != a.c_str() + a.size()) return false;
    **p = (int)v;
    return true;
  }

  if (auto p = std::get_if<bool*>(&field)) {
    if (a == "1" || a == "true" || a == "on") { **p = true; return true; }
    if (a == "0" || a == "false" || a == "off") { **p = false; return true; }
    return false;
  }

  if (auto p = std::get_if<math::Vec3d*>(&field)) {
    std::string b, c;
    if (!(in >> b >> c)) return false;
    math::Vec3d v;
    if (!parseDouble(a, v.x) || !parseDouble(b, v.y) || !parseDouble(c, v.z)) return false;
    **p = v;
    return true;
  }

  return false;
}

void fail(std::string* outError, const std::string& msg, core::LogLevel level) {
  core::log(level, "Tuning: " + msg);
  if (outError) *outError = msg;
}

} // namespace

bool loadTuning(const std::string& path, SimTuning& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    fail(outError, "cannot open " + path, core::LogLevel::Warn);
    return false;
  }

  SimTuning t = out;
  const std::vector<Field> fields = bindFields(t);

  std::string line;
  int lineNo = 0;
  while (std::getline(f, line)) {
    ++lineNo;
    const auto hash = line.find('#');
    if (hash != std::string::npos) line.erase(hash);

    std::istringstream iss(line);
    std::string key;
    if (!(iss >> key)) continue;

    const Field* field = nullptr;
    for (const auto& fd : fields) {
      if (key == fd.key) {
        field = &fd;
        break;
      }
    }
    if (!field) {
      WARPCORE_LOG_WARN(path << ":" << lineNo << ": unknown tuning key '" << key << "'");
      continue;
    }

    if (!parseValue(iss, field->ptr)) {
      fail(outError, path + ":" + std::to_string(lineNo) + ": bad value for '" + key + "'", core::LogLevel::Error);
      return false;
    }

    std::string extra;
    if (iss >> extra) {
      fail(outError, path + ":" + std::to_string(lineNo) + ": trailing text after '" + key + "'", core::LogLevel::Error);
      return false;
    }
  }

  out = t;
  return true;
}

bool saveTuning(const SimTuning& tuning, const std::string& path, std::string* outError) {
  std::ofstream f(path, std::ios::out | std::ios::trunc);
  if (!f) {
    fail(outError, "cannot write " + path, core::LogLevel::Error);
    return false;
  }

  SimTuning t = tuning;
  f.precision(17);
  f << "# warpcore tuning\n";
  for (const auto& fd : bindFields(t)) {
    f << fd.key << " ";
    std::visit([&f](auto* p) {
      using T = std::remove_pointer_t<decltype(p)>;
      if constexpr (std::is_same_v<T, math::Vec3d>) {
        f << p->x << " " << p->y << " " << p->z;
      } else if constexpr (std::is_same_v<T, bool>) {
        f << (*p ? "true" : "false");
      } else {
        f << *p;
      }
    }, fd.ptr);
    f << "\n";
  }

  if (!f) {
    fail(outError, "write failed for " + path, core::LogLevel::Error);
    return false;
  }
  return true;
}

} // namespace warpcore::sim
