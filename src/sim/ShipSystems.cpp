#include "warpcore/sim/ShipSystems.h"

#include "warpcore/core/Log.h"

#include <algorithm>
#include <iterator>

namespace warpcore::sim {

std::string_view toString(ShieldQuadrant q) {
  switch (q) {
    case ShieldQuadrant::Front: return "front";
    case ShieldQuadrant::Rear: return "rear";
    case ShieldQuadrant::Port: return "port";
    case ShieldQuadrant::Starboard: return "starboard";
  }
  return "unknown";
}

std::optional<ShieldQuadrant> parseShieldQuadrant(std::string_view name) {
  if (name == "front") return ShieldQuadrant::Front;
  if (name == "rear") return ShieldQuadrant::Rear;
  if (name == "port") return ShieldQuadrant::Port;
  if (name == "starboard") return ShieldQuadrant::Starboard;
  return std::nullopt;
}

std::string_view toString(SystemStatus s) {
  switch (s) {
    case SystemStatus::Online: return "online";
    case SystemStatus::Damaged: return "damaged";
    case SystemStatus::Offline: return "offline";
    case SystemStatus::Charging: return "charging";
  }
  return "unknown";
}

std::string_view toString(AlertLevel a) {
  switch (a) {
    case AlertLevel::Green: return "green";
    case AlertLevel::Yellow: return "yellow";
    case AlertLevel::Red: return "red";
  }
  return "unknown";
}

AlertLevel computeAlertLevel(double hull, double shieldOverall) {
  if (hull < 50.0 || shieldOverall < 25.0) return AlertLevel::Red;
  if (hull < 80.0 || shieldOverall < 50.0) return AlertLevel::Yellow;
  return AlertLevel::Green;
}

void ShieldState::recompute() {
  double sum = 0.0;
  for (double& q : quadrants) {
    q = std::clamp(q, 0.0, 100.0);
    sum += q;
  }
  overall = sum / (double)quadrants.size();
}

SystemStatus computeStatus(const Subsystem& s) {
  if (s.power <= 0.0) return SystemStatus::Offline;
  if (s.power < s.maxPower * 0.5) return SystemStatus::Damaged;
  if (!s.active && s.power < s.maxPower) return SystemStatus::Charging;
  return SystemStatus::Online;
}

SubsystemMap defaultSubsystems() {
  struct Row {
    const char* id;
    const char* name;
    double chargeRate;
    double drainRate;
    bool active;
  };
  // Only the deflector grid runs continuously; the rest are switched on by use.
  static const Row rows[] = {
    {"warp",        "Warp Drive",        5.0, 10.0, false},
    {"impulse",     "Impulse Engines",  10.0,  5.0, false},
    {"shields",     "Deflector Shields", 2.0,  0.0, true},
    {"phasers",     "Phaser Array",      8.0, 15.0, false},
    {"torpedoes",   "Torpedo Systems",   5.0,  0.0, false},
    {"sensors",     "Sensor Array",     15.0,  2.0, false},
    {"lifesupport", "Life Support",     20.0,  1.0, false},
    {"computer",    "Main Computer",    25.0,  3.0, false},
  };

  SubsystemMap m;
  for (const Row& r : rows) {
    Subsystem s;
    s.id = r.id;
    s.name = r.name;
    s.power = 100.0;
    s.maxPower = 100.0;
    s.chargeRate = r.chargeRate;
    s.drainRate = r.drainRate;
    s.active = r.active;
    s.status = computeStatus(s);
    m.emplace(s.id, s);
  }
  return m;
}

ShipSystems::ShipSystems(ShipSystemsParams params, core::RandomSource* rng, EventSink* events)
    : params_(params), rng_(rng), events_(events) {
  state_.subsystems = defaultSubsystems();
}

void ShipSystems::emit(std::string_view id) {
  if (events_) events_->notify(id);
}

const Subsystem* ShipSystems::subsystem(std::string_view id) const {
  const auto it = state_.subsystems.find(id);
  return (it == state_.subsystems.end()) ? nullptr : &it->second;
}

bool ShipSystems::operational(std::string_view id) const {
  const Subsystem* s = subsystem(id);
  return s && s->status != SystemStatus::Offline;
}

bool ShipSystems::canAbsorbDamage() const {
  return state_.shieldsOnline && state_.shields.overall > 0.0;
}

void ShipSystems::checkAlert() {
  const AlertLevel now = alertLevel();
  if (now == state_.lastAlert) return;
  state_.lastAlert = now;
  switch (now) {
    case AlertLevel::Red: emit(events::RedAlert); break;
    case AlertLevel::Yellow: emit(events::YellowAlert); break;
    case AlertLevel::Green: emit(events::GreenAlert); break;
  }
}

void ShipSystems::loseHull(double amount) {
  if (amount <= 0.0) return;

  const double before = state_.hull;
  state_.hull = std::max(0.0, state_.hull - amount);
  emit(events::HullDamage);

  if (before >= params_.hullCriticalThreshold && state_.hull < params_.hullCriticalThreshold && state_.hull > 0.0) {
    emit(events::HullCritical);
  }
  if (before > 0.0 && state_.hull <= 0.0) {
    core::log(core::LogLevel::Info, "ShipSystems: hull breach");
    emit(events::HullBreach);
  }
}

void ShipSystems::damageShields(double amount, std::optional<ShieldQuadrant> quadrant) {
  amount = std::max(0.0, amount);
  state_.secondsSinceDamage = 0.0;

  const double overallBefore = state_.shields.overall;

  if (quadrant) {
    double& q = state_.shields.quadrants[(std::size_t)*quadrant];
    const double before = q;
    q = std::max(0.0, q - amount);
    // The hit that depletes a quadrant lets part of itself through.
    if (before > 0.0 && q <= 0.0) loseHull(amount * params_.bleedThroughFraction);
  } else {
    const double perQuadrant = amount / (double)kShieldQuadrantCount;
    for (double& q : state_.shields.quadrants) q = std::max(0.0, q - perQuadrant);
  }

  state_.shields.recompute();

  if (overallBefore > 0.0 && state_.shields.overall <= 0.0) {
    state_.shieldsOnline = false;
    core::log(core::LogLevel::Info, "ShipSystems: shields down");
    emit(events::ShieldsDown);
  }

  checkAlert();
}

void ShipSystems::damageHull(double amount) {
  if (amount <= 0.0) return;

  loseHull(amount);

  if (amount > params_.cascadeThreshold && rng_ && !state_.subsystems.empty()
      && rng_->chance(params_.cascadeChance)) {
    auto it = state_.subsystems.begin();
    std::advance(it, (long)rng_->index(state_.subsystems.size()));
    const std::string id = it->first;
    damageSystem(id, amount * params_.cascadeFraction);
  }

  checkAlert();
}

void ShipSystems::damageSystem(std::string_view id, double amount) {
  const auto it = state_.subsystems.find(id);
  if (it == state_.subsystems.end()) {
    core::log(core::LogLevel::Warn, "ShipSystems: unknown subsystem '" + std::string(id) + "'");
    return;
  }

  SubsystemMap next = state_.subsystems;
  Subsystem& s = next.at(it->first);
  const SystemStatus before = s.status;
  s.power = std::max(0.0, s.power - std::max(0.0, amount));
  s.status = computeStatus(s);
  state_.subsystems.swap(next);

  const Subsystem& now = state_.subsystems.at(std::string(id));
  if (now.status != before) {
    WARPCORE_LOG_DEBUG("ShipSystems: " << now.id << " " << toString(before) << " -> " << toString(now.status));
    emit(events::SystemDamaged);
    if (now.status == SystemStatus::Offline) emit(events::SystemOffline);
  }
}

void ShipSystems::repairSystem(std::string_view id, double amount) {
  const auto it = state_.subsystems.find(id);
  if (it == state_.subsystems.end()) {
    core::log(core::LogLevel::Warn, "ShipSystems: unknown subsystem '" + std::string(id) + "'");
    return;
  }

  SubsystemMap next = state_.subsystems;
  Subsystem& s = next.at(it->first);
  s.power = std::min(s.maxPower, s.power + std::max(0.0, amount));
  s.status = computeStatus(s);
  const bool shieldGridRestored = (s.id == "shields") && !state_.shieldsOnline && s.status != SystemStatus::Offline;
  state_.subsystems.swap(next);

  if (shieldGridRestored) {
    state_.shieldsOnline = true;
    emit(events::ShieldsUp);
  }
}

void ShipSystems::repairHull(double amount) {
  state_.hull = std::min(100.0, state_.hull + std::max(0.0, amount));
  checkAlert();
}

bool ShipSystems::toggleSystem(std::string_view id, std::optional<bool> active) {
  const auto it = state_.subsystems.find(id);
  if (it == state_.subsystems.end()) {
    core::log(core::LogLevel::Warn, "ShipSystems: unknown subsystem '" + std::string(id) + "'");
    return false;
  }
  if (it->second.status == SystemStatus::Offline) return false;

  SubsystemMap next = state_.subsystems;
  Subsystem& s = next.at(it->first);
  s.active = active.value_or(!s.active);
  s.status = computeStatus(s);
  state_.subsystems.swap(next);
  return true;
}

void ShipSystems::resetSystems() {
  state_ = ShipSystemsState{};
  state_.subsystems = defaultSubsystems();
}

void ShipSystems::handleDebrisCollision() {
  if (canAbsorbDamage()) {
    const std::size_t q = rng_ ? rng_->index(kShieldQuadrantCount) : 0;
    damageShields(params_.debrisShieldDamage, (ShieldQuadrant)q);
  } else {
    damageHull(params_.debrisShieldDamage * params_.debrisHullFraction);
  }
}

void ShipSystems::update(double dtSeconds) {
  if (dtSeconds <= 0.0) return;

  state_.secondsSinceDamage = std::min(state_.secondsSinceDamage + dtSeconds, 1.0e6);

  // Shield regeneration
  if (state_.shieldsOnline && operational("shields")
      && state_.secondsSinceDamage > params_.shieldDamageCooldown) {
    const double amount = params_.shieldRechargeRate * dtSeconds;
    for (double& q : state_.shields.quadrants) q = std::min(100.0, q + amount);
    state_.shields.recompute();
    checkAlert();
  }

  // Subsystem power
  SubsystemMap next = state_.subsystems;
  for (auto& [id, s] : next) {
    if (s.status == SystemStatus::Offline) continue;

    if (s.active && s.drainRate > 0.0) {
      s.power = std::max(0.0, s.power - s.drainRate * dtSeconds);
    } else if (s.power < s.maxPower) {
      s.power = std::min(s.maxPower, s.power + s.chargeRate * dtSeconds);
    }

    const SystemStatus before = s.status;
    s.status = computeStatus(s);
    if (before != SystemStatus::Offline && s.status == SystemStatus::Offline) {
      WARPCORE_LOG_INFO("ShipSystems: " << id << " offline (drained)");
      emit(events::SystemOffline);
    }
  }
  state_.subsystems.swap(next);
}

} // namespace warpcore::sim
