#include "warpcore/sim/TargetHealth.h"

#include "warpcore/core/Log.h"

#include <algorithm>

namespace warpcore::sim {

std::string_view toString(DamageState s) {
  switch (s) {
    case DamageState::Healthy: return "healthy";
    case DamageState::Damaged: return "damaged";
    case DamageState::Critical: return "critical";
    case DamageState::Exploding: return "exploding";
    case DamageState::Debris: return "debris";
    case DamageState::Respawning: return "respawning";
  }
  return "unknown";
}

DamageState damageStateFor(double health, double maxHealth) {
  const double percent = (maxHealth > 0.0) ? (health / maxHealth) * 100.0 : 0.0;
  if (percent > 70.0) return DamageState::Healthy;
  if (percent > 30.0) return DamageState::Damaged;
  if (percent > 0.0) return DamageState::Critical;
  return DamageState::Exploding;
}

void TargetHealth::registerTarget(std::string id, double maxHealth) {
  if (records_.find(id) != records_.end()) return;

  TargetHealthRecord r;
  r.id = id;
  r.maxHealth = (maxHealth > 0.0) ? maxHealth : params_.defaultMaxHealth;
  r.health = r.maxHealth;
  records_.emplace(std::move(id), std::move(r));
}

bool TargetHealth::damage(std::string_view id, double amount) {
  const auto it = records_.find(id);
  if (it == records_.end()) {
    WARPCORE_LOG_DEBUG("TargetHealth: '" << id << "' is not destructible");
    return false;
  }

  TargetHealthRecord& r = it->second;
  if (r.state == DamageState::Exploding || r.state == DamageState::Debris || r.state == DamageState::Respawning) {
    return false;
  }

  const double before = r.health;
  r.health = std::max(0.0, r.health - std::max(0.0, amount));

  if (before > 0.0 && r.health <= 0.0) {
    r.state = DamageState::Exploding;
    r.explosionProgress = 0.0;
    r.debrisElapsed = 0.0;
    r.respawnProgress = 0.0;
    core::log(core::LogLevel::Info, "TargetHealth: " + r.id + " destroyed");
    if (events_) events_->notify(events::TargetDestroyed);
    return true;
  }

  r.state = damageStateFor(r.health, r.maxHealth);
  return false;
}

void TargetHealth::update(double dtSeconds) {
  if (dtSeconds <= 0.0) return;

  for (auto& [id, r] : records_) {
    switch (r.state) {
      case DamageState::Exploding:
        r.explosionProgress += (params_.explosionSeconds > 0.0) ? dtSeconds / params_.explosionSeconds : 1.0;
        if (r.explosionProgress >= 1.0) {
          r.explosionProgress = 1.0;
          r.state = DamageState::Debris;
          r.debrisElapsed = 0.0;
        }
        break;

      case DamageState::Debris:
        r.debrisElapsed += dtSeconds;
        if (r.debrisElapsed >= params_.debrisSeconds) {
          r.state = DamageState::Respawning;
          r.respawnProgress = 0.0;
        }
        break;

      case DamageState::Respawning:
        r.respawnProgress += (params_.respawnSeconds > 0.0) ? dtSeconds / params_.respawnSeconds : 1.0;
        if (r.respawnProgress >= 1.0) {
          r.health = r.maxHealth;
          r.state = DamageState::Healthy;
          r.explosionProgress = 0.0;
          r.debrisElapsed = 0.0;
          r.respawnProgress = 0.0;
          if (events_) events_->notify(events::TargetRespawned);
        }
        break;

      default:
        break;
    }
  }
}

bool TargetHealth::isTargetable(std::string_view id) const {
  const TargetHealthRecord* r = find(id);
  if (!r) return true;
  return r->state != DamageState::Exploding && r->state != DamageState::Debris && r->state != DamageState::Respawning;
}

const TargetHealthRecord* TargetHealth::find(std::string_view id) const {
  const auto it = records_.find(id);
  return (it == records_.end()) ? nullptr : &it->second;
}

} // namespace warpcore::sim
