#include "warpcore/sim/Weapons.h"

#include "warpcore/core/Log.h"

#include <algorithm>

namespace warpcore::sim {

std::vector<TargetCandidate> gatherTargetCandidates(const Catalog& catalog, const TargetFilter& targetable) {
  std::vector<TargetCandidate> out;
  for (const Body* b : catalog.navigableBodies()) {
    if (targetable && !targetable(b->id)) continue;
    out.push_back({b->id, b->position, b->radius});
  }
  for (const Contact& c : catalog.contacts()) {
    if (!c.alive) continue;
    if (targetable && !targetable(c.id)) continue;
    out.push_back({c.id, c.position, c.radius});
  }
  return out;
}

Weapons::Weapons(WeaponsParams params, EventSink* events)
    : params_(params), events_(events) {
  state_.torpedoCount = params_.maxTorpedoes;
}

void Weapons::emit(std::string_view id) {
  if (events_) events_->notify(id);
}

bool Weapons::cycleTarget(const std::vector<TargetCandidate>& candidates, const math::Vec3d& shipPos) {
  struct Ranked {
    const TargetCandidate* c;
    double dist;
  };

  std::vector<Ranked> relevant;
  relevant.reserve(candidates.size());
  for (const auto& c : candidates) {
    const double d = c.position.distanceTo(shipPos);
    if (d < params_.targetRelevanceRadius) relevant.push_back({&c, d});
  }
  if (relevant.empty()) return false;

  std::stable_sort(relevant.begin(), relevant.end(),
                   [](const Ranked& a, const Ranked& b) { return a.dist < b.dist; });

  // A vanished selection behaves like no selection.
  long current = -1;
  if (!state_.targetId.empty()) {
    for (std::size_t i = 0; i < relevant.size(); ++i) {
      if (relevant[i].c->id == state_.targetId) {
        current = (long)i;
        break;
      }
    }
  }

  const std::size_t next = (std::size_t)(current + 1) % relevant.size();
  setTarget(relevant[next].c->id);
  return true;
}

void Weapons::setTarget(std::string id) {
  if (id == state_.targetId) return;
  state_.targetId = std::move(id);
  if (!state_.targetId.empty()) emit(events::TargetAcquired);
}

bool Weapons::validateTarget(const TargetFilter& isValid) {
  if (state_.targetId.empty() || !isValid) return false;
  if (isValid(state_.targetId)) return false;

  WARPCORE_LOG_DEBUG("Weapons: target '" << state_.targetId << "' lost, clearing selection");
  state_.targetId.clear();
  return true;
}

bool Weapons::setPhasers(bool active) {
  if (state_.phaserOverheated) {
    state_.firingPhasers = false;
    return false;
  }

  const bool firing = active && state_.phaserHeat < 100.0;
  if (firing && !state_.firingPhasers) emit(events::PhasersFiring);
  state_.firingPhasers = firing;
  return firing;
}

bool Weapons::fireTorpedo(const math::Vec3d& origin, const math::Vec3d& forward) {
  if (state_.torpedoCount <= 0 || state_.torpedoLoading) return false;

  state_.torpedoCount -= 1;
  state_.torpedoLoading = true;
  state_.reloadRemaining = params_.torpedoReloadSeconds;

  Torpedo t;
  t.id = state_.nextTorpedoId++;
  t.position = origin;
  t.velocity = forward.normalized() * params_.torpedoSpeed;
  t.targetId = state_.targetId;
  state_.torpedoes.push_back(std::move(t));

  emit(events::TorpedoLaunched);
  return true;
}

std::vector<TorpedoImpact> Weapons::update(double dtSeconds, const TargetLookup& lookup) {
  std::vector<TorpedoImpact> impacts;
  if (dtSeconds <= 0.0) return impacts;

  // Phaser heat
  if (state_.firingPhasers) {
    state_.phaserHeat += dtSeconds * params_.phaserHeatRate;
    if (state_.phaserHeat >= 100.0) {
      state_.phaserHeat = 100.0;
      state_.phaserOverheated = true;
      state_.firingPhasers = false;
      emit(events::PhaserOverheat);
    }
  } else {
    state_.phaserHeat -= dtSeconds * params_.phaserCoolRate;
    if (state_.phaserHeat <= 0.0) {
      state_.phaserHeat = 0.0;
      state_.phaserOverheated = false;
    }
  }

  // Reload lockout
  if (state_.torpedoLoading) {
    state_.reloadRemaining -= dtSeconds;
    if (state_.reloadRemaining <= 0.0) {
      state_.reloadRemaining = 0.0;
      state_.torpedoLoading = false;
    }
  }

  // Torpedoes in flight
  std::vector<Torpedo> alive;
  alive.reserve(state_.torpedoes.size());
  for (Torpedo& t : state_.torpedoes) {
    t.age += dtSeconds;
    if (t.age > params_.torpedoLifetime) continue;

    std::optional<TargetCandidate> target;
    if (!t.targetId.empty() && lookup) target = lookup(t.targetId);

    if (target) {
      const math::Vec3d toTarget = target->position - t.position;
      const double dist = toTarget.length();
      const double step = params_.torpedoSpeed * dtSeconds;
      if (dist <= target->radius + step) {
        impacts.push_back({t.id, t.targetId, target->position, params_.torpedoDamage});
        emit(events::TorpedoImpact);
        continue;
      }
      t.velocity = toTarget / dist * params_.torpedoSpeed;
    }

    t.position += t.velocity * dtSeconds;
    alive.push_back(std::move(t));
  }
  state_.torpedoes.swap(alive);

  return impacts;
}

double Weapons::phaserDamage(double dtSeconds, const math::Vec3d& shipPos,
                             const std::optional<TargetCandidate>& target) const {
  if (!state_.firingPhasers || !target || dtSeconds <= 0.0) return 0.0;
  if (target->position.distanceTo(shipPos) > params_.phaserRange) return 0.0;
  return params_.phaserDamagePerSecond * dtSeconds;
}

} // namespace warpcore::sim
