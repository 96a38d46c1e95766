#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/sim/Events.h"

#include <map>
#include <string>
#include <string_view>

namespace warpcore::sim {

enum class DamageState : core::u8 {
  Healthy = 0, // > 70%
  Damaged,     // > 30%
  Critical,    // > 0
  Exploding,
  Debris,
  Respawning,
};

std::string_view toString(DamageState s);

// Healthy/Damaged/Critical by percentage; Exploding at 0.
DamageState damageStateFor(double health, double maxHealth);

struct TargetHealthParams {
  double defaultMaxHealth{100.0};
  double explosionSeconds{2.0};
  double debrisSeconds{30.0};
  double respawnSeconds{2.0};
};

struct TargetHealthRecord {
  std::string id;
  double health{100.0};
  double maxHealth{100.0};
  DamageState state{DamageState::Healthy};
  double explosionProgress{0.0}; // 0..1
  double debrisElapsed{0.0};     // seconds
  double respawnProgress{0.0};   // 0..1
};

using TargetHealthMap = std::map<std::string, TargetHealthRecord, std::less<>>;

// Destructible targets: health, then explosion -> debris -> respawn.
class TargetHealth {
public:
  explicit TargetHealth(TargetHealthParams params = {}, EventSink* events = nullptr)
      : params_(params), events_(events) {}

  // No-op if already registered. maxHealth <= 0 uses the default.
  void registerTarget(std::string id, double maxHealth = 0.0);

  // Ignored while exploding, in debris or respawning. True if this hit
  // destroyed the target.
  bool damage(std::string_view id, double amount);

  void update(double dtSeconds);

  // Unknown ids are not destructible and therefore always targetable.
  bool isTargetable(std::string_view id) const;

  const TargetHealthRecord* find(std::string_view id) const;
  const TargetHealthMap& records() const { return records_; }
  void restore(const TargetHealthMap& records) { records_ = records; }

  const TargetHealthParams& params() const { return params_; }
  void setParams(const TargetHealthParams& p) { params_ = p; }

  void setEventSink(EventSink* events) { events_ = events; }

private:
  TargetHealthParams params_{};
  EventSink* events_{nullptr};
  TargetHealthMap records_;
};

} // namespace warpcore::sim
