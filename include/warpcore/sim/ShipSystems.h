#pragma once

#include "warpcore/core/Random.h"
#include "warpcore/core/Types.h"
#include "warpcore/sim/Events.h"

#include <array>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::sim {

enum class ShieldQuadrant : core::u8 {
  Front = 0,
  Rear,
  Port,
  Starboard,
};

inline constexpr std::size_t kShieldQuadrantCount = 4;

std::string_view toString(ShieldQuadrant q);
std::optional<ShieldQuadrant> parseShieldQuadrant(std::string_view name);

enum class SystemStatus : core::u8 {
  Online = 0,
  Damaged,
  Offline,
  Charging,
};

std::string_view toString(SystemStatus s);

enum class AlertLevel : core::u8 {
  Green = 0,
  Yellow,
  Red,
};

std::string_view toString(AlertLevel a);

// Red if hull < 50 or shields < 25, yellow if hull < 80 or shields < 50.
AlertLevel computeAlertLevel(double hull, double shieldOverall);

struct ShieldState {
  std::array<double, kShieldQuadrantCount> quadrants{100.0, 100.0, 100.0, 100.0};
  double overall{100.0}; // always the mean of quadrants

  double get(ShieldQuadrant q) const { return quadrants[(std::size_t)q]; }
  void recompute();
};

struct Subsystem {
  std::string id;
  std::string name;
  SystemStatus status{SystemStatus::Online};
  double power{100.0};
  double maxPower{100.0};
  double chargeRate{0.0}; // power/s while idle or below max
  double drainRate{0.0};  // power/s while active
  bool active{false};
};

// Status from power: offline at 0, damaged below half, charging while
// inactive and not full, online otherwise.
SystemStatus computeStatus(const Subsystem& s);

using SubsystemMap = std::map<std::string, Subsystem, std::less<>>;

// warp, impulse, shields, phasers, torpedoes, sensors, lifesupport, computer
SubsystemMap defaultSubsystems();

struct ShipSystemsParams {
  double shieldRechargeRate{2.0};     // per quadrant, per second
  double shieldDamageCooldown{3.0};   // seconds without damage before regen
  double bleedThroughFraction{0.5};   // of directional damage on a depleted quadrant
  double cascadeThreshold{5.0};       // hull damage above this may cascade
  double cascadeChance{0.3};
  double cascadeFraction{0.5};        // of the hull damage, applied to one subsystem
  double debrisShieldDamage{5.0};
  double debrisHullFraction{0.5};     // of debrisShieldDamage when shields cannot absorb
  double hullCriticalThreshold{25.0};
};

struct ShipSystemsState {
  ShieldState shields{};
  bool shieldsOnline{true};
  double hull{100.0};
  double secondsSinceDamage{1.0e6};
  SubsystemMap subsystems{};

  // Last alert level announced; only used to detect changes.
  AlertLevel lastAlert{AlertLevel::Green};
};

// Shields, hull and the subsystem bank.
class ShipSystems {
public:
  explicit ShipSystems(ShipSystemsParams params = {},
                       core::RandomSource* rng = nullptr,
                       EventSink* events = nullptr);

  // Omnidirectional when no quadrant is given: split evenly.
  void damageShields(double amount, std::optional<ShieldQuadrant> quadrant = std::nullopt);

  // May cascade into one random subsystem.
  void damageHull(double amount);

  void damageSystem(std::string_view id, double amount);
  void repairSystem(std::string_view id, double amount);
  void repairHull(double amount);

  // Refused for unknown or offline systems. No value flips the flag.
  bool toggleSystem(std::string_view id, std::optional<bool> active = std::nullopt);

  void resetSystems();

  // Random quadrant if shields can take it, otherwise straight to hull.
  void handleDebrisCollision();

  bool canAbsorbDamage() const;

  void update(double dtSeconds);

  AlertLevel alertLevel() const { return computeAlertLevel(state_.hull, state_.shields.overall); }

  const ShieldState& shields() const { return state_.shields; }
  bool shieldsOnline() const { return state_.shieldsOnline; }
  double hull() const { return state_.hull; }

  const SubsystemMap& subsystems() const { return state_.subsystems; }
  const Subsystem* subsystem(std::string_view id) const;
  bool operational(std::string_view id) const;

  const ShipSystemsState& state() const { return state_; }
  void restore(const ShipSystemsState& s) { state_ = s; }

  const ShipSystemsParams& params() const { return params_; }
  void setParams(const ShipSystemsParams& p) { params_ = p; }

  void setRandom(core::RandomSource* rng) { rng_ = rng; }
  void setEventSink(EventSink* events) { events_ = events; }

private:
  void loseHull(double amount);
  void checkAlert();
  void emit(std::string_view id);

  ShipSystemsParams params_{};
  core::RandomSource* rng_{nullptr};
  EventSink* events_{nullptr};
  ShipSystemsState state_{};
};

} // namespace warpcore::sim
