#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/math/Vec3.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/Events.h"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::sim {

struct WeaponsParams {
  double phaserHeatRate{25.0};        // heat/s while firing
  double phaserCoolRate{15.0};        // heat/s while idle
  double phaserRange{300.0};
  double phaserDamagePerSecond{20.0};

  int maxTorpedoes{100};
  double torpedoReloadSeconds{2.0};
  double torpedoSpeed{80.0};          // units/s
  double torpedoLifetime{10.0};       // seconds before a miss is discarded
  double torpedoDamage{35.0};

  double targetRelevanceRadius{2000.0};
};

// Something the fire-control can lock on to.
struct TargetCandidate {
  std::string id;
  math::Vec3d position{};
  double radius{0.0};
};

using TargetLookup = std::function<std::optional<TargetCandidate>(std::string_view id)>;
using TargetFilter = std::function<bool(std::string_view id)>;

struct Torpedo {
  core::u32 id{0};
  math::Vec3d position{};
  math::Vec3d velocity{};
  std::string targetId; // empty: unguided
  double age{0.0};
};

struct TorpedoImpact {
  core::u32 torpedoId{0};
  std::string targetId;
  math::Vec3d position{};
  double damage{0.0};
};

struct WeaponsState {
  double phaserHeat{0.0};       // 0..100
  bool phaserOverheated{false};
  bool firingPhasers{false};

  int torpedoCount{100};
  bool torpedoLoading{false};
  double reloadRemaining{0.0};

  std::string targetId;         // empty: no target

  std::vector<Torpedo> torpedoes;
  core::u32 nextTorpedoId{1};
};

// Navigable bodies plus live contacts, minus anything `targetable` rejects.
std::vector<TargetCandidate> gatherTargetCandidates(const Catalog& catalog,
                                                    const TargetFilter& targetable = {});

class Weapons {
public:
  explicit Weapons(WeaponsParams params = {}, EventSink* events = nullptr);

  // Nearest-first cycling over candidates inside the relevance radius,
  // wrapping at the end. False (no change) when nothing is in range.
  bool cycleTarget(const std::vector<TargetCandidate>& candidates, const math::Vec3d& shipPos);

  void setTarget(std::string id);
  void clearTarget() { state_.targetId.clear(); }
  const std::string& targetId() const { return state_.targetId; }
  bool hasTarget() const { return !state_.targetId.empty(); }

  // Clears the selection if `isValid` rejects it. Returns true if cleared.
  bool validateTarget(const TargetFilter& isValid);

  // Continuous-fire toggle. Returns the resulting firing state.
  bool setPhasers(bool active);

  // One round, then a reload lockout. Empty or reloading is a silent no-op.
  // Guided toward the current target when there is one.
  bool fireTorpedo(const math::Vec3d& origin, const math::Vec3d& forward);

  // Heat, reload and torpedo flight. Returns torpedoes that reached a target.
  std::vector<TorpedoImpact> update(double dtSeconds, const TargetLookup& lookup = {});

  // Beam damage owed to `target` for this tick (0 when idle or out of range).
  double phaserDamage(double dtSeconds, const math::Vec3d& shipPos,
                      const std::optional<TargetCandidate>& target) const;

  const WeaponsState& state() const { return state_; }
  void restore(const WeaponsState& s) { state_ = s; }

  const WeaponsParams& params() const { return params_; }
  void setParams(const WeaponsParams& p) { params_ = p; }

  void setEventSink(EventSink* events) { events_ = events; }

private:
  void emit(std::string_view id);

  WeaponsParams params_{};
  EventSink* events_{nullptr};
  WeaponsState state_{};
};

} // namespace warpcore::sim
