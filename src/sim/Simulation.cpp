#include "warpcore/sim/Simulation.h"

#include "warpcore/core/Log.h"

#include <algorithm>
#include <cmath>

namespace warpcore::sim {

Simulation::Simulation(Catalog catalog, SimTuning tuning, core::u64 seed)
    : tuning_(tuning),
      catalog_(std::move(catalog)),
      seed_(seed),
      systemsRng_(core::deriveSeed(seed, "systems")),
      cameraRng_(core::deriveSeed(seed, "camera")),
      pose_(FlightController::initialPose(tuning.flight)),
      flight_(tuning.flight),
      warp_(tuning.warp, &events_),
      ship_(tuning.ship, &systemsRng_, &events_),
      weapons_(tuning.weapons, &events_),
      scanner_(tuning.scanner, &events_),
      targets_(tuning.targets, &events_),
      camera_(tuning.camera, &cameraRng_) {
  // Stars are not destructible.
  for (const Body& b : catalog_.bodies()) {
    if (b.kind != BodyKind::Star) targets_.registerTarget(b.id);
  }
  for (const Contact& c : catalog_.contacts()) targets_.registerTarget(c.id);
}

void Simulation::setTuning(const SimTuning& tuning) {
  tuning_ = tuning;
  flight_.setParams(tuning.flight);
  warp_.setParams(tuning.warp);
  ship_.setParams(tuning.ship);
  weapons_.setParams(tuning.weapons);
  scanner_.setParams(tuning.scanner);
  targets_.setParams(tuning.targets);
  camera_.setParams(tuning.camera);
}

bool Simulation::targetable(std::string_view id) const {
  return catalog_.findTarget(id).has_value() && targets_.isTargetable(id);
}

std::optional<TargetCandidate> Simulation::candidateFor(std::string_view id) const {
  if (!targets_.isTargetable(id)) return std::nullopt;
  const auto ref = catalog_.findTarget(id);
  if (!ref) return std::nullopt;
  return TargetCandidate{std::string(ref->id), ref->position, ref->radius};
}

std::optional<TargetRef> Simulation::selectedTarget() const {
  if (!weapons_.hasTarget()) return std::nullopt;
  return catalog_.findTarget(weapons_.targetId());
}

void Simulation::setActivity(std::string_view id, bool active) {
  const Subsystem* s = ship_.subsystem(id);
  if (!s || s->status == SystemStatus::Offline || s->active == active) return;
  (void)ship_.toggleSystem(id, active);
}

void Simulation::tick(double dtSeconds, const FlightInput& input) {
  const double dt = std::clamp(dtSeconds, 0.0, tuning_.sim.maxTickSeconds);
  if (dt <= 0.0) return;

  // Helm: exactly one writer of the pose.
  FlightInput in = input;
  in.enabled = in.enabled && cameraMode_.flightEnabled();
  const bool impulseUp = ship_.operational("impulse");
  if (!impulseUp) {
    in.thrust = 0.0;
    in.strafe = 0.0;
  }

  if (warp_.active()) {
    const WarpUpdateResult r = warp_.update(dt, pose_);
    if (r.completed) {
      flight_.setWarping(false);
      flight_.fullStop();
    }
  } else {
    flight_.update(dt, in, pose_);
  }

  // Engineering
  const WarpPhase phase = warp_.phase();
  setActivity("warp", phase == WarpPhase::Charging || phase == WarpPhase::Accelerating);
  setActivity("impulse", impulseUp && in.enabled && !flight_.warping() && std::abs(in.thrust) > 0.0);
  setActivity("phasers", weapons_.state().firingPhasers);
  setActivity("sensors", scanner_.session().scanning);
  ship_.update(dt);

  // Tactical
  if (weapons_.state().firingPhasers && !ship_.operational("phasers")) (void)weapons_.setPhasers(false);

  const auto impacts = weapons_.update(dt, [this](std::string_view id) { return candidateFor(id); });
  for (const TorpedoImpact& hit : impacts) {
    (void)targets_.damage(hit.targetId, hit.damage);
    camera_.addShake(tuning_.sim.impactShake);
  }

  if (weapons_.hasTarget()) {
    const std::string id = weapons_.targetId();
    const double beam = weapons_.phaserDamage(dt, pose_.position, candidateFor(id));
    if (beam > 0.0) (void)targets_.damage(id, beam);
  }

  targets_.update(dt);

  // Science
  scanner_.update(dt, pose_.position, selectedTarget());

  (void)weapons_.validateTarget([this](std::string_view id) { return targetable(id); });

  camera_.update(dt, pose_, warp_.phase(), cameraMode_);

  elapsed_ += dt;
  ++ticks_;
}

bool Simulation::engageWarp(std::string_view destinationId) {
  if (!ship_.operational("warp")) {
    core::log(core::LogLevel::Info, "Simulation: warp drive offline, engage refused");
    return false;
  }

  const Body* dest = catalog_.findBody(destinationId);
  if (!dest) {
    core::log(core::LogLevel::Warn, "Simulation: unknown destination '" + std::string(destinationId) + "'");
    return false;
  }

  if (!warp_.engage(dest->position, dest->radius, pose_, dest->id)) return false;
  flight_.setWarping(true);
  return true;
}

bool Simulation::disengageWarp() {
  return warp_.disengage();
}

bool Simulation::skipToDestination() {
  return warp_.skipToDestination(pose_);
}

void Simulation::setWarpLevel(int level) {
  warp_.setWarpLevel(level);
}

bool Simulation::cycleTarget() {
  const auto candidates = gatherTargetCandidates(catalog_, [this](std::string_view id) { return targets_.isTargetable(id); });
  return weapons_.cycleTarget(candidates, pose_.position);
}

bool Simulation::setPhasers(bool active) {
  if (active && !ship_.operational("phasers")) return false;
  return weapons_.setPhasers(active);
}

bool Simulation::fireTorpedo() {
  if (!ship_.operational("torpedoes")) return false;
  return weapons_.fireTorpedo(pose_.toWorld({0.0, 0.0, -2.0}), pose_.forward());
}

bool Simulation::startScan() {
  if (!ship_.operational("sensors")) return false;

  auto target = selectedTarget();
  if (!target) {
    const Body* nearest = catalog_.nearestBody(pose_.position);
    if (!nearest) return false;
    weapons_.setTarget(nearest->id);
    target = catalog_.findTarget(nearest->id);
    if (!target) return false;
  }
  return scanner_.startScan(*target, pose_.position);
}

void Simulation::handleDebrisCollision() {
  ship_.handleDebrisCollision();
  camera_.addShake(tuning_.sim.impactShake);
}

void Simulation::damageShields(double amount, std::optional<ShieldQuadrant> quadrant) {
  ship_.damageShields(amount, quadrant);
}

void Simulation::damageHull(double amount) {
  ship_.damageHull(amount);
}

void Simulation::addContact(Contact contact) {
  const std::string id = contact.id;
  catalog_.addContact(std::move(contact));
  targets_.registerTarget(id);
}

bool Simulation::moveContact(std::string_view id, const math::Vec3d& position) {
  Contact* c = catalog_.findContact(id);
  if (!c) {
    core::log(core::LogLevel::Warn, "Simulation: unknown contact '" + std::string(id) + "'");
    return false;
  }
  c->position = position;
  return true;
}

SimSnapshot Simulation::snapshot() const {
  SimSnapshot s;
  s.seed = seed_;
  s.systemsRngState = systemsRng_.state();
  s.cameraRngState = cameraRng_.state();
  s.elapsedSeconds = elapsed_;
  s.tickCount = ticks_;
  s.pose = pose_;
  s.flight = flight_.state();
  s.warp = warp_.session();
  s.ship = ship_.state();
  s.weapons = weapons_.state();
  s.scan = scanner_.session();
  s.targets = targets_.records();
  s.contacts = catalog_.contacts();
  s.cameraMode = cameraMode_;
  return s;
}

bool Simulation::restore(const SimSnapshot& s, std::string* outError) {
  if (s.version > kSaveVersion) {
    const std::string msg = "snapshot version " + std::to_string(s.version) + " is newer than supported";
    core::log(core::LogLevel::Error, "Simulation: " + msg);
    if (outError) *outError = msg;
    return false;
  }

  seed_ = s.seed;
  systemsRng_.setState(s.systemsRngState);
  cameraRng_.setState(s.cameraRngState);
  elapsed_ = s.elapsedSeconds;
  ticks_ = s.tickCount;

  pose_ = s.pose;
  flight_.setState(s.flight);
  warp_.restore(s.warp);
  ship_.restore(s.ship);
  weapons_.restore(s.weapons);
  scanner_.restore(s.scan);
  targets_.restore(s.targets);

  for (const Contact& saved : s.contacts) {
    if (Contact* c = catalog_.findContact(saved.id)) {
      *c = saved;
    } else {
      catalog_.addContact(saved);
    }
  }

  cameraMode_ = s.cameraMode;
  return true;
}

} // namespace warpcore::sim
