#include "warpcore/sim/Events.h"
#include "warpcore/sim/WarpDrive.h"

#include <cmath>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

static bool approx(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

using namespace warpcore;
using namespace warpcore::sim;

// Ticks until the phase changes to `until` or the time runs out.
static bool runUntil(WarpDrive& wd, Pose& p, WarpPhase until, double maxSeconds, double dt = 0.05) {
  for (double t = 0.0; t < maxSeconds; t += dt) {
    wd.update(dt, p);
    if (wd.phase() == until) return true;
  }
  return wd.phase() == until;
}

int test_warp() {
  int fails = 0;

  // Speed is cubic in warp level.
  {
    WarpDrive wd;
    for (int level = 1; level <= 9; ++level) {
      const double expected = (double)(level * level * level) * 38.5;
      if (!approx(wd.speedForLevel(level), expected)) {
        std::cerr << "[test_warp] speed for warp " << level << " = " << wd.speedForLevel(level) << "\n";
        ++fails;
      }
    }

    wd.setWarpLevel(12);
    if (wd.warpLevel() != 9) {
      std::cerr << "[test_warp] warp level should clamp to 9\n";
      ++fails;
    }
    wd.setWarpLevel(0);
    if (wd.warpLevel() != 1) {
      std::cerr << "[test_warp] warp level should clamp to 1\n";
      ++fails;
    }
  }

  // Warp 1 from the origin to (0,0,385), radius 0: 360 units after the buffer.
  {
    RecordingEventSink events;
    WarpDrive wd({}, &events);
    Pose p;

    if (!wd.engage({0, 0, 385}, 0.0, p, "beacon")) {
      std::cerr << "[test_warp] engage refused from idle\n";
      return fails + 1;
    }

    const WarpSession& s = wd.session();
    if (s.phase != WarpPhase::Charging || !approx(s.totalDistance, 360.0) || !approx(s.eta, 360.0 / 38.5)) {
      std::cerr << "[test_warp] engage session: phase=" << toString(s.phase) << " total=" << s.totalDistance
                << " eta=" << s.eta << "\n";
      ++fails;
    }
    if (!approx(s.origin.distanceTo(s.destinationArrival), s.totalDistance)) {
      std::cerr << "[test_warp] origin->arrival distance must equal total distance\n";
      ++fails;
    }
    if (s.destinationId != "beacon") {
      std::cerr << "[test_warp] destination id not kept\n";
      ++fails;
    }

    // Second engage is refused.
    if (wd.engage({100, 0, 0}, 0.0, p)) {
      std::cerr << "[test_warp] engage while charging should be refused\n";
      ++fails;
    }

    // Fly the whole sequence.
    std::vector<WarpPhase> seen{wd.phase()};
    double lastCovered = 0.0;
    bool completed = false;
    for (int i = 0; i < 2000 && !completed; ++i) {
      const WarpUpdateResult r = wd.update(0.05, p);
      if (r.phase != seen.back()) seen.push_back(r.phase);
      if (wd.phase() == WarpPhase::Cruising) {
        const double covered = s.totalDistance - s.distanceRemaining;
        if (covered + 1e-12 < lastCovered) {
          std::cerr << "[test_warp] distance covered went backwards\n";
          ++fails;
        }
        lastCovered = covered;
      }
      completed = r.completed;
    }

    const std::vector<WarpPhase> expected{WarpPhase::Charging, WarpPhase::Accelerating, WarpPhase::Cruising,
                                          WarpPhase::Decelerating, WarpPhase::Arriving, WarpPhase::Idle};
    if (!completed || seen != expected) {
      std::cerr << "[test_warp] unexpected phase sequence (" << seen.size() << " phases)\n";
      ++fails;
    }

    if (!approx(p.position.x, 0.0) || !approx(p.position.y, 0.0) || !approx(p.position.z, 360.0)) {
      std::cerr << "[test_warp] arrival position expected (0,0,360) got " << p.position << "\n";
      ++fails;
    }
    if (!approx(p.forward().z, 1.0, 1e-9) || !approx(p.euler().roll, 0.0, 1e-9) || p.velocity.lengthSq() != 0.0) {
      std::cerr << "[test_warp] should face the destination at rest, fwd=" << p.forward() << "\n";
      ++fails;
    }
    if (wd.session().warpLevel != 1 || !wd.session().destinationId.empty()) {
      std::cerr << "[test_warp] idle session should be reset but keep the level\n";
      ++fails;
    }

    const std::vector<std::string_view> expectedEvents{
        events::WarpCharging, events::BraceAcceleration, events::WarpEngage, events::WarpCruise,
        events::WarpDisengage, events::ArrivalDestination};
    bool sameEvents = events.events().size() == expectedEvents.size();
    for (std::size_t i = 0; sameEvents && i < expectedEvents.size(); ++i) {
      sameEvents = events.events()[i] == expectedEvents[i];
    }
    if (!sameEvents) {
      std::cerr << "[test_warp] event sequence mismatch:";
      for (const auto& e : events.events()) std::cerr << " " << e;
      std::cerr << "\n";
      ++fails;
    }
  }

  // ETA scales with the inverse cube of the level.
  {
    WarpDrive wd;
    Pose p;
    wd.setWarpLevel(3);
    if (!wd.engage({0, 0, 1025}, 0.0, p)) {
      std::cerr << "[test_warp] engage at warp 3 refused\n";
      ++fails;
    } else if (!approx(wd.session().eta, 1000.0 / (27.0 * 38.5))) {
      std::cerr << "[test_warp] warp 3 eta " << wd.session().eta << "\n";
      ++fails;
    }
  }

  // Disengage twice: second call is a no-op.
  {
    RecordingEventSink events;
    WarpDrive wd({}, &events);
    Pose p;

    if (wd.disengage()) {
      std::cerr << "[test_warp] disengage from idle should be refused\n";
      ++fails;
    }

    wd.engage({0, 0, -5000}, 10.0, p);
    if (!runUntil(wd, p, WarpPhase::Cruising, 10.0)) {
      std::cerr << "[test_warp] never reached cruising\n";
      ++fails;
    }
    for (int i = 0; i < 20; ++i) wd.update(0.05, p);

    const math::Vec3d stoppedAt = p.position;
    const bool first = wd.disengage();
    const WarpSession afterFirst = wd.session();
    const bool second = wd.disengage();
    const WarpSession afterSecond = wd.session();

    if (!first || second || wd.phase() != WarpPhase::Decelerating) {
      std::cerr << "[test_warp] disengage idempotence broken\n";
      ++fails;
    }
    if (afterFirst.phase != afterSecond.phase || afterFirst.elapsedInPhase != afterSecond.elapsedInPhase
        || afterFirst.distanceRemaining != afterSecond.distanceRemaining) {
      std::cerr << "[test_warp] second disengage changed the session\n";
      ++fails;
    }
    if (events.count(events::EmergencyStop) != 1) {
      std::cerr << "[test_warp] expected exactly one emergency-stop\n";
      ++fails;
    }

    // Emergency stop holds position through the wind-down.
    runUntil(wd, p, WarpPhase::Idle, 5.0);
    if (p.position.distanceTo(stoppedAt) > 1e-9 || wd.active()) {
      std::cerr << "[test_warp] ship drifted after emergency stop\n";
      ++fails;
    }
  }

  // Skip jumps to the arrival point.
  {
    WarpDrive wd;
    Pose p;

    wd.engage({0, 0, -5000}, 10.0, p);
    Pose probe = p;
    if (wd.skipToDestination(probe)) {
      std::cerr << "[test_warp] skip should only work while cruising\n";
      ++fails;
    }

    runUntil(wd, p, WarpPhase::Cruising, 10.0);
    const math::Vec3d arrival = wd.session().destinationArrival;
    if (!wd.skipToDestination(p) || wd.phase() != WarpPhase::Arriving || p.position.distanceTo(arrival) > 1e-9) {
      std::cerr << "[test_warp] skip did not land on the arrival point\n";
      ++fails;
    }
    const WarpUpdateResult r = wd.update(0.5, p);
    if (!r.completed || wd.active()) {
      std::cerr << "[test_warp] arriving should complete after skip\n";
      ++fails;
    }
  }

  // Raising the level mid-cruise shortens the ETA.
  {
    WarpDrive wd;
    Pose p;
    wd.engage({0, 0, -20000}, 0.0, p);
    runUntil(wd, p, WarpPhase::Cruising, 10.0);
    wd.update(0.05, p);
    const double before = wd.session().eta;
    wd.setWarpLevel(2);
    if (!approx(wd.session().eta, before / 8.0, 1e-9) || !approx(wd.session().warpSpeed, 8.0 * 38.5)) {
      std::cerr << "[test_warp] eta after warp 2: " << wd.session().eta << " (was " << before << ")\n";
      ++fails;
    }
  }

  // ETA helpers.
  {
    if (!std::isinf(WarpDrive::etaFor(100.0, 0.0))) {
      std::cerr << "[test_warp] eta at zero speed should be infinite\n";
      ++fails;
    }
    if (formatEta(75.4) != "01:15" || formatEta(WarpDrive::etaFor(1.0, 0.0)) != "--:--") {
      std::cerr << "[test_warp] formatEta: " << formatEta(75.4) << "\n";
      ++fails;
    }
    const math::Vec3d a = WarpDrive::arrivalPoint({0, 0, 0}, {100, 0, 0}, 10.0, 25.0);
    if (!approx(a.x, 65.0) || !approx(a.y, 0.0)) {
      std::cerr << "[test_warp] arrival point " << a << "\n";
      ++fails;
    }
  }

  // Charging turns the ship gradually toward a destination behind it; the
  // later phases hold the destination-facing orientation exactly.
  {
    WarpDrive wd;
    Pose p;
    const math::Vec3d dest{60, 0, 385};
    if (!wd.engage(dest, 0.0, p, "astern")) {
      std::cerr << "[test_warp] engage astern refused\n";
      return fails + 1;
    }
    const math::Quatd facing = wd.session().facing;
    const double initialAngle = math::angleBetween(p.rotation, facing);

    wd.update(0.05, p);
    const double afterOne = math::angleBetween(p.rotation, facing);
    if (wd.phase() != WarpPhase::Charging || !(afterOne > 1e-6) || !(afterOne < initialAngle - 1e-6)) {
      std::cerr << "[test_warp] charging turn should be partial: initial=" << initialAngle
                << " after one tick=" << afterOne << "\n";
      ++fails;
    }

    // 48 more ticks: 2.45 s of the 2.5 s charge.
    for (int i = 0; i < 48; ++i) wd.update(0.05, p);
    if (wd.phase() != WarpPhase::Charging || !(std::abs(math::dot(p.rotation, facing)) > WarpParams{}.alignDot)) {
      std::cerr << "[test_warp] should be aligned before charging ends, dot="
                << std::abs(math::dot(p.rotation, facing)) << "\n";
      ++fails;
    }

    if (!runUntil(wd, p, WarpPhase::Accelerating, 1.0)) {
      std::cerr << "[test_warp] charging did not end\n";
      return fails + 1;
    }
    const auto sameAsFacing = [&facing](const math::Quatd& q) {
      return q.w == facing.w && q.x == facing.x && q.y == facing.y && q.z == facing.z;
    };
    if (!sameAsFacing(p.rotation)) {
      std::cerr << "[test_warp] accelerating should hold the facing orientation exactly\n";
      ++fails;
    }
    const math::Vec3d bearing = dest.normalized();
    if (!approx(math::dot(p.rotation.forward(), bearing), 1.0, 1e-9)) {
      std::cerr << "[test_warp] forward axis off the destination bearing\n";
      ++fails;
    }

    if (!runUntil(wd, p, WarpPhase::Cruising, 2.0)) {
      std::cerr << "[test_warp] accelerating did not end\n";
      return fails + 1;
    }
    wd.update(0.05, p);
    if (!sameAsFacing(p.rotation)) {
      std::cerr << "[test_warp] cruising should not turn the ship\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_warp] pass\n";
  return fails;
}
