#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/Events.h"
#include "warpcore/sim/Scanner.h"

#include <cmath>
#include <iostream>
#include <optional>
#include <string>

int test_scanner() {
  int fails = 0;

  using namespace warpcore;
  using namespace warpcore::sim;

  ScanPayload marsData;
  marsData.population = "Colony: 12,000";
  marsData.threatLevel = "Low";

  const std::string marsId = "mars";
  const std::string lunaId = "luna";

  TargetRef mars;
  mars.id = marsId;
  mars.name = "Mars";
  mars.position = {0, 0, -50};
  mars.radius = 2.5;
  mars.scan = &marsData;

  TargetRef luna;
  luna.id = lunaId;
  luna.name = "Luna";
  luna.position = {40, 0, 0};

  const math::Vec3d ship{0, 0, 0};

  // Out of range at start.
  {
    RecordingEventSink events;
    Scanner sc({}, &events);
    TargetRef far = mars;
    far.position = {0, 0, -150};
    if (sc.startScan(far, ship) || sc.session().error != ScanError::OutOfRange || sc.session().scanning
        || !events.contains(events::ScanFailed)) {
      std::cerr << "[test_scanner] out of range start should fail\n";
      ++fails;
    }
    if (scanErrorMessage(sc.session().error) != "Target out of range") {
      std::cerr << "[test_scanner] out of range message wrong\n";
      ++fails;
    }
  }

  // A full sweep takes 3s and reports the target's payload.
  {
    RecordingEventSink events;
    Scanner sc({}, &events);
    if (!sc.startScan(mars, ship) || !sc.session().scanning || sc.session().targetId != "mars") {
      std::cerr << "[test_scanner] start failed\n";
      ++fails;
    }
    if (sc.startScan(luna, ship) || sc.session().targetId != "mars" || sc.session().error != ScanError::None) {
      std::cerr << "[test_scanner] second start should be a silent no-op\n";
      ++fails;
    }

    sc.update(1.5, ship, mars);
    if (std::abs(sc.session().progress - 50.0) > 1e-9 || sc.session().complete) {
      std::cerr << "[test_scanner] half sweep expected 50 got " << sc.session().progress << "\n";
      ++fails;
    }
    sc.update(1.5, ship, mars);
    const ScanSession& s = sc.session();
    if (!s.complete || s.scanning || s.progress != 100.0 || !s.result || s.result->population != "Colony: 12,000"
        || !events.contains(events::ScanComplete)) {
      std::cerr << "[test_scanner] sweep did not complete with the payload\n";
      ++fails;
    }
  }

  // Targets without a payload get the fallback.
  {
    Scanner sc;
    (void)sc.startScan(luna, ship);
    sc.update(3.0, ship, luna);
    const ScanPayload fallback = fallbackScanPayload();
    if (!sc.session().result || sc.session().result->population != fallback.population
        || sc.session().result->threatLevel != fallback.threatLevel) {
      std::cerr << "[test_scanner] missing payload should fall back\n";
      ++fails;
    }
  }

  // Changing or dropping the selection cancels quietly.
  {
    RecordingEventSink events;
    Scanner sc({}, &events);
    (void)sc.startScan(mars, ship);
    sc.update(1.0, ship, mars);
    sc.update(0.1, ship, luna);
    if (sc.session().scanning || sc.session().progress != 0.0 || sc.session().error != ScanError::None
        || events.contains(events::ScanFailed)) {
      std::cerr << "[test_scanner] selection change should cancel without error\n";
      ++fails;
    }

    (void)sc.startScan(mars, ship);
    sc.update(0.1, ship, std::nullopt);
    if (sc.session().scanning) {
      std::cerr << "[test_scanner] cleared selection should cancel\n";
      ++fails;
    }
  }

  // Drifting out of range mid-sweep loses the signal.
  {
    RecordingEventSink events;
    Scanner sc({}, &events);
    (void)sc.startScan(mars, ship);
    sc.update(1.0, ship, mars);
    sc.update(0.1, {0, 0, 100}, mars);
    if (sc.session().scanning || sc.session().complete || sc.session().error != ScanError::SignalLost
        || !events.contains(events::ScanFailed)) {
      std::cerr << "[test_scanner] expected signal lost\n";
      ++fails;
    }
    if (scanErrorMessage(ScanError::SignalLost) != "Target signal lost - out of range"
        || !scanErrorMessage(ScanError::None).empty()) {
      std::cerr << "[test_scanner] error messages wrong\n";
      ++fails;
    }
  }

  // Cancel keeps the last result; reset clears everything.
  {
    Scanner sc;
    (void)sc.startScan(mars, ship);
    sc.update(3.0, ship, mars);
    sc.cancelScan();
    if (!sc.session().result || sc.session().targetId != "mars") {
      std::cerr << "[test_scanner] cancel should keep the last result\n";
      ++fails;
    }
    sc.reset();
    if (sc.session().result || !sc.session().targetId.empty() || sc.session().scanning) {
      std::cerr << "[test_scanner] reset should clear the session\n";
      ++fails;
    }
  }

  if (fails == 0) std::cout << "[test_scanner] pass\n";
  return fails;
}
