#include "warpcore/sim/SaveGame.h"

#include "warpcore/core/Log.h"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>

static bool nearly(double a, double b, double eps = 1e-12) {
  return std::abs(a - b) <= eps;
}

int test_savegame() {
  int fails = 0;

  using namespace warpcore;
  using namespace warpcore::sim;

  SimSnapshot s{};
  s.seed = 123456789ull;
  s.systemsRngState = 0x9E3779B97F4A7C15ull;
  s.cameraRngState = 77ull;
  s.elapsedSeconds = 42.5;
  s.tickCount = 2550;

  s.pose.position = {1.0 / 3.0, -2.0, 1e-7};
  s.pose.rotation = math::Quatd::fromAxisAngle({0.0, 1.0, 0.0}, 0.7);
  s.pose.velocity = {0.1, 0.0, -0.2};
  s.pose.angularVelocity = {0.0, 0.6, 0.0};

  s.flight.targetImpulse = 75.0;
  s.flight.impulsePercent = 61.25;
  s.flight.speed = 12.25;
  s.flight.warping = true;

  s.warp.phase = WarpPhase::Charging;
  s.warp.warpLevel = 4;
  s.warp.warpSpeed = 0.0;
  s.warp.destinationId = "earth";
  s.warp.destinationArrival = {10.0, 0.0, -20.0};
  s.warp.facing = math::Quatd::lookRotation({0.0, 0.0, 1.0});
  s.warp.totalDistance = 360.0;
  s.warp.distanceRemaining = 360.0;
  s.warp.eta = std::numeric_limits<double>::infinity();
  s.warp.braceAnnounced = true;

  s.ship.shields.quadrants = {100.0, 20.0, 55.5, 0.0};
  s.ship.shields.recompute();
  s.ship.hull = 64.0;
  s.ship.secondsSinceDamage = 1.5;
  s.ship.lastAlert = AlertLevel::Yellow;
  s.ship.subsystems.at("warp").power = 12.5;
  s.ship.subsystems.at("warp").status = SystemStatus::Damaged;
  s.ship.subsystems.at("phasers").active = true;

  s.weapons.phaserHeat = 37.5;
  s.weapons.firingPhasers = true;
  s.weapons.torpedoCount = 97;
  s.weapons.torpedoLoading = true;
  s.weapons.reloadRemaining = 0.75;
  s.weapons.nextTorpedoId = 4;
  s.weapons.targetId = "raider-1";
  {
    Torpedo t;
    t.id = 3;
    t.position = {5.0, 0.0, -5.0};
    t.velocity = {0.0, 0.0, -80.0};
    t.targetId = "raider-1";
    t.age = 0.25;
    s.weapons.torpedoes.push_back(t);
  }

  s.scan.complete = true;
  s.scan.progress = 100.0;
  s.scan.targetId = "mars";
  {
    ScanPayload p;
    p.population = "Colony: 12,000 \"Ares\" settlers";
    p.resources = {"Iron oxide", "Water ice"};
    p.atmosphereDetails = "Thin CO2";
    p.threatLevel = "Low";
    p.lifeSigns = "Human";
    p.tacticalAnalysis = "";
    s.scan.result = p;
  }

  {
    TargetHealthRecord r;
    r.id = "raider-1";
    r.health = 0.0;
    r.state = DamageState::Debris;
    r.explosionProgress = 1.0;
    r.debrisElapsed = 12.5;
    s.targets[r.id] = r;
  }

  {
    Contact c;
    c.id = "raider-1";
    c.name = "Raider One";
    c.position = {30.0, 0.0, -30.0};
    c.radius = 2.0;
    c.alive = false;
    s.contacts.push_back(c);
  }

  s.cameraMode.mode = CameraMode::Cinematic;
  s.cameraMode.previousMode = CameraMode::Flight;

  const std::string path = "savegame_test.sav";
  if (!saveToFile(s, path)) {
    std::cerr << "[test_savegame] saveToFile failed\n";
    return 1;
  }

  SimSnapshot l{};
  if (!loadFromFile(path, l)) {
    std::cerr << "[test_savegame] loadFromFile failed\n";
    std::filesystem::remove(path);
    return 1;
  }

  if (l.version != kSaveVersion || l.seed != s.seed || l.systemsRngState != s.systemsRngState
      || l.cameraRngState != s.cameraRngState || l.tickCount != 2550 || l.elapsedSeconds != 42.5) {
    std::cerr << "[test_savegame] header fields mismatch\n";
    ++fails;
  }

  if (l.pose.position.x != s.pose.position.x || l.pose.position.z != 1e-7 || l.pose.rotation.w != s.pose.rotation.w
      || l.pose.rotation.y != s.pose.rotation.y || l.pose.angularVelocity.y != 0.6) {
    std::cerr << "[test_savegame] pose should round trip exactly\n";
    ++fails;
  }

  if (!l.flight.warping || l.flight.impulsePercent != 61.25) {
    std::cerr << "[test_savegame] flight mismatch\n";
    ++fails;
  }

  if (l.warp.phase != WarpPhase::Charging || l.warp.warpLevel != 4 || l.warp.destinationId != "earth"
      || !std::isinf(l.warp.eta) || !l.warp.braceAnnounced || l.warp.aligned
      || !nearly(l.warp.facing.w, s.warp.facing.w) || l.warp.destinationArrival.z != -20.0) {
    std::cerr << "[test_savegame] warp session mismatch\n";
    ++fails;
  }

  if (l.ship.shields.quadrants[2] != 55.5 || !nearly(l.ship.shields.overall, s.ship.shields.overall)
      || l.ship.hull != 64.0 || l.ship.lastAlert != AlertLevel::Yellow || l.ship.subsystems.size() != 8) {
    std::cerr << "[test_savegame] ship systems mismatch\n";
    ++fails;
  }
  {
    const auto it = l.ship.subsystems.find("warp");
    if (it == l.ship.subsystems.end() || it->second.power != 12.5 || it->second.status != SystemStatus::Damaged
        || it->second.name != "Warp Drive" || !l.ship.subsystems.at("phasers").active) {
      std::cerr << "[test_savegame] subsystem records mismatch\n";
      ++fails;
    }
  }

  if (l.weapons.phaserHeat != 37.5 || !l.weapons.firingPhasers || l.weapons.torpedoCount != 97
      || !l.weapons.torpedoLoading || l.weapons.reloadRemaining != 0.75 || l.weapons.nextTorpedoId != 4
      || l.weapons.targetId != "raider-1" || l.weapons.torpedoes.size() != 1) {
    std::cerr << "[test_savegame] weapons mismatch\n";
    ++fails;
  } else {
    const Torpedo& t = l.weapons.torpedoes[0];
    if (t.id != 3 || t.velocity.z != -80.0 || t.targetId != "raider-1" || t.age != 0.25) {
      std::cerr << "[test_savegame] torpedo mismatch\n";
      ++fails;
    }
  }

  if (!l.scan.complete || l.scan.targetId != "mars" || !l.scan.result
      || l.scan.result->population != "Colony: 12,000 \"Ares\" settlers" || l.scan.result->resources.size() != 2
      || l.scan.result->resources[1] != "Water ice" || !l.scan.result->tacticalAnalysis.empty()) {
    std::cerr << "[test_savegame] scan session mismatch\n";
    ++fails;
  }

  {
    const auto it = l.targets.find("raider-1");
    if (l.targets.size() != 1 || it == l.targets.end() || it->second.state != DamageState::Debris
        || it->second.debrisElapsed != 12.5) {
      std::cerr << "[test_savegame] target health mismatch\n";
      ++fails;
    }
  }

  if (l.contacts.size() != 1 || l.contacts[0].name != "Raider One" || l.contacts[0].alive
      || l.contacts[0].position.x != 30.0) {
    std::cerr << "[test_savegame] contacts mismatch\n";
    ++fails;
  }

  if (l.cameraMode.mode != CameraMode::Cinematic || l.cameraMode.previousMode != CameraMode::Flight) {
    std::cerr << "[test_savegame] camera mode mismatch\n";
    ++fails;
  }

  // Files from a newer writer are refused; unknown records are skipped.
  core::setLogSink([](core::LogLevel, std::string_view) {});
  {
    {
      std::ofstream f(path, std::ios::trunc);
      f << "WarpcoreSave " << (kSaveVersion + 1) << "\n";
      f << "seed 5\n";
    }
    SimSnapshot n{};
    std::string err;
    if (loadFromFile(path, n, &err) || err.empty()) {
      std::cerr << "[test_savegame] newer save version should be refused\n";
      ++fails;
    }

    {
      std::ofstream f(path, std::ios::trunc);
      f << "WarpcoreSave " << kSaveVersion << "\n";
      f << "seed 5\n";
      f << "nebula 1 2 3 \"future data\"\n";
      f << "hull 50 0 1\n";
    }
    SimSnapshot u{};
    if (!loadFromFile(path, u, &err) || u.seed != 5 || u.ship.hull != 50.0) {
      std::cerr << "[test_savegame] unknown record should be skipped: " << err << "\n";
      ++fails;
    }

    {
      std::ofstream f(path, std::ios::trunc);
      f << "WarpcoreSave " << kSaveVersion << "\n";
      f << "pose 1 2 garbage 1 0 0 0 0 0 0 0 0 0\n";
    }
    SimSnapshot c{};
    err.clear();
    if (loadFromFile(path, c, &err) || err.find("pose") == std::string::npos) {
      std::cerr << "[test_savegame] non-numeric pose should be rejected: " << err << "\n";
      ++fails;
    }

    {
      std::ofstream f(path, std::ios::trunc);
      f << "WarpcoreSave " << kSaveVersion << "\n";
      f << "hull 40 0 1\n";
      f << "warpProgress 100 50 0.5 0 inf 1 0\n";
    }
    SimSnapshot i{};
    if (!loadFromFile(path, i, &err) || i.ship.hull != 40.0 || !std::isinf(i.warp.eta)
        || i.warp.distanceRemaining != 50.0) {
      std::cerr << "[test_savegame] numeric records should still load: " << err << "\n";
      ++fails;
    }

    {
      std::ofstream f(path, std::ios::trunc);
      f << "SomethingElse 1\n";
    }
    if (loadFromFile(path, u, &err)) {
      std::cerr << "[test_savegame] bad header accepted\n";
      ++fails;
    }
  }
  core::clearLogSink();

  std::filesystem::remove(path);

  if (fails == 0) std::cout << "[test_savegame] pass\n";
  return fails;
}
