#include "warpcore/core/Args.h"
#include "warpcore/core/JsonWriter.h"
#include "warpcore/core/Log.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/SaveGame.h"
#include "warpcore/sim/Simulation.h"
#include "warpcore/sim/Tuning.h"

#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using namespace warpcore;

namespace {

struct TimelineEntry {
  double t{0.0};
  std::string what;
};

// Stamps every event with the session clock.
class TimelineSink final : public sim::EventSink {
public:
  explicit TimelineSink(const sim::Simulation& s) : sim_(s) {}

  void notify(std::string_view eventId) override {
    entries.push_back({sim_.elapsedSeconds(), std::string(eventId)});
  }

  std::vector<TimelineEntry> entries;

private:
  const sim::Simulation& sim_;
};

void printHelp() {
  std::cout << "warpcore_sandbox\n"
            << "  --dest <id>            Warp destination (default: earth)\n"
            << "  --warp <1-9>           Warp level (default: 1)\n"
            << "  --seconds <s>          Max simulated time (default: 120)\n"
            << "  --dt <s>               Fixed tick (default: 1/60)\n"
            << "  --seed <u64>           Session seed (default: 1)\n"
            << "  --tuning <path>        Load balance constants from a tuning file\n"
            << "  --debris <n>           Apply n debris collisions before departure\n"
            << "  --list                 Print the destination catalog and exit\n"
            << "  --log-level <level>    trace|debug|info|warn|error|off (default: info)\n"
            << "  --json                 Emit machine-readable JSON to stdout (also works with --out)\n"
            << "  --out <path>           Write JSON output to a file instead of stdout\n"
            << "\n"
            << "Save/load (tooling):\n"
            << "  --load <path>          Resume a saved session before running\n"
            << "  --save <path>          Save the resulting session\n";
}

void printCatalog(const sim::Catalog& catalog, const math::Vec3d& from) {
  std::cout << std::left << std::setw(12) << "id" << std::setw(22) << "name" << std::setw(9) << "kind"
            << std::right << std::setw(8) << "radius" << std::setw(10) << "dist" << "  nav\n";
  for (const auto& b : catalog.bodies()) {
    std::cout << std::left << std::setw(12) << b.id << std::setw(22) << b.name << std::setw(9) << sim::toString(b.kind)
              << std::right << std::fixed << std::setprecision(1) << std::setw(8) << b.radius << std::setw(10)
              << b.position.distanceTo(from) << "  " << (b.navigable ? "yes" : "-") << "\n";
  }
}

} // namespace

int main(int argc, char** argv) {
  core::Args args(argc, argv);

  core::LogLevel logLevel = core::LogLevel::Info;
  {
    std::string name;
    if (args.getString("log-level", name)) {
      const auto parsed = core::parseLogLevel(name);
      if (!parsed) {
        std::cerr << "Unknown --log-level '" << name << "'\n";
        return 1;
      }
      logLevel = *parsed;
    }
  }
  core::setLogLevel(logLevel);

  for (const auto& name : args.unknownOptions({"help", "h", "log-level", "dest", "warp", "seconds", "dt", "seed",
                                               "debris", "json", "out", "tuning", "load", "save", "list"})) {
    core::log(core::LogLevel::Warn, "Ignoring unknown option --" + name);
  }

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  std::string dest = "earth";
  (void)args.getString("dest", dest);

  int warpLevel = 1;
  (void)args.getInt("warp", warpLevel);

  double maxSeconds = 120.0;
  (void)args.getDouble("seconds", maxSeconds);

  double dt = 1.0 / 60.0;
  (void)args.getDouble("dt", dt);
  if (dt <= 0.0) {
    std::cerr << "--dt must be positive\n";
    return 1;
  }

  core::u64 seed = 1;
  {
    unsigned long long s = (unsigned long long)seed;
    (void)args.getU64("seed", s);
    seed = (core::u64)s;
  }

  int debris = 0;
  (void)args.getInt("debris", debris);

  const bool json = args.hasFlag("json");
  std::string outPath;
  (void)args.getString("out", outPath);

  std::string tuningPath;
  std::string loadPath;
  std::string savePath;
  (void)args.getString("tuning", tuningPath);
  (void)args.getString("load", loadPath);
  (void)args.getString("save", savePath);

  sim::SimTuning tuning;
  if (!tuningPath.empty()) {
    std::string err;
    if (!sim::loadTuning(tuningPath, tuning, &err)) {
      std::cerr << "Tuning load failed: " << err << "\n";
      return 1;
    }
  }

  sim::Simulation s(sim::makeSolCatalog(), tuning, seed);

  if (args.hasFlag("list")) {
    printCatalog(s.catalog(), s.pose().position);
    return 0;
  }

  if (!loadPath.empty()) {
    sim::SimSnapshot snap;
    std::string err;
    if (!sim::loadFromFile(loadPath, snap, &err) || !s.restore(snap, &err)) {
      std::cerr << "Load failed: " << err << "\n";
      return 1;
    }
  }

  TimelineSink timeline(s);
  s.events().add(&timeline);

  for (int i = 0; i < debris; ++i) s.handleDebrisCollision();

  s.setWarpLevel(warpLevel);

  // A resumed session may already be mid-trip.
  if (!s.warp().active()) {
    if (!s.engageWarp(dest)) {
      std::cerr << "Warp engage to '" << dest << "' refused\n";
      return 1;
    }
  }
  const std::string destId = s.warp().session().destinationId;
  const double tripStart = s.elapsedSeconds();
  const double eta = s.warp().session().eta;

  std::vector<TimelineEntry> phases;
  phases.push_back({s.elapsedSeconds(), std::string(sim::toString(s.warp().phase()))});

  const double stopAt = s.elapsedSeconds() + maxSeconds;
  while (s.elapsedSeconds() < stopAt) {
    s.tick(dt);
    const std::string phase(sim::toString(s.warp().phase()));
    if (phases.back().what != phase) phases.push_back({s.elapsedSeconds(), phase});
    if (!s.warp().active()) break;
  }

  const bool arrived = !s.warp().active();
  const sim::Body* body = s.catalog().findBody(destId);
  const double distToCenter = body ? s.pose().position.distanceTo(body->position) : 0.0;
  const double tripSeconds = s.elapsedSeconds() - tripStart;

  if (!savePath.empty()) {
    std::string err;
    if (!sim::saveToFile(s.snapshot(), savePath, &err)) {
      std::cerr << "Save failed: " << err << "\n";
      return 1;
    }
  }

  if (json) {
    std::unique_ptr<std::ofstream> jsonFile;
    std::ostream* jsonStream = &std::cout;
    if (!outPath.empty()) {
      jsonFile = std::make_unique<std::ofstream>(outPath, std::ios::out | std::ios::trunc);
      if (!*jsonFile) {
        std::cerr << "Failed to open --out file: " << outPath << "\n";
        return 1;
      }
      jsonStream = jsonFile.get();
    }

    core::JsonWriter j(*jsonStream, /*pretty=*/true);
    j.beginObject();
    j.key("seed"); j.value((unsigned long long)seed);
    j.field("destination", destId);
    j.field("warpLevel", s.warp().warpLevel());
    j.field("etaSeconds", eta);
    j.field("tripSeconds", tripSeconds);
    j.field("arrived", arrived);

    j.key("phases");
    j.beginArray();
    for (const auto& p : phases) {
      j.beginObject();
      j.field("t", p.t);
      j.field("phase", p.what);
      j.endObject();
    }
    j.endArray();

    j.key("events");
    j.beginArray();
    for (const auto& e : timeline.entries) {
      j.beginObject();
      j.field("t", e.t);
      j.field("id", e.what);
      j.endObject();
    }
    j.endArray();

    j.key("final");
    j.beginObject();
    j.triple("position", s.pose().position.x, s.pose().position.y, s.pose().position.z);
    const auto e = s.pose().euler();
    j.triple("euler", e.pitch, e.yaw, e.roll);
    j.field("distanceToCenter", distToCenter);
    j.field("hull", s.ship().hull());
    j.field("shields", s.ship().shields().overall);
    j.field("alert", sim::toString(s.ship().alertLevel()));
    j.endObject();

    j.endObject();
    *jsonStream << "\n";
    return 0;
  }

  std::cout << "Warp " << s.warp().warpLevel() << " to " << destId << "  ETA " << sim::formatEta(eta) << "\n";
  std::cout << "\nPhases:\n";
  for (const auto& p : phases) {
    std::cout << "  " << std::fixed << std::setprecision(2) << std::setw(8) << p.t << "s  " << p.what << "\n";
  }
  std::cout << "\nEvents:\n";
  for (const auto& e : timeline.entries) {
    std::cout << "  " << std::fixed << std::setprecision(2) << std::setw(8) << e.t << "s  " << e.what << "\n";
  }

  const auto& pos = s.pose().position;
  std::cout << "\n" << (arrived ? "Arrived" : "Still in transit") << " after " << std::setprecision(2) << tripSeconds
            << "s at (" << pos.x << ", " << pos.y << ", " << pos.z << "), " << distToCenter << " from center\n";
  std::cout << "Hull " << std::setprecision(1) << s.ship().hull() << "  Shields " << s.ship().shields().overall
            << "  Alert " << sim::toString(s.ship().alertLevel()) << "\n";
  return 0;
}
