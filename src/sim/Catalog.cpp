#include "warpcore/sim/Catalog.h"

#include <limits>

namespace warpcore::sim {

std::string_view toString(BodyKind kind) {
  switch (kind) {
    case BodyKind::Star: return "star";
    case BodyKind::Planet: return "planet";
    case BodyKind::Dwarf: return "dwarf";
    case BodyKind::Moon: return "moon";
    case BodyKind::Station: return "station";
    case BodyKind::Asteroid: return "asteroid";
  }
  return "unknown";
}

ScanPayload fallbackScanPayload() {
  ScanPayload p;
  p.population = "Unknown";
  p.resources = {"Unknown"};
  p.atmosphereDetails = "Standard";
  p.threatLevel = "Unknown";
  p.lifeSigns = "Inconclusive";
  p.tacticalAnalysis = "No tactical data available.";
  return p;
}

void Catalog::addBody(Body body) {
  bodies_.push_back(std::move(body));
}

void Catalog::addContact(Contact contact) {
  contacts_.push_back(std::move(contact));
}

bool Catalog::removeContact(std::string_view id) {
  for (auto it = contacts_.begin(); it != contacts_.end(); ++it) {
    if (it->id == id) {
      contacts_.erase(it);
      return true;
    }
  }
  return false;
}

const Body* Catalog::findBody(std::string_view id) const {
  for (const auto& b : bodies_) {
    if (b.id == id) return &b;
  }
  return nullptr;
}

Contact* Catalog::findContact(std::string_view id) {
  for (auto& c : contacts_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

const Contact* Catalog::findContact(std::string_view id) const {
  for (const auto& c : contacts_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

std::optional<TargetRef> Catalog::findTarget(std::string_view id) const {
  if (const Body* b = findBody(id)) {
    TargetRef t;
    t.id = b->id;
    t.name = b->name;
    t.position = b->position;
    t.radius = b->radius;
    t.scan = b->scan ? &*b->scan : nullptr;
    t.contact = false;
    return t;
  }
  if (const Contact* c = findContact(id)) {
    if (!c->alive) return std::nullopt;
    TargetRef t;
    t.id = c->id;
    t.name = c->name;
    t.position = c->position;
    t.radius = c->radius;
    t.contact = true;
    return t;
  }
  return std::nullopt;
}

const Body* Catalog::nearestBody(const math::Vec3d& pos) const {
  const Body* best = nullptr;
  double bestDist = std::numeric_limits<double>::infinity();
  for (const auto& b : bodies_) {
    const double d = (b.position - pos).lengthSq();
    if (d < bestDist) {
      bestDist = d;
      best = &b;
    }
  }
  return best;
}

std::vector<const Body*> Catalog::navigableBodies() const {
  std::vector<const Body*> out;
  for (const auto& b : bodies_) {
    if (b.navigable) out.push_back(&b);
  }
  return out;
}

namespace {

Body makeBody(const char* id, const char* name, BodyKind kind,
              math::Vec3d pos, double radius, const char* parent = "") {
  Body b;
  b.id = id;
  b.name = name;
  b.kind = kind;
  b.position = pos;
  b.radius = radius;
  b.parentId = parent;
  // Planets, dwarf planets and stations are offered for navigation.
  b.navigable = (kind == BodyKind::Planet || kind == BodyKind::Dwarf || kind == BodyKind::Station);
  return b;
}

ScanPayload payload(const char* population,
                    std::vector<std::string> resources,
                    const char* atmosphere,
                    const char* threat,
                    const char* lifeSigns,
                    const char* tactical) {
  ScanPayload p;
  p.population = population;
  p.resources = std::move(resources);
  p.atmosphereDetails = atmosphere;
  p.threatLevel = threat;
  p.lifeSigns = lifeSigns;
  p.tacticalAnalysis = tactical;
  return p;
}

} // namespace

Catalog makeSolCatalog() {
  Catalog c;

  Body sol = makeBody("sol", "Sol", BodyKind::Star, {0, 0, -500}, 30);
  sol.scan = payload("None", {"Hydrogen", "Helium"}, "Plasma corona, 1.5 million K",
                     "Extreme", "None", "Stellar radiation exceeds shield tolerance inside 50 units.");
  c.addBody(std::move(sol));

  c.addBody(makeBody("mercury", "Mercury", BodyKind::Planet, {80, 10, -420}, 1.5));
  Body venus = makeBody("venus", "Venus", BodyKind::Planet, {150, -20, -350}, 3.5);
  venus.scan = payload("1,200 (orbital research)", {"Sulfuric compounds", "Carbon dioxide"},
                       "CO2 96%, N2 3.5%, sulfuric acid clouds", "Low", "Research crew only",
                       "Dense atmosphere degrades sensor lock below 40 km.");
  c.addBody(std::move(venus));

  Body earth = makeBody("earth", "Earth", BodyKind::Planet, {200, 0, -200}, 4);
  earth.scan = payload("9.2 billion", {"Water", "Dilithium reserves", "Industrial replicators"},
                       "N2 78%, O2 21%, Ar 0.9%", "None", "Abundant",
                       "Starfleet Command. Orbital defense grid active.");
  c.addBody(std::move(earth));
  c.addBody(makeBody("luna", "Luna", BodyKind::Moon, {220, 8, -185}, 1.1, "earth"));

  Body mars = makeBody("mars", "Mars", BodyKind::Planet, {350, -30, -50}, 2.5);
  mars.scan = payload("480 million", {"Iron oxide", "Water ice", "Duranium"},
                      "CO2 95% (terraforming in progress)", "None", "Abundant (colonies)",
                      "Utopia Planitia Fleet Yards. Ships under construction.");
  c.addBody(std::move(mars));
  c.addBody(makeBody("phobos", "Phobos", BodyKind::Moon, {360, -25, -45}, 0.4, "mars"));
  c.addBody(makeBody("deimos", "Deimos", BodyKind::Moon, {370, -35, -60}, 0.3, "mars"));

  c.addBody(makeBody("ceres", "Ceres", BodyKind::Dwarf, {500, 20, 100}, 1.2));
  c.addBody(makeBody("vesta", "Vesta", BodyKind::Asteroid, {480, -15, 150}, 0.8));

  Body jupiter = makeBody("jupiter", "Jupiter", BodyKind::Planet, {700, 40, 400}, 15);
  jupiter.scan = payload("None", {"Hydrogen", "Helium", "Metallic hydrogen"},
                         "H2 90%, He 10%, ammonia clouds", "Medium", "None",
                         "Radiation belts hazardous to unshielded craft.");
  c.addBody(std::move(jupiter));
  c.addBody(makeBody("io", "Io", BodyKind::Moon, {730, 45, 390}, 1.0, "jupiter"));
  c.addBody(makeBody("europa", "Europa", BodyKind::Moon, {745, 35, 410}, 0.9, "jupiter"));
  c.addBody(makeBody("ganymede", "Ganymede", BodyKind::Moon, {760, 50, 430}, 1.5, "jupiter"));
  c.addBody(makeBody("callisto", "Callisto", BodyKind::Moon, {780, 30, 450}, 1.3, "jupiter"));

  c.addBody(makeBody("saturn", "Saturn", BodyKind::Planet, {1000, -50, 800}, 13));
  c.addBody(makeBody("titan", "Titan", BodyKind::Moon, {1040, -40, 820}, 1.6, "saturn"));
  c.addBody(makeBody("enceladus", "Enceladus", BodyKind::Moon, {1020, -60, 790}, 0.6, "saturn"));
  c.addBody(makeBody("mimas", "Mimas", BodyKind::Moon, {985, -45, 780}, 0.4, "saturn"));
  c.addBody(makeBody("rhea", "Rhea", BodyKind::Moon, {1060, -55, 840}, 0.8, "saturn"));

  c.addBody(makeBody("uranus", "Uranus", BodyKind::Planet, {1400, 80, 1400}, 9));
  c.addBody(makeBody("miranda", "Miranda", BodyKind::Moon, {1420, 85, 1390}, 0.5, "uranus"));
  c.addBody(makeBody("ariel", "Ariel", BodyKind::Moon, {1430, 75, 1415}, 0.6, "uranus"));
  c.addBody(makeBody("titania", "Titania", BodyKind::Moon, {1445, 90, 1425}, 0.8, "uranus"));

  c.addBody(makeBody("neptune", "Neptune", BodyKind::Planet, {1800, -100, 2000}, 8));
  c.addBody(makeBody("triton", "Triton", BodyKind::Moon, {1830, -95, 2020}, 1.2, "neptune"));

  c.addBody(makeBody("pluto", "Pluto", BodyKind::Dwarf, {2200, 150, 2500}, 1.0));
  c.addBody(makeBody("charon", "Charon", BodyKind::Moon, {2215, 155, 2510}, 0.6, "pluto"));
  c.addBody(makeBody("eris", "Eris", BodyKind::Dwarf, {2800, -200, 3200}, 1.05));
  c.addBody(makeBody("dysnomia", "Dysnomia", BodyKind::Moon, {2815, -195, 3210}, 0.3, "eris"));
  c.addBody(makeBody("makemake", "Makemake", BodyKind::Dwarf, {2500, 100, 2800}, 0.9));
  c.addBody(makeBody("haumea", "Haumea", BodyKind::Dwarf, {2600, -50, 2900}, 0.8));

  Body dock = makeBody("spacedock", "Earth Spacedock", BodyKind::Station, {220, 10, -185}, 1.5);
  dock.scan = payload("12,000", {"Starship components", "Deuterium"},
                      "Pressurized, class M", "None", "12,000 humanoid",
                      "Fleet maintenance facility. Shields raised.");
  c.addBody(std::move(dock));

  Body ds1 = makeBody("deepspace1", "Deep Space 1", BodyKind::Station, {550, 0, 180}, 1.0);
  ds1.scan = payload("340", {"Deuterium", "Medical supplies"},
                     "Pressurized, class M", "Low", "340 humanoid",
                     "Research and resupply outpost. Light phaser emplacements.");
  c.addBody(std::move(ds1));

  return c;
}

} // namespace warpcore::sim
