#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/math/Vec3.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::sim {

enum class BodyKind : core::u8 {
  Star = 0,
  Planet,
  Dwarf,
  Moon,
  Station,
  Asteroid,
};

std::string_view toString(BodyKind kind);

// What a completed sensor sweep reports about a target.
struct ScanPayload {
  std::string population;
  std::vector<std::string> resources;
  std::string atmosphereDetails;
  std::string threatLevel;
  std::string lifeSigns;
  std::string tacticalAnalysis;
};

// Returned when a target carries no predefined payload.
ScanPayload fallbackScanPayload();

struct Body {
  std::string id;
  std::string name;
  BodyKind kind{BodyKind::Planet};

  math::Vec3d position{};
  double radius{1.0};

  // Offered as a warp destination.
  bool navigable{false};

  // Moons reference their primary.
  std::string parentId;

  std::optional<ScanPayload> scan;
};

// Hostile contact. Positions are scripted by the host.
struct Contact {
  std::string id;
  std::string name;
  math::Vec3d position{};
  double radius{1.0};
  bool alive{true};
};

// Read-only view over either a body or a contact. Valid until the catalog is
// next mutated.
struct TargetRef {
  std::string_view id;
  std::string_view name;
  math::Vec3d position{};
  double radius{0.0};
  const ScanPayload* scan{nullptr};
  bool contact{false};
};

// Externally owned, mostly static set of things the ship can fly to, target
// and scan.
class Catalog {
public:
  void addBody(Body body);
  void addContact(Contact contact);
  bool removeContact(std::string_view id);

  const std::vector<Body>& bodies() const { return bodies_; }
  const std::vector<Contact>& contacts() const { return contacts_; }

  const Body* findBody(std::string_view id) const;
  Contact* findContact(std::string_view id);
  const Contact* findContact(std::string_view id) const;

  // Bodies first, then live contacts. Dead contacts are not found.
  std::optional<TargetRef> findTarget(std::string_view id) const;

  const Body* nearestBody(const math::Vec3d& pos) const;

  std::vector<const Body*> navigableBodies() const;

private:
  std::vector<Body> bodies_;
  std::vector<Contact> contacts_;
};

// Compressed Sol system: the star, planets, major moons, dwarf planets and
// two stations. Units are scene units; Sol sits at (0, 0, -500).
Catalog makeSolCatalog();

} // namespace warpcore::sim
