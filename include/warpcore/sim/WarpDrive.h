#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/math/Quat.h"
#include "warpcore/math/Vec3.h"
#include "warpcore/sim/Events.h"
#include "warpcore/sim/Pose.h"

#include <string>
#include <string_view>

namespace warpcore::sim {

enum class WarpPhase : core::u8 {
  Idle = 0,
  Charging,
  Accelerating,
  Cruising,
  Decelerating,
  Arriving,
};

std::string_view toString(WarpPhase phase);

struct WarpParams {
  double baseSpeed{38.5};         // units/s at warp 1
  double chargeSeconds{2.5};
  double accelerateSeconds{1.0};
  double decelerateSeconds{1.2};
  double arriveSeconds{0.3};
  double arrivalBuffer{25.0};     // clearance kept from the destination surface
  double alignRate{2.5};          // 1/s, charging-phase turn toward the destination
  double alignDot{0.999};         // |q . facing| above this counts as aligned
  double braceAfterSeconds{1.0};  // earliest charging time for the brace call
};

// Everything the drive needs to resume a trip. Reset (keeping warpLevel) when
// the drive returns to idle.
struct WarpSession {
  WarpPhase phase{WarpPhase::Idle};
  int warpLevel{1};
  double warpSpeed{0.0};

  std::string destinationId;
  math::Vec3d origin{};
  math::Vec3d destinationCenter{};
  math::Vec3d destinationArrival{};
  math::Quatd facing{};           // orientation pointing at the destination

  double totalDistance{0.0};
  double distanceRemaining{0.0};
  double progress{0.0};           // 0..1
  double elapsedInPhase{0.0};
  double eta{0.0};                // seconds; infinite when speed is 0

  bool aligned{false};
  bool braceAnnounced{false};
};

struct WarpUpdateResult {
  WarpPhase phase{WarpPhase::Idle}; // phase after the update
  bool moved{false};                // position written this tick
  bool completed{false};            // trip finished; pose handed back
};

// Warp sequence: idle -> charging -> accelerating -> cruising ->
// decelerating -> arriving -> idle. Owns the pose for every non-idle phase.
class WarpDrive {
public:
  explicit WarpDrive(WarpParams params = {}, EventSink* events = nullptr)
      : params_(params), events_(events) {}

  // Refused (false, no change) unless idle.
  bool engage(const math::Vec3d& destinationCenter,
              double destinationRadius,
              const Pose& pose,
              std::string destinationId = {});

  // Emergency stop. Only from charging, accelerating or cruising.
  bool disengage();

  // Cruising only: jump to the arrival point and begin arriving.
  bool skipToDestination(Pose& pose);

  void setWarpLevel(int level);
  int warpLevel() const { return session_.warpLevel; }

  WarpUpdateResult update(double dtSeconds, Pose& pose);

  WarpPhase phase() const { return session_.phase; }
  bool active() const { return session_.phase != WarpPhase::Idle; }

  const WarpSession& session() const { return session_; }
  void restore(const WarpSession& s) { session_ = s; }

  double speedForLevel(int level) const;

  const WarpParams& params() const { return params_; }
  void setParams(const WarpParams& p) { params_ = p; }

  void setEventSink(EventSink* events) { events_ = events; }

  // Arrival point: the center pulled back toward the origin by radius + buffer.
  static math::Vec3d arrivalPoint(const math::Vec3d& origin,
                                  const math::Vec3d& center,
                                  double radius,
                                  double buffer);

  static double etaFor(double distance, double speed);

private:
  void enterPhase(WarpPhase next);
  void finish(Pose& pose);
  void emit(std::string_view id);

  WarpParams params_{};
  EventSink* events_{nullptr};
  WarpSession session_{};
};

// "mm:ss", or "--:--" for an undefined ETA.
std::string formatEta(double seconds);

} // namespace warpcore::sim
