#include "warpcore/sim/WarpDrive.h"

#include "warpcore/core/Log.h"
#include "warpcore/math/Math.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <limits>

namespace warpcore::sim {

std::string_view toString(WarpPhase phase) {
  switch (phase) {
    case WarpPhase::Idle: return "idle";
    case WarpPhase::Charging: return "charging";
    case WarpPhase::Accelerating: return "accelerating";
    case WarpPhase::Cruising: return "cruising";
    case WarpPhase::Decelerating: return "decelerating";
    case WarpPhase::Arriving: return "arriving";
  }
  return "unknown";
}

double WarpDrive::speedForLevel(int level) const {
  const double l = (double)level;
  return l * l * l * params_.baseSpeed;
}

double WarpDrive::etaFor(double distance, double speed) {
  if (speed <= 0.0) return std::numeric_limits<double>::infinity();
  return distance / speed;
}

math::Vec3d WarpDrive::arrivalPoint(const math::Vec3d& origin,
                                    const math::Vec3d& center,
                                    double radius,
                                    double buffer) {
  const math::Vec3d dir = (center - origin).normalized();
  return center - dir * (radius + buffer);
}

void WarpDrive::emit(std::string_view id) {
  if (events_) events_->notify(id);
}

bool WarpDrive::engage(const math::Vec3d& destinationCenter,
                       double destinationRadius,
                       const Pose& pose,
                       std::string destinationId) {
  if (session_.phase != WarpPhase::Idle) {
    core::log(core::LogLevel::Info, "WarpDrive: engage refused, drive is " + std::string(toString(session_.phase)));
    return false;
  }

  WarpSession s;
  s.warpLevel = session_.warpLevel;
  s.destinationId = std::move(destinationId);
  s.origin = pose.position;
  s.destinationCenter = destinationCenter;
  s.destinationArrival = arrivalPoint(pose.position, destinationCenter,
                                      std::max(0.0, destinationRadius), params_.arrivalBuffer);
  s.totalDistance = s.origin.distanceTo(s.destinationArrival);
  s.distanceRemaining = s.totalDistance;
  s.progress = 0.0;
  s.warpSpeed = speedForLevel(s.warpLevel);
  s.eta = etaFor(s.distanceRemaining, s.warpSpeed);

  const math::Vec3d toDest = destinationCenter - pose.position;
  s.facing = (toDest.lengthSq() > 1e-12) ? math::Quatd::lookRotation(toDest) : pose.rotation;

  session_ = std::move(s);
  enterPhase(WarpPhase::Charging);
  return true;
}

bool WarpDrive::disengage() {
  switch (session_.phase) {
    case WarpPhase::Charging:
    case WarpPhase::Accelerating:
    case WarpPhase::Cruising:
      break;
    default:
      return false;
  }
  emit(events::EmergencyStop);
  enterPhase(WarpPhase::Decelerating);
  return true;
}

bool WarpDrive::skipToDestination(Pose& pose) {
  if (session_.phase != WarpPhase::Cruising) return false;

  session_.progress = 1.0;
  session_.distanceRemaining = 0.0;
  session_.eta = 0.0;
  pose.position = session_.destinationArrival;
  pose.rotation = session_.facing;
  enterPhase(WarpPhase::Arriving);
  return true;
}

void WarpDrive::setWarpLevel(int level) {
  session_.warpLevel = math::clamp(level, 1, 9);

  switch (session_.phase) {
    case WarpPhase::Charging:
    case WarpPhase::Accelerating:
    case WarpPhase::Cruising:
      session_.warpSpeed = speedForLevel(session_.warpLevel);
      session_.eta = etaFor(session_.distanceRemaining, session_.warpSpeed);
      break;
    default:
      break;
  }
}

void WarpDrive::enterPhase(WarpPhase next) {
  WARPCORE_LOG_DEBUG("WarpDrive: " << toString(session_.phase) << " -> " << toString(next)
                     << " (" << session_.distanceRemaining << " to go)");
  session_.phase = next;
  session_.elapsedInPhase = 0.0;

  switch (next) {
    case WarpPhase::Charging:
      session_.aligned = false;
      session_.braceAnnounced = false;
      emit(events::WarpCharging);
      break;
    case WarpPhase::Accelerating: emit(events::WarpEngage); break;
    case WarpPhase::Cruising: emit(events::WarpCruise); break;
    case WarpPhase::Decelerating: emit(events::WarpDisengage); break;
    default: break;
  }
}

void WarpDrive::finish(Pose& pose) {
  // Face the body itself (not the buffered stop point), wings level.
  const math::Vec3d toCenter = session_.destinationCenter - pose.position;
  math::EulerAngles e = (toCenter.lengthSq() > 1e-12)
      ? math::Quatd::lookRotation(toCenter).toEuler()
      : pose.rotation.toEuler();
  e.roll = 0.0;
  pose.rotation = math::Quatd::fromEuler(e).normalized();
  pose.velocity = {0, 0, 0};
  pose.angularVelocity = {0, 0, 0};

  core::log(core::LogLevel::Debug, "WarpDrive: arriving -> idle");
  WarpSession idle;
  idle.warpLevel = session_.warpLevel;
  session_ = idle;

  emit(events::ArrivalDestination);
}

WarpUpdateResult WarpDrive::update(double dtSeconds, Pose& pose) {
  WarpUpdateResult r;
  r.phase = session_.phase;
  if (session_.phase == WarpPhase::Idle || dtSeconds <= 0.0) return r;

  session_.elapsedInPhase += dtSeconds;

  switch (session_.phase) {
    case WarpPhase::Charging: {
      pose.rotation = math::Quatd::slerp(pose.rotation, session_.facing,
                                         math::smoothingAlpha(params_.alignRate, dtSeconds));
      pose.angularVelocity = {0, 0, 0};

      if (std::abs(math::dot(pose.rotation, session_.facing)) > params_.alignDot) {
        session_.aligned = true;
        if (!session_.braceAnnounced && session_.elapsedInPhase > params_.braceAfterSeconds) {
          session_.braceAnnounced = true;
          emit(events::BraceAcceleration);
        }
      }

      if (session_.elapsedInPhase >= params_.chargeSeconds) {
        pose.rotation = session_.facing;
        session_.aligned = true;
        enterPhase(WarpPhase::Accelerating);
      }
      break;
    }

    case WarpPhase::Accelerating:
      pose.rotation = session_.facing;
      if (session_.elapsedInPhase >= params_.accelerateSeconds) {
        enterPhase(WarpPhase::Cruising);
      }
      break;

    case WarpPhase::Cruising: {
      pose.rotation = session_.facing;

      const double travelled = session_.warpSpeed * dtSeconds;
      session_.distanceRemaining = std::max(0.0, session_.distanceRemaining - travelled);
      session_.progress = (session_.totalDistance > 0.0)
          ? 1.0 - session_.distanceRemaining / session_.totalDistance
          : 1.0;

      r.moved = true;
      if (session_.distanceRemaining <= 0.0) {
        pose.position = session_.destinationArrival;
        session_.progress = 1.0;
        session_.eta = 0.0;
        enterPhase(WarpPhase::Decelerating);
      } else {
        pose.position = math::lerp(session_.origin, session_.destinationArrival, session_.progress);
        session_.eta = etaFor(session_.distanceRemaining, session_.warpSpeed);
      }
      pose.velocity = (session_.phase == WarpPhase::Cruising)
          ? session_.facing.forward() * session_.warpSpeed
          : math::Vec3d{0, 0, 0};
      break;
    }

    case WarpPhase::Decelerating:
      pose.rotation = session_.facing;
      pose.velocity = {0, 0, 0};
      if (session_.elapsedInPhase >= params_.decelerateSeconds) {
        enterPhase(WarpPhase::Arriving);
      }
      break;

    case WarpPhase::Arriving:
      pose.rotation = session_.facing;
      if (session_.elapsedInPhase >= params_.arriveSeconds) {
        finish(pose);
        r.completed = true;
      }
      break;

    case WarpPhase::Idle:
      break;
  }

  r.phase = session_.phase;
  return r;
}

std::string formatEta(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0.0) return "--:--";
  const long total = (long)std::floor(seconds);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02ld:%02ld", total / 60, total % 60);
  return buf;
}

} // namespace warpcore::sim
