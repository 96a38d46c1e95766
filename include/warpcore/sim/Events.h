#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::sim {

// Symbolic notification ids. Where a voice line exists the id is shared with it.
namespace events {

// Warp
inline constexpr std::string_view WarpCharging       = "warp-charging";
inline constexpr std::string_view BraceAcceleration  = "brace-acceleration";
inline constexpr std::string_view WarpEngage         = "warp-engage";
inline constexpr std::string_view WarpCruise         = "warp-cruise";
inline constexpr std::string_view WarpDisengage      = "warp-disengage";
inline constexpr std::string_view EmergencyStop      = "emergency-stop";
inline constexpr std::string_view ArrivalDestination = "arrival-destination";

// Shields / hull / subsystems
inline constexpr std::string_view ShieldsUp     = "shields-up";
inline constexpr std::string_view ShieldsDown   = "shields-down";
inline constexpr std::string_view HullDamage    = "hull-damage";
inline constexpr std::string_view HullCritical  = "hull-critical";
inline constexpr std::string_view HullBreach    = "hull-breach";
inline constexpr std::string_view SystemDamaged = "system-damaged";
inline constexpr std::string_view SystemOffline = "system-offline";

// Alert level changes
inline constexpr std::string_view RedAlert    = "red-alert";
inline constexpr std::string_view YellowAlert = "yellow-alert";
inline constexpr std::string_view GreenAlert  = "green-alert";

// Weapons / targets
inline constexpr std::string_view PhasersFiring   = "phasers-firing";
inline constexpr std::string_view PhaserOverheat  = "phaser-overheat";
inline constexpr std::string_view TorpedoLaunched = "torpedo-launched";
inline constexpr std::string_view TorpedoImpact   = "torpedo-impact";
inline constexpr std::string_view TargetAcquired  = "target-acquired";
inline constexpr std::string_view TargetDestroyed = "target-destroyed";
inline constexpr std::string_view TargetRespawned = "target-respawned";

// Scanner
inline constexpr std::string_view ScanStarted  = "scan-started";
inline constexpr std::string_view ScanComplete = "scan-complete";
inline constexpr std::string_view ScanFailed   = "scan-failed";

} // namespace events

// Fire-and-forget notification hook (audio cues, narration, HUD flashes).
// The simulation never waits on or inspects what a sink does.
class EventSink {
public:
  virtual ~EventSink() = default;
  virtual void notify(std::string_view eventId) = 0;
};

class NullEventSink final : public EventSink {
public:
  void notify(std::string_view) override {}
};

// Keeps every event in order. Used by tests and the sandbox timeline.
class RecordingEventSink final : public EventSink {
public:
  void notify(std::string_view eventId) override { events_.emplace_back(eventId); }

  const std::vector<std::string>& events() const { return events_; }

  std::size_t count(std::string_view eventId) const {
    return (std::size_t)std::count(events_.begin(), events_.end(), eventId);
  }
  bool contains(std::string_view eventId) const { return count(eventId) > 0; }

  void clear() { events_.clear(); }

private:
  std::vector<std::string> events_;
};

// Forwards to any number of non-owned sinks.
class EventFanout final : public EventSink {
public:
  void add(EventSink* sink) {
    if (sink && sink != this) sinks_.push_back(sink);
  }
  void remove(EventSink* sink) {
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
  }

  void notify(std::string_view eventId) override {
    for (EventSink* s : sinks_) s->notify(eventId);
  }

private:
  std::vector<EventSink*> sinks_;
};

} // namespace warpcore::sim
