#include "warpcore/sim/VoiceLines.h"

#include "warpcore/core/Log.h"

#include <algorithm>

namespace warpcore::sim {

std::string_view toString(VoiceCategory c) {
  switch (c) {
    case VoiceCategory::Warp: return "warp";
    case VoiceCategory::Navigation: return "navigation";
    case VoiceCategory::Tactical: return "tactical";
    case VoiceCategory::Shields: return "shields";
    case VoiceCategory::Damage: return "damage";
    case VoiceCategory::Alert: return "alert";
    case VoiceCategory::System: return "system";
  }
  return "unknown";
}

std::string_view toString(VoicePriority p) {
  switch (p) {
    case VoicePriority::Low: return "low";
    case VoicePriority::Medium: return "medium";
    case VoicePriority::High: return "high";
    case VoicePriority::Critical: return "critical";
  }
  return "unknown";
}

const std::vector<VoiceLine>& allVoiceLines() {
  using C = VoiceCategory;
  using P = VoicePriority;
  static const std::vector<VoiceLine> lines = {
    // Warp / navigation
    {"warp-charging", "Warp core charging.", C::Warp, P::Medium},
    {"engines-standby", "Engines at standby.", C::Warp, P::Medium},
    {"course-laid-in", "Course laid in.", C::Navigation, P::Medium},
    {"calculating-route", "Calculating warp trajectory.", C::Navigation, P::Medium},
    {"astrometrics-open", "Astrometrics display active.", C::Navigation, P::Low},
    {"brace-acceleration", "Brace for acceleration.", C::Warp, P::High},
    {"warp-engage", "Engage.", C::Warp, P::High},
    {"warp-disengage", "Dropping out of warp. Returning to impulse power.", C::Warp, P::Medium},
    {"arrival-destination", "Arrived at destination. Orbit established.", C::Navigation, P::High},
    {"emergency-stop", "Emergency stop! All hands, brace for impact.", C::Warp, P::Critical},

    // Tactical
    {"phasers-firing", "Phasers firing.", C::Tactical, P::Medium},
    {"torpedo-launched", "Photon torpedo away.", C::Tactical, P::Medium},
    {"target-acquired", "Target acquired. Weapons locked.", C::Tactical, P::Medium},
    {"target-destroyed", "Target destroyed.", C::Tactical, P::High},
    {"weapons-offline", "Warning. Weapons systems offline.", C::Tactical, P::High},
    {"phaser-overheat", "Phasers overheating. Cooldown required.", C::Tactical, P::Medium},
    {"torpedo-reloading", "Torpedo bay reloading.", C::Tactical, P::Low},

    // Shields
    {"shields-up", "Shields raised.", C::Shields, P::Medium},
    {"shields-down", "Shields down!", C::Shields, P::Critical},
    {"shields-critical", "Warning. Shield integrity critical.", C::Shields, P::High},
    {"forward-shields-failing", "Forward shields failing.", C::Shields, P::High},
    {"aft-shields-failing", "Aft shields failing.", C::Shields, P::High},

    // Damage
    {"hull-breach", "Hull breach detected. Emergency bulkheads engaged.", C::Damage, P::Critical},
    {"hull-damage", "Hull damage sustained.", C::Damage, P::High},
    {"hull-critical", "Warning. Hull integrity critical. Abandon ship protocols available.", C::Damage, P::Critical},

    // Alert
    {"red-alert", "Red alert. All hands to battle stations.", C::Alert, P::Critical},
    {"yellow-alert", "Yellow alert. All personnel, stand by.", C::Alert, P::High},
    {"green-alert", "Condition green. All clear.", C::Alert, P::Medium},

    // System
    {"welcome", "Welcome aboard. All decks report ready.", C::System, P::Low},
    {"systems-online", "All systems nominal. Ready for departure.", C::System, P::Low},
    {"navigation-set", "Course laid in.", C::Navigation, P::Medium},
  };
  return lines;
}

const VoiceLine* findVoiceLine(std::string_view id) {
  for (const auto& line : allVoiceLines()) {
    if (line.id == id) return &line;
  }
  return nullptr;
}

void Announcer::notify(std::string_view eventId) {
  const VoiceLine* line = findVoiceLine(eventId);
  if (!line) {
    WARPCORE_LOG_TRACE("Announcer: no line for event '" << eventId << "'");
    return;
  }
  enqueue(*line);
}

bool Announcer::announce(std::string_view id) {
  const VoiceLine* line = findVoiceLine(id);
  if (!line) {
    core::log(core::LogLevel::Warn, "Announcer: voice line not found: " + std::string(id));
    return false;
  }
  return enqueue(*line);
}

bool Announcer::announceImmediate(std::string_view id) {
  queue_.clear();
  current_ = nullptr;
  currentRemaining_ = 0.0;
  return announce(id);
}

void Announcer::stopAll() {
  queue_.clear();
  current_ = nullptr;
  currentRemaining_ = 0.0;
}

double Announcer::displaySeconds(const VoiceLine& line) const {
  return std::max(params_.minDisplaySeconds,
                  params_.secondsPerCharacter * (double)line.text.size());
}

bool Announcer::enqueue(const VoiceLine& line) {
  if (!enabled_) return false;

  const auto it = lastAnnounced_.find(line.id);
  if (it != lastAnnounced_.end() && clock_ - it->second < params_.debounceSeconds) {
    return false;
  }
  lastAnnounced_[std::string(line.id)] = clock_;

  if (line.priority == VoicePriority::Critical) {
    queue_.push_front(&line);
  } else {
    queue_.push_back(&line);
  }

  if (!current_) advance();
  return true;
}

void Announcer::advance() {
  if (queue_.empty()) {
    current_ = nullptr;
    currentRemaining_ = 0.0;
    return;
  }
  current_ = queue_.front();
  queue_.pop_front();
  currentRemaining_ = displaySeconds(*current_);
}

void Announcer::update(double dtSeconds) {
  if (dtSeconds <= 0.0) return;
  clock_ += dtSeconds;

  if (!current_) return;
  currentRemaining_ -= dtSeconds;
  if (currentRemaining_ <= 0.0) advance();
}

} // namespace warpcore::sim
