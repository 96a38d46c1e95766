#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/sim/Events.h"

#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace warpcore::sim {

enum class VoiceCategory : core::u8 {
  Warp = 0,
  Navigation,
  Tactical,
  Shields,
  Damage,
  Alert,
  System,
};

enum class VoicePriority : core::u8 {
  Low = 0,
  Medium,
  High,
  Critical,
};

std::string_view toString(VoiceCategory c);
std::string_view toString(VoicePriority p);

struct VoiceLine {
  std::string_view id;
  std::string_view text;
  VoiceCategory category{VoiceCategory::System};
  VoicePriority priority{VoicePriority::Low};
};

const std::vector<VoiceLine>& allVoiceLines();

// nullptr if no line has this id.
const VoiceLine* findVoiceLine(std::string_view id);

struct AnnouncerParams {
  double debounceSeconds{5.0};    // same line is not repeated within this window
  double minDisplaySeconds{2.0};
  double secondsPerCharacter{0.05};
};

// Subtitle queue for voice lines. Produces no audio: the host reads current()
// and may hand it to a speech or clip player.
class Announcer final : public EventSink {
public:
  explicit Announcer(AnnouncerParams params = {}) : params_(params) {}

  // Events without a matching line are dropped quietly.
  void notify(std::string_view eventId) override;

  // Queue a line. Unknown ids are logged and ignored. Returns false when the
  // line is unknown or debounced.
  bool announce(std::string_view id);

  // Drop the current line and the queue, then announce.
  bool announceImmediate(std::string_view id);

  void stopAll();

  void update(double dtSeconds);

  const VoiceLine* current() const { return current_; }
  double currentRemainingSeconds() const { return currentRemaining_; }
  std::size_t queued() const { return queue_.size(); }

  double displaySeconds(const VoiceLine& line) const;

  void setEnabled(bool enabled) { enabled_ = enabled; }
  bool enabled() const { return enabled_; }

private:
  bool enqueue(const VoiceLine& line);
  void advance();

  AnnouncerParams params_{};
  bool enabled_{true};

  double clock_{0.0};
  const VoiceLine* current_{nullptr};
  double currentRemaining_{0.0};
  std::deque<const VoiceLine*> queue_;
  std::map<std::string, double, std::less<>> lastAnnounced_;
};

} // namespace warpcore::sim
