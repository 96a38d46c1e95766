#include "warpcore/sim/Scanner.h"

#include "warpcore/core/Log.h"

#include <algorithm>

namespace warpcore::sim {

std::string_view scanErrorMessage(ScanError e) {
  switch (e) {
    case ScanError::None: return "";
    case ScanError::OutOfRange: return "Target out of range";
    case ScanError::SignalLost: return "Target signal lost - out of range";
  }
  return "";
}

void Scanner::emit(std::string_view id) {
  if (events_) events_->notify(id);
}

bool Scanner::startScan(const TargetRef& target, const math::Vec3d& shipPos) {
  if (session_.scanning) return false;

  if (shipPos.distanceTo(target.position) > params_.maxScanDistance) {
    session_.error = ScanError::OutOfRange;
    session_.scanning = false;
    emit(events::ScanFailed);
    return false;
  }

  session_ = ScanSession{};
  session_.scanning = true;
  session_.targetId = std::string(target.id);
  emit(events::ScanStarted);
  return true;
}

void Scanner::cancelScan() {
  session_.scanning = false;
  session_.progress = 0.0;
  session_.complete = false;
}

void Scanner::reset() {
  session_ = ScanSession{};
}

void Scanner::update(double dtSeconds, const math::Vec3d& shipPos, const std::optional<TargetRef>& selected) {
  if (!session_.scanning) return;

  if (!selected || selected->id != session_.targetId) {
    core::log(core::LogLevel::Debug, "Scanner: selection changed, scan cancelled");
    cancelScan();
    return;
  }

  if (shipPos.distanceTo(selected->position) > params_.maxScanDistance) {
    session_.scanning = false;
    session_.error = ScanError::SignalLost;
    emit(events::ScanFailed);
    return;
  }

  if (dtSeconds <= 0.0) return;

  // Frame-rate independent: a full sweep always takes scanDurationMs.
  const double increment = (dtSeconds * 1000.0 / params_.scanDurationMs) * 100.0;
  session_.progress = std::min(session_.progress + increment, 100.0);

  if (session_.progress >= 100.0) {
    session_.scanning = false;
    session_.complete = true;
    session_.result = selected->scan ? *selected->scan : fallbackScanPayload();
    emit(events::ScanComplete);
  }
}

} // namespace warpcore::sim
