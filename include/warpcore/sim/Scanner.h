#pragma once

#include "warpcore/core/Types.h"
#include "warpcore/math/Vec3.h"
#include "warpcore/sim/Catalog.h"
#include "warpcore/sim/Events.h"

#include <optional>
#include <string>
#include <string_view>

namespace warpcore::sim {

enum class ScanError : core::u8 {
  None = 0,
  OutOfRange, // refused at start
  SignalLost, // target drifted out of range mid-scan
};

// Display text for the HUD. Empty for ScanError::None.
std::string_view scanErrorMessage(ScanError e);

struct ScannerParams {
  double scanDurationMs{3000.0};
  double maxScanDistance{100.0};
};

struct ScanSession {
  bool scanning{false};
  double progress{0.0}; // 0..100
  std::string targetId;
  std::optional<ScanPayload> result;
  bool complete{false};
  ScanError error{ScanError::None};
};

class Scanner {
public:
  explicit Scanner(ScannerParams params = {}, EventSink* events = nullptr)
      : params_(params), events_(events) {}

  // False if already scanning (silent) or the target is out of range (error set).
  bool startScan(const TargetRef& target, const math::Vec3d& shipPos);

  // Stops the sweep; the last result and target stay for display.
  void cancelScan();

  // Back to a blank session.
  void reset();

  // `selected` is what the pilot currently has selected. A different or
  // missing selection cancels the scan.
  void update(double dtSeconds, const math::Vec3d& shipPos, const std::optional<TargetRef>& selected);

  const ScanSession& session() const { return session_; }
  void restore(const ScanSession& s) { session_ = s; }

  const ScannerParams& params() const { return params_; }
  void setParams(const ScannerParams& p) { params_ = p; }

  void setEventSink(EventSink* events) { events_ = events; }

private:
  void emit(std::string_view id);

  ScannerParams params_{};
  EventSink* events_{nullptr};
  ScanSession session_{};
};

} // namespace warpcore::sim
