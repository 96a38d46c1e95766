#pragma once

#include <algorithm>
#include <cmath>

namespace warpcore::math {

constexpr double pi = 3.141592653589793238462643383279502884;
constexpr double twoPi = 2.0 * pi;
constexpr double halfPi = 0.5 * pi;

template <typename T>
constexpr T clamp(T v, T lo, T hi) {
  return (v < lo) ? lo : (v > hi) ? hi : v;
}

inline double degToRad(double deg) { return deg * (pi / 180.0); }
inline double radToDeg(double rad) { return rad * (180.0 / pi); }

inline double sign(double v) { return (v > 0.0) ? 1.0 : (v < 0.0) ? -1.0 : 0.0; }

// Blend weight for exponential smoothing expressed per second.
// 1 - exp(-rate * dt): the same trajectory at any frame rate.
inline double smoothingAlpha(double ratePerSecond, double dt) {
  if (ratePerSecond <= 0.0 || dt <= 0.0) return 0.0;
  return 1.0 - std::exp(-ratePerSecond * dt);
}

// Converts a per-frame lerp factor tuned at a reference frame rate into an
// equivalent per-second rate for smoothingAlpha().
inline double rateFromFrameFactor(double factor, double referenceFps = 60.0) {
  factor = std::clamp(factor, 0.0, 0.999999);
  return -std::log(1.0 - factor) * referenceFps;
}

} // namespace warpcore::math
