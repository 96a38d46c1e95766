#pragma once

#include "warpcore/core/Types.h"

#include <cstddef>
#include <string_view>

namespace warpcore::core {

// Dice used by gameplay code (cascade damage, debris direction, camera shake).
// Injected so tests and replays can pin the outcome.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  // [0, 1)
  virtual double nextDouble01() = 0;

  // Uniform index in [0, count). count == 0 returns 0.
  std::size_t index(std::size_t count);

  // Uniform real in [min, max)
  double uniform(double min, double max) { return min + (max - min) * nextDouble01(); }

  bool chance(double probability01);
};

// SplitMix64: fast 64-bit PRNG. State is a single word so it can be saved
// and restored with the rest of a session. Not suitable for crypto.
class SplitMix64 final : public RandomSource {
public:
  explicit SplitMix64(u64 seed) : m_state(seed) {}

  u64 nextU64();
  double nextDouble01() override;

  u64 state() const { return m_state; }
  void setState(u64 state) { m_state = state; }

private:
  u64 m_state = 0;
};

// 64-bit FNV-1a (stable across platforms).
u64 fnv1a64(std::string_view text);

// Derive an independent child seed for one concern of a session.
u64 deriveSeed(u64 parent, std::string_view tag);

} // namespace warpcore::core
