#include "warpcore/core/Random.h"

#include <algorithm>

namespace warpcore::core {

std::size_t RandomSource::index(std::size_t count) {
  if (count == 0) return 0;
  const auto i = static_cast<std::size_t>(nextDouble01() * static_cast<double>(count));
  return std::min(i, count - 1);
}

bool RandomSource::chance(double probability01) {
  probability01 = std::clamp(probability01, 0.0, 1.0);
  return nextDouble01() < probability01;
}

u64 SplitMix64::nextU64() {
  u64 z = (m_state += 0x9E3779B97F4A7C15ull);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
  return z ^ (z >> 31);
}

double SplitMix64::nextDouble01() {
  // 53 random bits -> double in [0,1)
  const u64 mantissa = nextU64() >> 11;
  return static_cast<double>(mantissa) * (1.0 / 9007199254740992.0); // 2^53
}

u64 fnv1a64(std::string_view text) {
  constexpr u64 offsetBasis = 14695981039346656037ull;
  constexpr u64 prime       = 1099511628211ull;

  u64 hash = offsetBasis;
  for (char c : text) {
    hash ^= static_cast<u64>(static_cast<unsigned char>(c));
    hash *= prime;
  }
  return hash;
}

u64 deriveSeed(u64 parent, std::string_view tag) {
  u64 a = parent;
  a ^= fnv1a64(tag) + 0x9e3779b97f4a7c15ull + (a << 6) + (a >> 2);
  return a;
}

} // namespace warpcore::core
