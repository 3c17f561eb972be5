#pragma once

#include "entente/core/Types.h"

#include <type_traits>
#include <utility>

namespace entente::core {

// SplitMix64: small, fast PRNG with 64-bit state.
//
// Every stochastic estimate in the diplomacy engine takes one of these by
// reference, so a caller controls reproducibility by choosing the seed and
// concurrent evaluations never share hidden state.
// Not suitable for crypto.
class SplitMix64 {
public:
  explicit SplitMix64(u64 seed = 0) : state_(seed) {}

  void reseed(u64 seed) { state_ = seed; }
  u64 state() const { return state_; }

  u64 nextU64() {
    u64 z = (state_ += 0x9E3779B97F4A7C15ull);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ull;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBull;
    return z ^ (z >> 31);
  }

  u32 nextU32() { return static_cast<u32>(nextU64() >> 32); }

  // [0,1)
  double nextDouble() {
    // 53 random bits -> double in [0,1).
    constexpr double inv = 1.0 / static_cast<double>(1ull << 53);
    return static_cast<double>(nextU64() >> 11) * inv;
  }

  // [lo, hi)
  double uniform(double lo, double hi) {
    if (hi < lo) std::swap(lo, hi);
    return lo + (hi - lo) * nextDouble();
  }

  // Inclusive range for integers
  template <class Int, std::enable_if_t<std::is_integral_v<Int>, int> = 0>
  Int range(Int minInclusive, Int maxInclusive) {
    if (maxInclusive < minInclusive) std::swap(minInclusive, maxInclusive);
    const u64 span = static_cast<u64>(maxInclusive) - static_cast<u64>(minInclusive) + 1ull;
    return static_cast<Int>(minInclusive + static_cast<Int>(nextU64() % span));
  }

  bool chance(double p) { return nextDouble() < p; }

private:
  u64 state_{0};
};

} // namespace entente::core
