#pragma once

#include "entente/core/Types.h"

#include <cmath>
#include <cstring>
#include <string_view>

namespace entente::core {

// Incremental FNV-1a builder for regression signatures.
//
// Integers are fed in little-endian byte order and strings are length
// prefixed, so a signature is identical on every platform. Doubles are either
// hashed bit-exact or quantized (default 1e-9) to ignore last-ulp noise.
// Not cryptographic.
class StableHash64 {
public:
  static constexpr u64 kOffsetBasis = 14695981039346656037ull;
  static constexpr u64 kPrime       = 1099511628211ull;

  explicit StableHash64(u64 seed = kOffsetBasis) : h_(seed) {}

  u64 value() const { return h_; }

  void addU8(u8 b) {
    h_ ^= static_cast<u64>(b);
    h_ *= kPrime;
  }

  void addBool(bool v) { addU8(v ? 1u : 0u); }

  void addU64(u64 v) {
    for (int i = 0; i < 8; ++i) addU8(static_cast<u8>((v >> (8 * i)) & 0xFFull));
  }

  void addU32(u32 v) { addU64(static_cast<u64>(v)); }
  void addInt(int v) { addU64(static_cast<u64>(static_cast<i64>(v))); }

  void addString(std::string_view s) {
    addU64(static_cast<u64>(s.size()));
    for (const char c : s) addU8(static_cast<u8>(c));
  }

  void addDoubleBits(double v) {
    static_assert(sizeof(double) == sizeof(u64), "double must be 64-bit");
    u64 bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    addU64(bits);
  }

  void addDoubleQ(double v, double scale = 1e9) {
    if (!std::isfinite(v)) {
      addU8(0xFFu);
      return;
    }
    addU64(static_cast<u64>(static_cast<i64>(std::llround(v * scale))));
  }

private:
  u64 h_{kOffsetBasis};
};

} // namespace entente::core
