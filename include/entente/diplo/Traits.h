#pragma once

#include "entente/core/Types.h"

#include <string>
#include <string_view>

namespace entente::diplo {

// Opaque faction identifier. The engine never interprets it beyond equality
// and ordering (pair keys use min/max).
using FactionId = core::u64;

// Hidden personality traits. Integers in [kTraitMin, kTraitMax]; never shown to
// players but driving every score in the engine.
enum class Trait : core::u8 {
  Pragmatism  = 0,
  Integrity   = 1,
  Ambition    = 2,
  Impulsivity = 3,
  Discipline  = 4,
};

inline constexpr int kTraitCount = 5;
inline constexpr int kTraitMin = 0;
inline constexpr int kTraitMax = 10;

const char* traitName(Trait t);

// Accepts "ambition" as well as "hidden_ambition" (case-insensitive).
bool tryParseTrait(std::string_view text, Trait& out);

// Unspecified traits are 0.
struct TraitVector {
  int pragmatism{0};
  int integrity{0};
  int ambition{0};
  int impulsivity{0};
  int discipline{0};

  int get(Trait t) const;
  void set(Trait t, int value);

  // value / 10
  double norm(Trait t) const { return static_cast<double>(get(t)) / 10.0; }
};

bool operator==(const TraitVector& a, const TraitVector& b);
inline bool operator!=(const TraitVector& a, const TraitVector& b) { return !(a == b); }

// False (with a message naming the trait) when any trait is outside 0..10.
bool validateTraits(const TraitVector& t, std::string* outError = nullptr);

// Public record plus hidden traits, supplied read-only per call.
struct FactionSnapshot {
  FactionId id{0};
  std::string name;
  TraitVector traits;
};

} // namespace entente::diplo
