#pragma once

#include "entente/diplo/FactionRoster.h"

#include <cmath>
#include <string>

// Shared roster helpers for the diplomacy tests.

namespace entente::test {

inline diplo::TraitVector traits(int pragmatism, int integrity, int ambition, int impulsivity, int discipline) {
  diplo::TraitVector t;
  t.pragmatism = pragmatism;
  t.integrity = integrity;
  t.ambition = ambition;
  t.impulsivity = impulsivity;
  t.discipline = discipline;
  return t;
}

inline bool addFaction(diplo::FactionRoster& roster, diplo::FactionId id, const std::string& name,
                       const diplo::TraitVector& t) {
  diplo::FactionSnapshot f;
  f.id = id;
  f.name = name;
  f.traits = t;
  return roster.addFaction(f);
}

inline bool near(double a, double b, double eps = 1e-9) {
  return std::abs(a - b) <= eps;
}

} // namespace entente::test
