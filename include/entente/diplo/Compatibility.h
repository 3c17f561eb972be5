#pragma once

#include "entente/core/Random.h"
#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"

#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Compatibility & external threat
// -----------------------------------------------------------------------------
//
// Compatibility is a weighted sum of per-trait closeness scores where
// closeness(t) = 1 - |a(t)/10 - b(t)/10|. Ambition is the exception: two
// factions whose ambition differs by more than `ambitionComplementGap` get a
// fixed complementarity score (one leads, one follows) instead of a penalty.
//
// Threat level grows with the number of shared enemies plus a bounded random
// component drawn from the caller's generator.

struct CompatibilityParams {
  double integrityWeight{0.35};
  double pragmatismWeight{0.25};
  double disciplineWeight{0.25};
  double ambitionWeight{0.15};

  // Normalized ambition difference above which the pair is complementary.
  double ambitionComplementGap{0.3};
  double ambitionComplementScore{0.8};

  double threatPerSharedEnemy{0.2};

  // Upper bound (exclusive) of the uniform threat noise.
  double threatNoiseMax{0.3};
};

struct CompatibilityAssessment {
  FactionId a{0};
  FactionId b{0};

  double compatibility{0.0}; // [0,1], symmetric in (a, b)
  double threatLevel{0.0};   // [0,1]
  int sharedEnemies{0};
};

// Symmetric, total over valid trait vectors.
double traitCompatibility(const TraitVector& a, const TraitVector& b,
                          const CompatibilityParams& params = CompatibilityParams{});

// min(1, perEnemy * sharedEnemies + U[0, noiseMax)). Consumes exactly one draw.
double estimateThreatLevel(int sharedEnemies, core::SplitMix64& rng,
                           const CompatibilityParams& params = CompatibilityParams{});

// Distinct ids in `commonThreats`, ignoring a and b themselves.
int countSharedEnemies(FactionId a, FactionId b, const std::vector<FactionId>& commonThreats);

// Looks both factions up and scores them.
//
// Errors:
//  - NotFound: either faction unknown to the provider (no partial result)
//  - ValidationError: a == b, or a provider returned traits outside 0..10
Result<CompatibilityAssessment> assessCompatibility(const AttributeProvider& attributes,
                                                    FactionId a, FactionId b,
                                                    const std::vector<FactionId>& commonThreats,
                                                    core::SplitMix64& rng,
                                                    const CompatibilityParams& params = CompatibilityParams{});

// Shared lookup helper: fetches validated hidden traits for `id`.
Result<TraitVector> lookupTraits(const AttributeProvider& attributes, FactionId id);

} // namespace entente::diplo
