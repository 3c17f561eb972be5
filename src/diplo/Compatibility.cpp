#include "entente/diplo/Compatibility.h"

#include "entente/core/Clamp.h"

#include <algorithm>
#include <cmath>

namespace entente::diplo {

static double closeness(const TraitVector& a, const TraitVector& b, Trait t) {
  return 1.0 - std::abs(a.norm(t) - b.norm(t));
}

double traitCompatibility(const TraitVector& a, const TraitVector& b, const CompatibilityParams& params) {
  const double integrity = closeness(a, b, Trait::Integrity);
  const double pragmatism = closeness(a, b, Trait::Pragmatism);
  const double discipline = closeness(a, b, Trait::Discipline);

  const double ambitionDiff = std::abs(a.norm(Trait::Ambition) - b.norm(Trait::Ambition));
  const double ambition = (ambitionDiff > params.ambitionComplementGap)
                            ? params.ambitionComplementScore
                            : 1.0 - ambitionDiff;

  const double score = integrity * params.integrityWeight +
                       pragmatism * params.pragmatismWeight +
                       discipline * params.disciplineWeight +
                       ambition * params.ambitionWeight;
  return core::clamp01(score);
}

double estimateThreatLevel(int sharedEnemies, core::SplitMix64& rng, const CompatibilityParams& params) {
  const double base = static_cast<double>(std::max(0, sharedEnemies)) * params.threatPerSharedEnemy;
  const double noise = rng.uniform(0.0, std::max(0.0, params.threatNoiseMax));
  return core::clamp01(std::min(1.0, base + noise));
}

int countSharedEnemies(FactionId a, FactionId b, const std::vector<FactionId>& commonThreats) {
  std::vector<FactionId> ids;
  ids.reserve(commonThreats.size());
  for (const FactionId id : commonThreats) {
    if (id == a || id == b) continue;
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return static_cast<int>(ids.size());
}

Result<TraitVector> lookupTraits(const AttributeProvider& attributes, FactionId id) {
  const auto traits = attributes.getHiddenAttributes(id);
  if (!traits) {
    return Result<TraitVector>::failure(DiploError::NotFound, "faction " + std::to_string(id) + " not found");
  }
  std::string err;
  if (!validateTraits(*traits, &err)) {
    return Result<TraitVector>::failure(DiploError::ValidationError,
                                        "faction " + std::to_string(id) + ": " + err);
  }
  return Result<TraitVector>::success(*traits);
}

Result<CompatibilityAssessment> assessCompatibility(const AttributeProvider& attributes,
                                                    FactionId a, FactionId b,
                                                    const std::vector<FactionId>& commonThreats,
                                                    core::SplitMix64& rng,
                                                    const CompatibilityParams& params) {
  using R = Result<CompatibilityAssessment>;
  if (a == b) {
    return R::failure(DiploError::ValidationError, "cannot assess a faction against itself");
  }

  const auto ta = lookupTraits(attributes, a);
  if (!ta.ok()) return R::failure(ta.error, ta.message);
  const auto tb = lookupTraits(attributes, b);
  if (!tb.ok()) return R::failure(tb.error, tb.message);

  CompatibilityAssessment out;
  out.a = a;
  out.b = b;
  out.compatibility = traitCompatibility(ta.value, tb.value, params);
  out.sharedEnemies = countSharedEnemies(a, b, commonThreats);
  out.threatLevel = estimateThreatLevel(out.sharedEnemies, rng, params);
  return R::success(out);
}

} // namespace entente::diplo
