#include "entente/diplo/AllianceFormation.h"

#include "entente/core/Clamp.h"

#include <algorithm>
#include <cstdlib>

namespace entente::diplo {

const char* allianceDurationName(AllianceDuration d) {
  switch (d) {
    case AllianceDuration::VeryShortTerm: return "very_short_term";
    case AllianceDuration::ShortTerm: return "short_term";
    case AllianceDuration::MediumTerm: return "medium_term";
    case AllianceDuration::LongTerm: return "long_term";
  }
  return "unknown";
}

const char* allianceDurationLabel(AllianceDuration d) {
  switch (d) {
    case AllianceDuration::VeryShortTerm: return "Very short-term (< 6 months)";
    case AllianceDuration::ShortTerm: return "Short-term (6 months - 2 years)";
    case AllianceDuration::MediumTerm: return "Medium-term (2-5 years)";
    case AllianceDuration::LongTerm: return "Long-term (5+ years)";
  }
  return "Unknown";
}

double allianceWillingness(const TraitVector& traits, double threatLevel, double compatibility,
                           const FormationParams& params) {
  const double pragmatism = traits.norm(Trait::Pragmatism);
  const double integrity = traits.norm(Trait::Integrity);
  const double ambition = traits.norm(Trait::Ambition);

  const double base = pragmatism * params.pragmatismWeight;
  const double fromCompat = compatibility * (integrity * params.integrityCompatWeight);
  const double fromThreat = threatLevel * params.threatWeight;
  const double ambitionMod = (threatLevel < params.ambitionThreatPivot)
                               ? -ambition * params.ambitionWeight
                               : ambition * params.ambitionWeight;

  return core::clamp01(base + fromCompat + fromThreat + ambitionMod);
}

static double meanNorm(const TraitVector& a, const TraitVector& b, Trait t) {
  return static_cast<double>(a.get(t) + b.get(t)) / 20.0;
}

std::vector<AllianceType> recommendAllianceTypes(const TraitVector& a, const TraitVector& b, double threatLevel,
                                                 const FormationParams& params) {
  std::vector<AllianceType> out;
  if (threatLevel > params.defensiveThreatAbove) {
    out.push_back(AllianceType::Defensive);
    out.push_back(AllianceType::MutualProtection);
  }
  if (meanNorm(a, b, Trait::Ambition) > params.expansionistAmbitionAbove) out.push_back(AllianceType::Expansionist);
  if (meanNorm(a, b, Trait::Pragmatism) > params.tradePragmatismAbove) out.push_back(AllianceType::Trade);
  if (meanNorm(a, b, Trait::Integrity) > params.formalIntegrityAbove) out.push_back(AllianceType::Formal);
  if (out.empty()) out.push_back(AllianceType::Cooperation);
  return out;
}

std::vector<std::string> identifyAllianceRisks(const TraitVector& a, const TraitVector& b,
                                               const FormationParams& params) {
  std::vector<std::string> risks;
  if (std::abs(a.ambition - b.ambition) > params.riskAmbitionGapAbove) {
    risks.push_back("Significant ambition mismatch may lead to power struggles");
  }
  if (std::min(a.integrity, b.integrity) < params.riskIntegrityBelow) {
    risks.push_back("Low integrity partner increases betrayal risk");
  }
  if (std::max(a.impulsivity, b.impulsivity) > params.riskImpulsivityAbove) {
    risks.push_back("High impulsivity may lead to rash decisions");
  }
  if (std::min(a.discipline, b.discipline) < params.riskDisciplineBelow) {
    risks.push_back("Poor discipline may affect alliance reliability");
  }
  return risks;
}

std::vector<std::string> identifyAllianceBenefits(const TraitVector& a, const TraitVector& b, double threatLevel,
                                                  const FormationParams& params) {
  std::vector<std::string> benefits;
  if (std::abs(a.ambition - b.ambition) > params.benefitAmbitionGapAbove) {
    benefits.push_back("Complementary ambition levels provide balance");
  }
  if (std::min(a.integrity, b.integrity) > params.benefitIntegrityAbove) {
    benefits.push_back("High mutual integrity ensures reliability");
  }
  if (threatLevel > params.benefitThreatAbove) {
    benefits.push_back("Mutual protection against external threats");
  }
  if (static_cast<double>(a.pragmatism + b.pragmatism) / 2.0 > params.benefitPragmatismAbove) {
    benefits.push_back("Strong economic cooperation potential");
  }
  return benefits;
}

AllianceDuration estimateAllianceDuration(const TraitVector& a, const TraitVector& b,
                                          const FormationParams& params) {
  const double integrity = static_cast<double>(a.integrity + b.integrity) / 2.0;
  const double discipline = static_cast<double>(a.discipline + b.discipline) / 2.0;
  const double stability = (integrity + discipline) / 2.0;

  if (stability > params.longTermAbove) return AllianceDuration::LongTerm;
  if (stability > params.mediumTermAbove) return AllianceDuration::MediumTerm;
  if (stability > params.shortTermAbove) return AllianceDuration::ShortTerm;
  return AllianceDuration::VeryShortTerm;
}

Result<AllianceOpportunity> evaluateAllianceOpportunity(const AttributeProvider& attributes,
                                                        FactionId a, FactionId b,
                                                        const std::vector<FactionId>& commonThreats,
                                                        std::optional<AllianceType> requestedType,
                                                        core::SplitMix64& rng,
                                                        const CompatibilityParams& compatParams,
                                                        const FormationParams& params) {
  using R = Result<AllianceOpportunity>;

  const auto assessed = assessCompatibility(attributes, a, b, commonThreats, rng, compatParams);
  if (!assessed.ok()) return R::failure(assessed.error, assessed.message);

  // Both lookups already succeeded inside assessCompatibility().
  const TraitVector ta = lookupTraits(attributes, a).value;
  const TraitVector tb = lookupTraits(attributes, b).value;

  AllianceOpportunity out;
  out.assessment = assessed.value;
  const double compat = out.assessment.compatibility;
  const double threat = out.assessment.threatLevel;

  out.willingnessA = allianceWillingness(ta, threat, compat, params);
  out.willingnessB = allianceWillingness(tb, threat, compat, params);
  out.overallWillingness = 0.5 * (out.willingnessA + out.willingnessB);
  out.compatible = compat > params.compatibleAbove || threat > params.threatOverrideAbove;

  if (requestedType) {
    out.recommendedTypes.push_back(*requestedType);
  } else {
    out.recommendedTypes = recommendAllianceTypes(ta, tb, threat, params);
  }
  out.risks = identifyAllianceRisks(ta, tb, params);
  out.benefits = identifyAllianceBenefits(ta, tb, threat, params);
  out.duration = estimateAllianceDuration(ta, tb, params);
  out.suggestedTerms = defaultAllianceTerms(out.recommendedTypes.front());

  return R::success(std::move(out));
}

} // namespace entente::diplo
