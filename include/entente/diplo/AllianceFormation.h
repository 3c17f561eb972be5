#pragma once

#include "entente/diplo/AllianceTerms.h"
#include "entente/diplo/Compatibility.h"

#include <optional>
#include <string>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Alliance formation
// -----------------------------------------------------------------------------
//
// Combines compatibility and threat into per-faction willingness, recommended
// alliance categories, risks/benefits and a duration estimate.
//
// willingness = clamp01(0.4*prag + compat*0.3*integ + 0.4*threat +/- 0.1*amb)
// (traits normalized; ambition counts against willingness while the threat is
// below 0.5 and for it above).

struct FormationParams {
  double pragmatismWeight{0.4};
  double integrityCompatWeight{0.3};
  double threatWeight{0.4};
  double ambitionWeight{0.1};
  double ambitionThreatPivot{0.5};

  double compatibleAbove{0.4};
  double threatOverrideAbove{0.8};

  // Recommendations (means normalized to 0..1).
  double defensiveThreatAbove{0.7};
  double expansionistAmbitionAbove{0.6};
  double tradePragmatismAbove{0.6};
  double formalIntegrityAbove{0.7};

  // Risks (raw trait values).
  int riskAmbitionGapAbove{4};
  int riskIntegrityBelow{3};
  int riskImpulsivityAbove{7};
  int riskDisciplineBelow{4};

  // Benefits (raw trait values except threat).
  int benefitAmbitionGapAbove{3};
  int benefitIntegrityAbove{6};
  double benefitThreatAbove{0.5};
  double benefitPragmatismAbove{6.0};

  // Duration: mean(integrity, discipline) over both factions.
  double longTermAbove{7.0};
  double mediumTermAbove{5.0};
  double shortTermAbove{3.0};
};

enum class AllianceDuration : core::u8 {
  VeryShortTerm = 0, // < 6 months
  ShortTerm     = 1, // 6 months - 2 years
  MediumTerm    = 2, // 2 - 5 years
  LongTerm      = 3, // 5+ years
};

const char* allianceDurationName(AllianceDuration d);
const char* allianceDurationLabel(AllianceDuration d);

struct AllianceOpportunity {
  CompatibilityAssessment assessment;

  double willingnessA{0.0};
  double willingnessB{0.0};
  double overallWillingness{0.0};

  bool compatible{false};

  std::vector<AllianceType> recommendedTypes;
  std::vector<std::string> risks;
  std::vector<std::string> benefits;
  AllianceDuration duration{AllianceDuration::VeryShortTerm};

  // Starting terms for the first recommended type.
  AllianceTerms suggestedTerms;
};

double allianceWillingness(const TraitVector& traits, double threatLevel, double compatibility,
                           const FormationParams& params = FormationParams{});

std::vector<AllianceType> recommendAllianceTypes(const TraitVector& a, const TraitVector& b, double threatLevel,
                                                 const FormationParams& params = FormationParams{});

std::vector<std::string> identifyAllianceRisks(const TraitVector& a, const TraitVector& b,
                                               const FormationParams& params = FormationParams{});

std::vector<std::string> identifyAllianceBenefits(const TraitVector& a, const TraitVector& b, double threatLevel,
                                                  const FormationParams& params = FormationParams{});

AllianceDuration estimateAllianceDuration(const TraitVector& a, const TraitVector& b,
                                          const FormationParams& params = FormationParams{});

// Full evaluation. A requested type replaces the recommendation list.
// Errors as for assessCompatibility().
Result<AllianceOpportunity> evaluateAllianceOpportunity(const AttributeProvider& attributes,
                                                        FactionId a, FactionId b,
                                                        const std::vector<FactionId>& commonThreats,
                                                        std::optional<AllianceType> requestedType,
                                                        core::SplitMix64& rng,
                                                        const CompatibilityParams& compatParams = CompatibilityParams{},
                                                        const FormationParams& params = FormationParams{});

} // namespace entente::diplo
