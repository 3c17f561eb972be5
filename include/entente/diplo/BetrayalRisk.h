#pragma once

#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Betrayal risk
// -----------------------------------------------------------------------------
//
// probability = min(cap, clamp01(base + sum(traitTable[trait][value])) + external)
//
// The four governing traits each have a monotonic step table indexed by the
// trait value (0..10): ambition and impulsivity raise risk, integrity and
// pragmatism lower it.

using TraitStepTable = std::array<double, 11>;

struct BetrayalParams {
  double baseRisk{0.05};

  TraitStepTable ambition{{-0.02, -0.01, 0.0, 0.01, 0.02, 0.04, 0.06, 0.08, 0.10, 0.12, 0.15}};
  TraitStepTable integrity{{0.15, 0.12, 0.08, 0.04, 0.02, 0.0, -0.02, -0.04, -0.06, -0.08, -0.10}};
  TraitStepTable impulsivity{{-0.02, -0.01, 0.0, 0.01, 0.02, 0.04, 0.06, 0.08, 0.10, 0.12, 0.15}};
  TraitStepTable pragmatism{{0.08, 0.06, 0.04, 0.02, 0.0, -0.01, -0.02, -0.03, -0.04, -0.05, -0.06}};

  double pressureBonus{0.15};
  double defeatsBonus{0.10};
  int defeatsThreshold{2}; // bonus applies when recentDefeats > threshold
  double shortageBonus{0.08};
  double opportunityBonus{0.12};

  // Betrayal is never modeled as a certainty.
  double probabilityCap{0.8};

  double highTierAbove{0.6};
  double mediumTierAbove{0.3};

  // Expected trust damage per remaining member: base + ambition/10 * scale.
  double trustDamageBase{0.3};
  double trustDamageAmbitionScale{0.2};
};

struct ExternalFactors {
  bool underPressure{false};
  int recentDefeats{0};
  bool resourceShortage{false};
  bool betterOpportunity{false};
};

enum class BetrayalMotivation : core::u8 {
  Ambition    = 0, // power grab: high ambition, low integrity
  Pressure    = 1, // external pressure
  Opportunity = 2, // opportunism: high pragmatism
  Ideology    = 3, // ideological differences
};

enum class RiskTier : core::u8 {
  Low    = 0,
  Medium = 1,
  High   = 2,
};

const char* betrayalMotivationName(BetrayalMotivation m);
bool tryParseBetrayalMotivation(std::string_view text, BetrayalMotivation& out);
const char* riskTierName(RiskTier t);

struct MemberTrustDamage {
  FactionId member{0};
  double expectedDamage{0.0};
};

struct BetrayalAssessment {
  FactionId faction{0};

  double baseRisk{0.0};
  double externalModifier{0.0};
  double probability{0.0};

  BetrayalMotivation motivation{BetrayalMotivation::Ideology};
  RiskTier tier{RiskTier::Low};

  // Per-member damage when members were supplied; the uniform figure
  // otherwise applies to every member.
  double expectedTrustDamage{0.0};
  std::vector<MemberTrustDamage> trustDamage;
};

// Pure scoring over a trait vector. Traits are assumed validated.
double baseBetrayalRisk(const TraitVector& traits, const BetrayalParams& params = BetrayalParams{});
double externalBetrayalModifier(const ExternalFactors& f, const BetrayalParams& params = BetrayalParams{});
BetrayalMotivation primaryBetrayalMotivation(const TraitVector& traits, const ExternalFactors& f);
RiskTier classifyBetrayalRisk(double probability, const BetrayalParams& params = BetrayalParams{});

BetrayalAssessment evaluateBetrayalRisk(const TraitVector& traits,
                                        const ExternalFactors& factors,
                                        const std::vector<FactionId>& otherMembers = {},
                                        const BetrayalParams& params = BetrayalParams{});

// Provider-backed variant. NotFound / ValidationError as for compatibility.
Result<BetrayalAssessment> evaluateBetrayalRisk(const AttributeProvider& attributes,
                                                FactionId faction,
                                                const ExternalFactors& factors,
                                                const std::vector<FactionId>& otherMembers,
                                                const BetrayalParams& params = BetrayalParams{});

// -----------------------------------------------------------------------------
// Recorded betrayal
// -----------------------------------------------------------------------------

enum class BetrayalKind : core::u8 {
  Military   = 0,
  Economic   = 1,
  Diplomatic = 2,
  Territorial = 3,
};

const char* betrayalKindName(BetrayalKind k);
bool tryParseBetrayalKind(std::string_view text, BetrayalKind& out);

struct BetrayalEvent {
  FactionId betrayer{0};
  BetrayalKind kind{BetrayalKind::Diplomatic};
  BetrayalMotivation motivation{BetrayalMotivation::Ideology};
  std::string description;
  double timeDays{0.0};

  double severity{0.0};    // min(1, 0.3 + 0.4*ambition + 0.3*impulsivity), traits normalized
  double trustDamage{0.0}; // min(1, 0.2 + 0.6*(10 - integrity)/10)
  std::vector<std::string> consequences;
};

struct BetrayalEventParams {
  double severityBase{0.3};
  double severityAmbition{0.4};
  double severityImpulsivity{0.3};
  double damageBase{0.2};
  double damageIntegrityLoss{0.6};
  double isolationSeverityAbove{0.7};
};

BetrayalEvent makeBetrayalEvent(FactionId betrayer, const TraitVector& traits,
                                BetrayalKind kind, BetrayalMotivation motivation,
                                std::string description, double nowDays,
                                const BetrayalEventParams& params = BetrayalEventParams{});

} // namespace entente::diplo
