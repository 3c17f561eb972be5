#include "entente/diplo/BetrayalRisk.h"

#include "entente/core/Clamp.h"
#include "entente/diplo/Compatibility.h"

#include <algorithm>
#include <cctype>

namespace entente::diplo {

static double step(const TraitStepTable& table, int value) {
  return table[core::clampCast<std::size_t>(value, 0, 10)];
}

static std::string lowerAscii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) out.push_back((char)std::tolower((unsigned char)c));
  return out;
}

const char* betrayalMotivationName(BetrayalMotivation m) {
  switch (m) {
    case BetrayalMotivation::Ambition: return "ambition";
    case BetrayalMotivation::Pressure: return "pressure";
    case BetrayalMotivation::Opportunity: return "opportunity";
    case BetrayalMotivation::Ideology: return "ideology";
  }
  return "unknown";
}

bool tryParseBetrayalMotivation(std::string_view text, BetrayalMotivation& out) {
  const std::string k = lowerAscii(text);
  for (int i = 0; i <= static_cast<int>(BetrayalMotivation::Ideology); ++i) {
    const auto m = static_cast<BetrayalMotivation>(i);
    if (k == betrayalMotivationName(m)) {
      out = m;
      return true;
    }
  }
  return false;
}

const char* riskTierName(RiskTier t) {
  switch (t) {
    case RiskTier::Low: return "low";
    case RiskTier::Medium: return "medium";
    case RiskTier::High: return "high";
  }
  return "unknown";
}

double baseBetrayalRisk(const TraitVector& traits, const BetrayalParams& params) {
  double risk = params.baseRisk;
  risk += step(params.ambition, traits.ambition);
  risk += step(params.integrity, traits.integrity);
  risk += step(params.impulsivity, traits.impulsivity);
  risk += step(params.pragmatism, traits.pragmatism);
  return core::clamp01(risk);
}

double externalBetrayalModifier(const ExternalFactors& f, const BetrayalParams& params) {
  double m = 0.0;
  if (f.underPressure) m += params.pressureBonus;
  if (f.recentDefeats > params.defeatsThreshold) m += params.defeatsBonus;
  if (f.resourceShortage) m += params.shortageBonus;
  if (f.betterOpportunity) m += params.opportunityBonus;
  return m;
}

BetrayalMotivation primaryBetrayalMotivation(const TraitVector& traits, const ExternalFactors& f) {
  if (traits.ambition > 7 && traits.integrity < 4) return BetrayalMotivation::Ambition;
  if (f.underPressure) return BetrayalMotivation::Pressure;
  if (traits.pragmatism > 7) return BetrayalMotivation::Opportunity;
  return BetrayalMotivation::Ideology;
}

RiskTier classifyBetrayalRisk(double probability, const BetrayalParams& params) {
  if (probability > params.highTierAbove) return RiskTier::High;
  if (probability > params.mediumTierAbove) return RiskTier::Medium;
  return RiskTier::Low;
}

BetrayalAssessment evaluateBetrayalRisk(const TraitVector& traits,
                                        const ExternalFactors& factors,
                                        const std::vector<FactionId>& otherMembers,
                                        const BetrayalParams& params) {
  BetrayalAssessment out;
  out.baseRisk = baseBetrayalRisk(traits, params);
  out.externalModifier = externalBetrayalModifier(factors, params);
  out.probability = core::clamp01(std::min(params.probabilityCap, out.baseRisk + out.externalModifier));
  out.motivation = primaryBetrayalMotivation(traits, factors);
  out.tier = classifyBetrayalRisk(out.probability, params);

  out.expectedTrustDamage =
    core::clamp01(params.trustDamageBase + traits.norm(Trait::Ambition) * params.trustDamageAmbitionScale);
  out.trustDamage.reserve(otherMembers.size());
  for (const FactionId m : otherMembers) {
    out.trustDamage.push_back(MemberTrustDamage{m, out.expectedTrustDamage});
  }
  return out;
}

Result<BetrayalAssessment> evaluateBetrayalRisk(const AttributeProvider& attributes,
                                                FactionId faction,
                                                const ExternalFactors& factors,
                                                const std::vector<FactionId>& otherMembers,
                                                const BetrayalParams& params) {
  using R = Result<BetrayalAssessment>;
  if (factors.recentDefeats < 0) {
    return R::failure(DiploError::ValidationError, "recent defeats must be >= 0");
  }

  const auto traits = lookupTraits(attributes, faction);
  if (!traits.ok()) return R::failure(traits.error, traits.message);

  std::vector<FactionId> members;
  members.reserve(otherMembers.size());
  for (const FactionId m : otherMembers) {
    if (m == faction) continue;
    if (std::find(members.begin(), members.end(), m) != members.end()) continue;
    members.push_back(m);
  }

  BetrayalAssessment a = evaluateBetrayalRisk(traits.value, factors, members, params);
  a.faction = faction;
  return R::success(std::move(a));
}

const char* betrayalKindName(BetrayalKind k) {
  switch (k) {
    case BetrayalKind::Military: return "military";
    case BetrayalKind::Economic: return "economic";
    case BetrayalKind::Diplomatic: return "diplomatic";
    case BetrayalKind::Territorial: return "territorial";
  }
  return "unknown";
}

bool tryParseBetrayalKind(std::string_view text, BetrayalKind& out) {
  const std::string k = lowerAscii(text);
  for (int i = 0; i <= static_cast<int>(BetrayalKind::Territorial); ++i) {
    const auto kind = static_cast<BetrayalKind>(i);
    if (k == betrayalKindName(kind)) {
      out = kind;
      return true;
    }
  }
  return false;
}

BetrayalEvent makeBetrayalEvent(FactionId betrayer, const TraitVector& traits,
                                BetrayalKind kind, BetrayalMotivation motivation,
                                std::string description, double nowDays,
                                const BetrayalEventParams& params) {
  BetrayalEvent e;
  e.betrayer = betrayer;
  e.kind = kind;
  e.motivation = motivation;
  e.description = std::move(description);
  e.timeDays = nowDays;

  e.severity = std::min(1.0, params.severityBase +
                               traits.norm(Trait::Ambition) * params.severityAmbition +
                               traits.norm(Trait::Impulsivity) * params.severityImpulsivity);
  const double integrityLoss = static_cast<double>(kTraitMax - traits.integrity) / 10.0;
  e.trustDamage = std::min(1.0, params.damageBase + integrityLoss * params.damageIntegrityLoss);

  e.consequences.push_back("Alliance dissolution");
  e.consequences.push_back("Trust penalty with other factions");
  if (e.severity > params.isolationSeverityAbove) e.consequences.push_back("Diplomatic isolation");
  if (kind == BetrayalKind::Military) e.consequences.push_back("Military retaliation risk");
  return e;
}

} // namespace entente::diplo
