#include "entente/diplo/DiplomacyConfig.h"

#include <cstdint>

namespace entente::diplo {

namespace {

struct FloatVar {
  const char* name;
  const char* help;
  double minValue;
  double maxValue;
  double& (*field)(DiplomacyParams&);
};

struct IntVar {
  const char* name;
  const char* help;
  int minValue;
  int maxValue;
  int& (*field)(DiplomacyParams&);
};

const FloatVar kFloatVars[] = {
  {"diplo.compat.integrity_weight", "Compatibility weight of integrity closeness", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.integrityWeight; }},
  {"diplo.compat.pragmatism_weight", "Compatibility weight of pragmatism closeness", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.pragmatismWeight; }},
  {"diplo.compat.discipline_weight", "Compatibility weight of discipline closeness", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.disciplineWeight; }},
  {"diplo.compat.ambition_weight", "Compatibility weight of the ambition term", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.ambitionWeight; }},
  {"diplo.compat.ambition_gap", "Normalized ambition gap treated as complementary", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.ambitionComplementGap; }},
  {"diplo.threat.per_enemy", "Threat added per shared enemy", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.threatPerSharedEnemy; }},
  {"diplo.threat.noise_max", "Upper bound of the random threat component", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.compatibility.threatNoiseMax; }},

  {"diplo.betrayal.base", "Base betrayal risk before trait steps", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.baseRisk; }},
  {"diplo.betrayal.pressure_bonus", "Risk added under external pressure", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.pressureBonus; }},
  {"diplo.betrayal.defeats_bonus", "Risk added after repeated defeats", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.defeatsBonus; }},
  {"diplo.betrayal.shortage_bonus", "Risk added under resource shortage", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.shortageBonus; }},
  {"diplo.betrayal.opportunity_bonus", "Risk added when a better offer exists", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.opportunityBonus; }},
  {"diplo.betrayal.cap", "Maximum betrayal probability", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.probabilityCap; }},
  {"diplo.betrayal.high_tier", "Probability above which risk is high", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.highTierAbove; }},
  {"diplo.betrayal.medium_tier", "Probability above which risk is medium", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.betrayal.mediumTierAbove; }},

  {"diplo.formation.compatible_above", "Compatibility needed for a viable alliance", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.formation.compatibleAbove; }},
  {"diplo.formation.threat_override", "Threat level that makes any pair viable", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.formation.threatOverrideAbove; }},

  {"diplo.negotiation.duration_days", "Days until an untouched negotiation expires", 0.0, 36500.0,
   [](DiplomacyParams& p) -> double& { return p.negotiation.durationDays; }},
  {"diplo.negotiation.consensus", "Agreeing share needed to enter ratification", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.negotiation.consensusThreshold; }},

  {"diplo.trust.max_delta", "Largest trust change one interaction may cause", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.trust.maxDeltaPerEvent; }},
  {"diplo.trust.reciprocal", "Share of the delta applied to the initiator's trust", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.trust.reciprocalFactor; }},
  {"diplo.trust.seed_spread", "Compatibility influence on seeded trust", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.trust.seedSpread; }},

  {"diplo.analysis.window_days", "Trend analysis window in days", 1.0, 36500.0,
   [](DiplomacyParams& p) -> double& { return p.analyzer.analysisWindowDays; }},
  {"diplo.analysis.volatility", "Volatility above which a trend is volatile", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.analyzer.volatilityThreshold; }},
  {"diplo.analysis.significance", "Trust impact that makes a turning point", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.analyzer.significanceThreshold; }},

  {"diplo.network.alliance_trust", "Pair trust that seeds an alliance cluster", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.network.allianceThreshold; }},
  {"diplo.network.hotspot_trust", "Pair trust at or below which a pair is a hotspot", 0.0, 1.0,
   [](DiplomacyParams& p) -> double& { return p.network.hotspotThreshold; }},
};

const IntVar kIntVars[] = {
  {"diplo.negotiation.min_participants", "Fewest factions in a negotiation", 2, 64,
   [](DiplomacyParams& p) -> int& { return p.negotiation.minParticipants; }},
  {"diplo.negotiation.max_participants", "Most factions in a negotiation", 2, 64,
   [](DiplomacyParams& p) -> int& { return p.negotiation.maxParticipants; }},
  {"diplo.negotiation.max_rounds", "Rounds before a negotiation expires", 1, 1000,
   [](DiplomacyParams& p) -> int& { return p.negotiation.maxRounds; }},
  {"diplo.trust.volatility_window", "Samples in the volatility window", 2, 100,
   [](DiplomacyParams& p) -> int& { return p.trust.volatilityWindow; }},
  {"diplo.analysis.turning_points", "Turning points kept per summary", 0, 100,
   [](DiplomacyParams& p) -> int& { return p.analyzer.maxTurningPoints; }},
};

} // namespace

void installDiplomacyCVars(core::CVarRegistry& registry) {
  DiplomacyParams defaults;
  for (const auto& v : kFloatVars) {
    registry.defineFloat(v.name, v.field(defaults), core::CVar_Archive, v.help, v.minValue, v.maxValue);
  }
  for (const auto& v : kIntVars) {
    registry.defineInt(v.name, v.field(defaults), core::CVar_Archive, v.help, v.minValue, v.maxValue);
  }
}

DiplomacyParams diplomacyParamsFromCVars(const core::CVarRegistry& registry) {
  DiplomacyParams p;
  for (const auto& v : kFloatVars) {
    double& field = v.field(p);
    field = registry.getFloat(v.name, field);
  }
  for (const auto& v : kIntVars) {
    int& field = v.field(p);
    field = static_cast<int>(registry.getInt(v.name, field));
  }
  return p;
}

} // namespace entente::diplo
