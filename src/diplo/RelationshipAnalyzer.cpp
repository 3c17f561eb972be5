#include "entente/diplo/RelationshipAnalyzer.h"

#include "entente/core/Clamp.h"
#include "entente/core/Log.h"

#include <algorithm>
#include <cmath>

namespace entente::diplo {

const char* relationshipTrendName(RelationshipTrend t) {
  switch (t) {
    case RelationshipTrend::RapidlyImproving: return "rapidly_improving";
    case RelationshipTrend::Improving: return "improving";
    case RelationshipTrend::Stable: return "stable";
    case RelationshipTrend::Declining: return "declining";
    case RelationshipTrend::RapidlyDeclining: return "rapidly_declining";
    case RelationshipTrend::Volatile: return "volatile";
  }
  return "unknown";
}

const char* reputationStandingName(ReputationStanding s) {
  switch (s) {
    case ReputationStanding::Respected: return "respected";
    case ReputationStanding::Neutral: return "neutral";
    case ReputationStanding::Distrusted: return "distrusted";
  }
  return "unknown";
}

static RelationshipTrend classifyChange(double change, const AnalyzerParams& params) {
  if (change > params.rapidChange) return RelationshipTrend::RapidlyImproving;
  if (change > params.change) return RelationshipTrend::Improving;
  if (change < -params.rapidChange) return RelationshipTrend::RapidlyDeclining;
  if (change < -params.change) return RelationshipTrend::Declining;
  return RelationshipTrend::Stable;
}

RelationshipTrend analyzeTrend(const TrustEvolution& t, double nowDays, const AnalyzerParams& params) {
  if (static_cast<int>(t.history.size()) < params.minHistoryForTrend) return RelationshipTrend::Stable;

  const double windowStart = nowDays - params.analysisWindowDays;
  const TrustSample* first = nullptr;
  const TrustSample* last = nullptr;
  int inWindow = 0;
  for (const auto& s : t.history) {
    if (s.timeDays < windowStart) continue;
    if (!first) first = &s;
    last = &s;
    ++inWindow;
  }
  if (inWindow < 2) return RelationshipTrend::Stable;

  if (t.volatility > params.volatilityThreshold) return RelationshipTrend::Volatile;
  return classifyChange(last->mean() - first->mean(), params);
}

RelationshipTrend predictTrajectory(RelationshipTrend current, double baselineCompatibility,
                                    const AnalyzerParams& params) {
  const bool declining = current == RelationshipTrend::Declining || current == RelationshipTrend::RapidlyDeclining;
  const bool improving = current == RelationshipTrend::Improving || current == RelationshipTrend::RapidlyImproving;

  if (baselineCompatibility > params.highCompatibility) {
    if (declining) return RelationshipTrend::Improving;
  } else if (baselineCompatibility < params.lowCompatibility) {
    if (improving) return RelationshipTrend::Declining;
  }
  return current;
}

double allianceProbability(double mutualTrust, double volatility, double baselineCompatibility,
                           const AnalyzerParams& params) {
  const double base = std::max(0.0, (mutualTrust - 0.5) * params.allianceTrustScale);
  const double bonus = baselineCompatibility * params.allianceCompatWeight;
  const double stabilityFactor = std::max(params.allianceMinStability, 1.0 - volatility);
  return core::clamp01((base + bonus) * stabilityFactor);
}

double conflictProbability(double mutualTrust, double volatility, double baselineCompatibility,
                           const AnalyzerParams& params) {
  const double base = std::max(0.0, (params.conflictTrustFloor - mutualTrust) * params.conflictTrustScale);
  const double vol = volatility * params.conflictVolatilityWeight;
  const double incompat = (1.0 - baselineCompatibility) * params.conflictIncompatWeight;
  return core::clamp01(base + vol + incompat);
}

double stabilityScore(const TrustEvolution& t) {
  const double volatilityStability = std::max(0.0, 1.0 - t.volatility * 2.0);
  const double rangeStability = std::max(0.0, 1.0 - (t.peakTrust - t.lowestTrust));
  return core::clamp01((volatilityStability + rangeStability + t.baselineCompatibility) / 3.0);
}

std::vector<InteractionRecord> turningPoints(const std::vector<InteractionRecord>& interactions,
                                             const AnalyzerParams& params) {
  std::vector<InteractionRecord> out;
  for (const auto& r : interactions) {
    if (std::abs(r.trustImpact) > params.significanceThreshold) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const InteractionRecord& x, const InteractionRecord& y) {
    return std::abs(x.trustImpact) > std::abs(y.trustImpact);
  });
  if (static_cast<int>(out.size()) > params.maxTurningPoints) {
    out.resize(static_cast<std::size_t>(std::max(0, params.maxTurningPoints)));
  }
  return out;
}

// -----------------------------------------------------------------------------
// RelationshipAnalyzer
// -----------------------------------------------------------------------------

RelationshipAnalyzer::RelationshipAnalyzer(const AttributeProvider& attributes,
                                           const DiplomacyStatusProvider& status,
                                           const TrustLedger& ledger,
                                           AnalyzerParams params)
  : attributes_(attributes), status_(status), ledger_(ledger), params_(params) {}

Result<RelationshipSummary> RelationshipAnalyzer::summarize(FactionId a, FactionId b, double nowDays) const {
  using R = Result<RelationshipSummary>;
  if (a == b) return R::failure(DiploError::ValidationError, "a faction has no relationship with itself");

  const auto fa = attributes_.getFaction(a);
  if (!fa) return R::failure(DiploError::NotFound, "faction " + std::to_string(a) + " not found");
  const auto fb = attributes_.getFaction(b);
  if (!fb) return R::failure(DiploError::NotFound, "faction " + std::to_string(b) + " not found");

  RelationshipSummary out;
  out.a = a;
  out.b = b;
  out.nameA = fa->name;
  out.nameB = fb->name;

  PairHistory pair = ledger_.history(a, b);
  TrustEvolution t;
  if (pair.evolution) {
    t = std::move(*pair.evolution);
    out.evolutionStored = true;
  } else {
    auto seeded = ledger_.preview(a, b, nowDays);
    if (!seeded.ok()) return R::failure(seeded.error, seeded.message);
    t = std::move(seeded.value);
  }

  const std::vector<InteractionRecord>& interactions = pair.interactions;

  out.mutualTrust = t.mutualTrust();
  out.aTrustsB = t.trustFrom(a);
  out.bTrustsA = t.trustFrom(b);
  out.category = trustCategory(out.mutualTrust);
  out.status = status_.getStatus(a, b);

  out.totalInteractions = static_cast<int>(interactions.size());
  if (!interactions.empty()) {
    double firstDay = interactions.front().timeDays;
    double lastDay = interactions.front().timeDays;
    for (const auto& r : interactions) {
      if (r.trustImpact > 0.0) ++out.positiveInteractions;
      if (r.trustImpact < 0.0) ++out.negativeInteractions;
      firstDay = std::min(firstDay, r.timeDays);
      lastDay = std::max(lastDay, r.timeDays);

      if (r.trustImpact > params_.significanceThreshold &&
          (!out.mostSignificantPositive || r.trustImpact > out.mostSignificantPositive->trustImpact)) {
        out.mostSignificantPositive = r;
      }
      if (r.trustImpact < -params_.significanceThreshold &&
          (!out.mostSignificantNegative || r.trustImpact < out.mostSignificantNegative->trustImpact)) {
        out.mostSignificantNegative = r;
      }
    }
    out.durationDays = static_cast<int>(std::floor(std::max(0.0, nowDays - firstDay)));
    out.lastInteractionDays = lastDay;
  }

  out.trend = analyzeTrend(t, nowDays, params_);
  out.trajectory = predictTrajectory(out.trend, t.baselineCompatibility, params_);
  out.allianceProbability = allianceProbability(out.mutualTrust, t.volatility, t.baselineCompatibility, params_);
  out.conflictProbability = conflictProbability(out.mutualTrust, t.volatility, t.baselineCompatibility, params_);
  out.stability = stabilityScore(t);
  out.turningPoints = turningPoints(interactions, params_);
  return R::success(std::move(out));
}

// Change in `observer`'s trust in the other member over the analysis window.
static double recentTrustChange(const TrustEvolution& t, FactionId observer, double windowStart) {
  const TrustSample* first = nullptr;
  const TrustSample* last = nullptr;
  for (const auto& s : t.history) {
    if (s.timeDays < windowStart) continue;
    if (!first) first = &s;
    last = &s;
  }
  if (!first || first == last) return 0.0;
  const bool low = (observer == t.key.low);
  return low ? (last->aTrustsB - first->aTrustsB) : (last->bTrustsA - first->bTrustsA);
}

Result<FactionReputation> RelationshipAnalyzer::reputation(FactionId faction,
                                                           const std::vector<FactionId>& counterparts,
                                                           double nowDays) const {
  using R = Result<FactionReputation>;

  const auto snap = attributes_.getFaction(faction);
  if (!snap) return R::failure(DiploError::NotFound, "faction " + std::to_string(faction) + " not found");

  std::vector<FactionId> others;
  others.reserve(counterparts.size());
  for (const FactionId c : counterparts) {
    if (c == faction) continue;
    if (std::find(others.begin(), others.end(), c) != others.end()) continue;
    if (!attributes_.getFaction(c)) {
      return R::failure(DiploError::NotFound, "faction " + std::to_string(c) + " not found");
    }
    others.push_back(c);
  }

  FactionReputation out;
  out.faction = faction;
  out.name = snap->name;

  const double windowStart = nowDays - params_.analysisWindowDays;
  double trustSum = 0.0;
  double changeSum = 0.0;
  int kept = 0;
  int initiatedTotal = 0;
  double reputationImpactSum = 0.0;

  for (const FactionId c : others) {
    const PairHistory pair = ledger_.history(faction, c);
    if (const auto& t = pair.evolution) {
      // How much the counterpart trusts this faction.
      const double trusted = t->trustFrom(c);
      trustSum += trusted;
      changeSum += recentTrustChange(*t, c, windowStart);
      ++out.relationshipsConsidered;

      const double mutual = t->mutualTrust();
      if (mutual >= params_.notableAllianceTrust) out.notableAlliances.push_back(c);
      if (mutual <= params_.notableConflictTrust) out.notableConflicts.push_back(c);
    }

    for (const auto& r : pair.interactions) {
      if (r.initiator != faction) continue;
      ++initiatedTotal;
      reputationImpactSum += r.reputationImpact;
      if (!isBreachOfFaith(r.kind)) ++kept;
    }
  }

  out.interactionsInitiated = initiatedTotal;
  if (out.relationshipsConsidered > 0) {
    out.trustworthiness = core::clamp01(trustSum / out.relationshipsConsidered);
    out.recentChange = changeSum / out.relationshipsConsidered;
  }
  if (initiatedTotal > 0) out.reliability = core::clamp01(static_cast<double>(kept) / initiatedTotal);

  const double impact = (initiatedTotal > 0) ? (reputationImpactSum / initiatedTotal) : 0.0;
  out.overall = core::clamp01(params_.reputationTrustWeight * out.trustworthiness +
                              params_.reputationReliabilityWeight * out.reliability +
                              params_.reputationImpactWeight * core::clamp01(0.5 + 0.5 * impact));

  if (out.overall >= params_.respectedThreshold) {
    out.standing = ReputationStanding::Respected;
  } else if (out.overall <= params_.distrustedThreshold) {
    out.standing = ReputationStanding::Distrusted;
  } else {
    out.standing = ReputationStanding::Neutral;
  }

  if (out.recentChange > params_.change) {
    out.direction = RelationshipTrend::Improving;
  } else if (out.recentChange < -params_.change) {
    out.direction = RelationshipTrend::Declining;
  } else {
    out.direction = RelationshipTrend::Stable;
  }
  return R::success(std::move(out));
}

} // namespace entente::diplo
