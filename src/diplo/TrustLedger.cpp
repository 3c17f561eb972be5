#include "entente/diplo/TrustLedger.h"

#include "entente/core/Clamp.h"
#include "entente/core/Log.h"

#include <algorithm>
#include <cmath>

namespace entente::diplo {

double seededTrust(double baselineCompatibility, const TrustParams& params) {
  return core::clamp01(0.5 + (baselineCompatibility - 0.5) * params.seedSpread);
}

TrustEvolution seedTrustEvolution(FactionId a, FactionId b, double baselineCompatibility, double nowDays,
                                  const TrustParams& params) {
  const double seed = seededTrust(baselineCompatibility, params);

  TrustEvolution t;
  t.key = makePairKey(a, b);
  t.aTrustsB = seed;
  t.bTrustsA = seed;
  t.peakTrust = seed;
  t.lowestTrust = seed;
  t.volatility = 0.0;
  t.baselineCompatibility = core::clamp01(baselineCompatibility);
  t.history.push_back(TrustSample{nowDays, seed, seed});
  return t;
}

double clampedTrustDelta(double impact, const TrustParams& params) {
  if (!std::isfinite(impact)) return 0.0;
  const double mag = std::min(params.maxDeltaPerEvent, std::abs(impact));
  return (impact < 0.0) ? -mag : mag;
}

double populationVariance(const std::vector<double>& values) {
  if (values.size() < 2) return 0.0;
  double mean = 0.0;
  for (const double v : values) mean += v;
  mean /= static_cast<double>(values.size());

  double var = 0.0;
  for (const double v : values) var += (v - mean) * (v - mean);
  return var / static_cast<double>(values.size());
}

void applyTrustDelta(TrustEvolution& t, FactionId initiator, double impact, double nowDays,
                     const TrustParams& params) {
  const double delta = clampedTrustDelta(impact, params);

  if (initiator == t.key.low) {
    // low acted on high: high revises its trust in low.
    t.bTrustsA += delta;
    t.aTrustsB += delta * params.reciprocalFactor;
  } else {
    t.aTrustsB += delta;
    t.bTrustsA += delta * params.reciprocalFactor;
  }
  t.aTrustsB = core::clamp01(t.aTrustsB);
  t.bTrustsA = core::clamp01(t.bTrustsA);

  t.peakTrust = std::max(t.peakTrust, std::max(t.aTrustsB, t.bTrustsA));
  t.lowestTrust = std::min(t.lowestTrust, std::min(t.aTrustsB, t.bTrustsA));

  t.history.push_back(TrustSample{nowDays, t.aTrustsB, t.bTrustsA});

  const std::size_t window = static_cast<std::size_t>(std::max(2, params.volatilityWindow));
  if (t.history.size() >= window) {
    std::vector<double> recent;
    recent.reserve(window);
    for (std::size_t i = t.history.size() - window; i < t.history.size(); ++i) {
      recent.push_back(std::max(t.history[i].aTrustsB, t.history[i].bTrustsA));
    }
    t.volatility = populationVariance(recent);
  }
}

TrustCategory trustCategory(double meanTrust) {
  if (meanTrust >= 0.9) return TrustCategory::AbsoluteTrust;
  if (meanTrust >= 0.7) return TrustCategory::HighTrust;
  if (meanTrust >= 0.5) return TrustCategory::ModerateTrust;
  if (meanTrust >= 0.3) return TrustCategory::LowTrust;
  if (meanTrust >= 0.1) return TrustCategory::Distrust;
  return TrustCategory::DeepMistrust;
}

// -----------------------------------------------------------------------------
// TrustLedger
// -----------------------------------------------------------------------------

TrustLedger::TrustLedger(const AttributeProvider& attributes, RelationshipStore& store,
                         TrustParams params, CompatibilityParams compatibility)
  : attributes_(attributes), store_(store), params_(params), compatibility_(compatibility) {}

std::shared_ptr<std::mutex> TrustLedger::pairMutex(const PairKey& key) const {
  std::lock_guard<std::mutex> lock(locksMutex_);
  auto& m = pairLocks_[key];
  if (!m) m = std::make_shared<std::mutex>();
  return m;
}

Result<double> TrustLedger::baselineCompatibility(FactionId a, FactionId b) const {
  const auto ta = lookupTraits(attributes_, a);
  if (!ta.ok()) return Result<double>::failure(ta.error, ta.message);
  const auto tb = lookupTraits(attributes_, b);
  if (!tb.ok()) return Result<double>::failure(tb.error, tb.message);
  return Result<double>::success(traitCompatibility(ta.value, tb.value, compatibility_));
}

Result<TrustEvolution> TrustLedger::preview(FactionId a, FactionId b, double nowDays) const {
  using R = Result<TrustEvolution>;
  if (a == b) return R::failure(DiploError::ValidationError, "a faction has no trust pair with itself");

  const auto compat = baselineCompatibility(a, b);
  if (!compat.ok()) return R::failure(compat.error, compat.message);
  return R::success(seedTrustEvolution(a, b, compat.value, nowDays, params_));
}

Result<TrustEvolution> TrustLedger::initialize(FactionId a, FactionId b, double nowDays) {
  using R = Result<TrustEvolution>;
  if (a == b) return R::failure(DiploError::ValidationError, "a faction has no trust pair with itself");

  const PairKey key = makePairKey(a, b);
  const auto m = pairMutex(key);
  std::lock_guard<std::mutex> lock(*m);

  if (auto existing = store_.getTrustEvolution(a, b)) return R::success(std::move(*existing));

  auto seeded = preview(a, b, nowDays);
  if (!seeded.ok()) return seeded;

  store_.storeTrustEvolution(seeded.value);
  ENTENTE_LOG_DEBUG("trust: seeded pair " + std::to_string(key.low) + "/" + std::to_string(key.high));
  return seeded;
}

Result<RecordedInteraction> TrustLedger::recordInteraction(const InteractionInput& input) {
  using R = Result<RecordedInteraction>;

  InteractionRecord record;
  std::string err;
  if (!buildInteractionRecord(input, 0, record, &err)) {
    ENTENTE_LOG_DEBUG("trust: interaction rejected: " + err);
    return R::failure(DiploError::ValidationError, err);
  }

  if (!attributes_.getFaction(input.initiator)) {
    return R::failure(DiploError::NotFound, "faction " + std::to_string(input.initiator) + " not found");
  }
  if (!attributes_.getFaction(input.target)) {
    return R::failure(DiploError::NotFound, "faction " + std::to_string(input.target) + " not found");
  }

  const PairKey key = makePairKey(input.initiator, input.target);
  const auto m = pairMutex(key);
  std::lock_guard<std::mutex> lock(*m);

  RecordedInteraction out;
  if (auto existing = store_.getTrustEvolution(input.initiator, input.target)) {
    out.evolution = std::move(*existing);
  } else {
    const auto compat = baselineCompatibility(input.initiator, input.target);
    if (!compat.ok()) return R::failure(compat.error, compat.message);
    out.evolution = seedTrustEvolution(input.initiator, input.target, compat.value, input.timeDays, params_);
    out.seeded = true;
  }

  applyTrustDelta(out.evolution, input.initiator, record.trustImpact, record.timeDays, params_);

  record.id = nextInteractionId_.fetch_add(1);
  store_.storeInteraction(record);
  store_.storeTrustEvolution(out.evolution);
  out.record = std::move(record);

  ENTENTE_LOG_DEBUG("trust: " + std::string(interactionKindName(out.record.kind)) + " " +
                    std::to_string(out.record.initiator) + " -> " + std::to_string(out.record.target) +
                    ", mutual trust " + std::to_string(out.evolution.mutualTrust()));
  return R::success(std::move(out));
}

PairHistory TrustLedger::history(FactionId a, FactionId b) const {
  const auto m = pairMutex(makePairKey(a, b));
  std::lock_guard<std::mutex> lock(*m);

  PairHistory out;
  out.evolution = store_.getTrustEvolution(a, b);
  out.interactions = store_.getInteractions(a, b);
  return out;
}

} // namespace entente::diplo
