#pragma once

#include "entente/diplo/Compatibility.h"
#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"
#include "entente/diplo/Relationship.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Trust ledger
// -----------------------------------------------------------------------------
//
// Turns interaction records into a bidirectional trust trajectory per
// unordered faction pair.
//
// Seeding: both directions start at 0.5 + (compat - 0.5) * seedSpread, so
// naturally compatible pairs begin slightly above neutral.
//
// Updates: delta = sign(impact) * min(maxDeltaPerEvent, |impact|). The target
// of the act revises its trust in the initiator by the full delta; the
// initiator's trust in the target moves by reciprocalFactor * delta.

struct TrustParams {
  double maxDeltaPerEvent{0.2};
  double reciprocalFactor{0.5};
  double seedSpread{0.2};

  // Volatility is the population variance of max(aTrustsB, bTrustsA) over
  // the most recent `volatilityWindow` samples, once that many exist.
  int volatilityWindow{5};
};

// 0.5 + (compat - 0.5) * seedSpread, clamped to [0,1].
double seededTrust(double baselineCompatibility, const TrustParams& params = TrustParams{});

// Fresh evolution for (a, b) with one history sample at `nowDays`.
TrustEvolution seedTrustEvolution(FactionId a, FactionId b, double baselineCompatibility, double nowDays,
                                  const TrustParams& params = TrustParams{});

// Signed, magnitude-capped delta for one event.
double clampedTrustDelta(double impact, const TrustParams& params = TrustParams{});

// Applies one event to `t` (initiator must be t.key.low or t.key.high).
// Updates peak/low trust, appends a sample and recomputes volatility.
void applyTrustDelta(TrustEvolution& t, FactionId initiator, double impact, double nowDays,
                     const TrustParams& params = TrustParams{});

// Population variance; 0 for fewer than two values.
double populationVariance(const std::vector<double>& values);

// >=0.9 absolute, >=0.7 high, >=0.5 moderate, >=0.3 low, >=0.1 distrust.
TrustCategory trustCategory(double meanTrust);

struct RecordedInteraction {
  InteractionRecord record;
  TrustEvolution evolution; // state after the interaction
  bool seeded{false};       // the pair had no evolution before this call
};

// Stored state of one pair, read as a unit.
struct PairHistory {
  std::optional<TrustEvolution> evolution; // unset until the pair is seeded
  std::vector<InteractionRecord> interactions;
};

// Store-backed ledger.
//
// Writers on the same pair are serialized by a per-pair mutex; different
// pairs proceed in parallel. Every call is all-or-nothing: nothing reaches the
// store unless validation and both faction lookups succeed.
class TrustLedger {
public:
  TrustLedger(const AttributeProvider& attributes, RelationshipStore& store,
              TrustParams params = TrustParams{},
              CompatibilityParams compatibility = CompatibilityParams{});

  TrustLedger(const TrustLedger&) = delete;
  TrustLedger& operator=(const TrustLedger&) = delete;

  const TrustParams& params() const { return params_; }

  // Returns the stored evolution, seeding and storing it first if missing.
  // Errors: ValidationError (a == b), NotFound, ValidationError (bad traits).
  Result<TrustEvolution> initialize(FactionId a, FactionId b, double nowDays);

  // Seeded evolution for a pair, computed but never stored.
  Result<TrustEvolution> preview(FactionId a, FactionId b, double nowDays) const;

  // Validates and records one interaction, then applies it to the pair.
  Result<RecordedInteraction> recordInteraction(const InteractionInput& input);

  // Evolution and interaction list taken under the pair's lock, so both
  // reflect the same set of recorded interactions.
  PairHistory history(FactionId a, FactionId b) const;

private:
  std::shared_ptr<std::mutex> pairMutex(const PairKey& key) const;
  Result<double> baselineCompatibility(FactionId a, FactionId b) const;

  const AttributeProvider& attributes_;
  RelationshipStore& store_;
  TrustParams params_;
  CompatibilityParams compatibility_;

  mutable std::mutex locksMutex_;
  mutable std::map<PairKey, std::shared_ptr<std::mutex>> pairLocks_;
  std::atomic<core::u64> nextInteractionId_{1};
};

} // namespace entente::diplo
