#pragma once

#include "entente/core/Types.h"
#include "entente/diplo/Traits.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Relationship data model
// -----------------------------------------------------------------------------
//
// Plain records shared by the trust ledger, the relationship store capability
// and the analyzers. Interaction records are immutable once built; a trust
// evolution exists once per unordered pair and is only ever replaced by a newer
// copy.

enum class InteractionKind : core::u8 {
  AllianceProposal   = 0,
  AllianceAcceptance = 1,
  AllianceRejection  = 2,
  TreatySigned       = 3,
  TreatyViolated     = 4,
  TradeAgreement     = 5,
  MilitarySupport    = 6,
  Betrayal           = 7,
  DiplomaticInsult   = 8,
  TerritorialDispute = 9,
  ResourceConflict   = 10,
  CulturalExchange   = 11,
  HumanitarianAid    = 12,
  EspionageDetected  = 13,
  BorderIncident     = 14,
  SuccessionSupport  = 15,
  MediationAttempt   = 16,
};

inline constexpr int kInteractionKindCount = 17;

// snake_case names ("treaty_violated").
const char* interactionKindName(InteractionKind k);
bool tryParseInteractionKind(std::string_view text, InteractionKind& out);

// Multiplier applied to the trust impact to derive the tension impact.
// Hostile acts amplify, cooperative acts invert (relieve tension).
double tensionMultiplier(InteractionKind k);

// Betrayal and treaty violation count against a faction's reliability.
inline bool isBreachOfFaith(InteractionKind k) {
  return k == InteractionKind::Betrayal || k == InteractionKind::TreatyViolated;
}

struct InteractionRecord {
  core::u64 id{0};
  double timeDays{0.0};
  InteractionKind kind{InteractionKind::MediationAttempt};
  FactionId initiator{0};
  FactionId target{0};
  std::string description;

  double trustImpact{0.0};      // [-1, 1]
  double reputationImpact{0.0}; // [-1, 1]
  double tensionImpact{0.0};    // trustImpact * tensionMultiplier(kind)
  double severity{0.5};         // [0, 1]

  std::vector<std::string> consequences;
};

// Caller-supplied fields of a new interaction.
struct InteractionInput {
  FactionId initiator{0};
  FactionId target{0};
  InteractionKind kind{InteractionKind::MediationAttempt};
  std::string description;
  double trustImpact{0.0};
  double reputationImpact{0.0};
  double severity{0.5};
  double timeDays{0.0};
};

// Validates `in` and derives tension impact and consequences.
// Fails (returns false) for self-interactions and out-of-range or non-finite
// impacts/severity; `out` is left untouched in that case.
bool buildInteractionRecord(const InteractionInput& in, core::u64 id,
                            InteractionRecord& out, std::string* outError = nullptr);

// Unordered pair key: (a, b) and (b, a) map to the same key, low id first.
struct PairKey {
  FactionId low{0};
  FactionId high{0};

  bool operator==(const PairKey& o) const { return low == o.low && high == o.high; }
  bool operator!=(const PairKey& o) const { return !(*this == o); }
  bool operator<(const PairKey& o) const { return (low != o.low) ? (low < o.low) : (high < o.high); }
};

inline PairKey makePairKey(FactionId a, FactionId b) {
  return PairKey{std::min(a, b), std::max(a, b)};
}

struct TrustSample {
  double timeDays{0.0};
  double aTrustsB{0.5};
  double bTrustsA{0.5};

  double mean() const { return 0.5 * (aTrustsB + bTrustsA); }
};

// Bidirectional trust between key.low ("a") and key.high ("b").
struct TrustEvolution {
  PairKey key;

  double aTrustsB{0.5};
  double bTrustsA{0.5};

  std::vector<TrustSample> history;

  double volatility{0.0};
  double peakTrust{0.5};
  double lowestTrust{0.5};
  double baselineCompatibility{0.5};

  double mutualTrust() const { return 0.5 * (aTrustsB + bTrustsA); }

  // How much `observer` trusts the other member of the pair.
  double trustFrom(FactionId observer) const { return (observer == key.low) ? aTrustsB : bTrustsA; }
};

enum class TrustCategory : core::u8 {
  DeepMistrust  = 0,
  Distrust      = 1,
  LowTrust      = 2,
  ModerateTrust = 3,
  HighTrust     = 4,
  AbsoluteTrust = 5,
};

const char* trustCategoryName(TrustCategory c);

// Diplomatic status as reported by the status capability (reporting only).
enum class DiplomaticStatus : core::u8 {
  Allied   = 0,
  Friendly = 1,
  Neutral  = 2,
  Hostile  = 3,
  AtWar    = 4,
};

const char* diplomaticStatusName(DiplomaticStatus s);
bool tryParseDiplomaticStatus(std::string_view text, DiplomaticStatus& out);

} // namespace entente::diplo
