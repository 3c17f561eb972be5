#pragma once

#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"
#include "entente/diplo/Relationship.h"
#include "entente/diplo/TrustLedger.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Relationship analysis
// -----------------------------------------------------------------------------
//
// Read-only projections over a pair's trust evolution and interaction history.
// Nothing computed here is persisted.

enum class RelationshipTrend : core::u8 {
  RapidlyImproving = 0,
  Improving        = 1,
  Stable           = 2,
  Declining        = 3,
  RapidlyDeclining = 4,
  Volatile         = 5,
};

const char* relationshipTrendName(RelationshipTrend t);

struct AnalyzerParams {
  double analysisWindowDays{90.0};
  int minHistoryForTrend{3};

  double volatilityThreshold{0.2};
  double rapidChange{0.15};
  double change{0.05};

  // Trajectory mean reversion.
  double highCompatibility{0.7};
  double lowCompatibility{0.3};

  // Alliance: (max(0, (trust - 0.5) * allianceTrustScale) + compat * allianceCompatWeight)
  //           * max(allianceMinStability, 1 - volatility)
  double allianceTrustScale{1.5};
  double allianceCompatWeight{0.3};
  double allianceMinStability{0.5};

  // Conflict: max(0, (conflictTrustFloor - trust) * conflictTrustScale)
  //           + volatility * conflictVolatilityWeight + (1 - compat) * conflictIncompatWeight
  double conflictTrustFloor{0.3};
  double conflictTrustScale{2.0};
  double conflictVolatilityWeight{1.5};
  double conflictIncompatWeight{0.4};

  double significanceThreshold{0.3};
  int maxTurningPoints{5};

  // Faction reputation.
  double reputationTrustWeight{0.5};
  double reputationReliabilityWeight{0.3};
  double reputationImpactWeight{0.2};
  double respectedThreshold{0.65};
  double distrustedThreshold{0.35};
  double notableAllianceTrust{0.7};
  double notableConflictTrust{0.3};
};

// Compares mean trust at the start and end of the window ending at `nowDays`.
RelationshipTrend analyzeTrend(const TrustEvolution& t, double nowDays,
                               const AnalyzerParams& params = AnalyzerParams{});

// High compatibility turns a decline into Improving; low compatibility turns
// an improvement into Declining. Otherwise the trend is kept.
RelationshipTrend predictTrajectory(RelationshipTrend current, double baselineCompatibility,
                                    const AnalyzerParams& params = AnalyzerParams{});

double allianceProbability(double mutualTrust, double volatility, double baselineCompatibility,
                           const AnalyzerParams& params = AnalyzerParams{});
double conflictProbability(double mutualTrust, double volatility, double baselineCompatibility,
                           const AnalyzerParams& params = AnalyzerParams{});

// Mean of (1 - 2 * volatility)+, (1 - (peak - low))+ and compatibility.
double stabilityScore(const TrustEvolution& t);

// Top interactions by |trustImpact| above the significance threshold,
// strongest first (ties keep history order).
std::vector<InteractionRecord> turningPoints(const std::vector<InteractionRecord>& interactions,
                                             const AnalyzerParams& params = AnalyzerParams{});

struct RelationshipSummary {
  FactionId a{0};
  FactionId b{0};
  std::string nameA;
  std::string nameB;

  TrustCategory category{TrustCategory::ModerateTrust};
  double mutualTrust{0.5};
  double aTrustsB{0.5}; // a's trust in b
  double bTrustsA{0.5}; // b's trust in a

  RelationshipTrend trend{RelationshipTrend::Stable};
  RelationshipTrend trajectory{RelationshipTrend::Stable};
  DiplomaticStatus status{DiplomaticStatus::Neutral};

  int durationDays{0};
  int totalInteractions{0};
  int positiveInteractions{0};
  int negativeInteractions{0};
  std::optional<double> lastInteractionDays;

  double allianceProbability{0.0};
  double conflictProbability{0.0};
  double stability{0.0};

  std::optional<InteractionRecord> mostSignificantPositive;
  std::optional<InteractionRecord> mostSignificantNegative;
  std::vector<InteractionRecord> turningPoints;

  // False when the pair has no stored evolution and was summarized from a
  // freshly seeded one.
  bool evolutionStored{false};
};

enum class ReputationStanding : core::u8 {
  Respected  = 0,
  Neutral    = 1,
  Distrusted = 2,
};

const char* reputationStandingName(ReputationStanding s);

struct FactionReputation {
  FactionId faction{0};
  std::string name;

  double overall{0.5};
  double trustworthiness{0.5}; // mean trust others place in the faction
  double reliability{0.5};     // share of initiated interactions that kept faith
  ReputationStanding standing{ReputationStanding::Neutral};

  std::vector<FactionId> notableAlliances;
  std::vector<FactionId> notableConflicts;

  double recentChange{0.0};
  RelationshipTrend direction{RelationshipTrend::Stable};

  int relationshipsConsidered{0}; // counterparts with a stored evolution
  int interactionsInitiated{0};
};

class RelationshipAnalyzer {
public:
  RelationshipAnalyzer(const AttributeProvider& attributes, const DiplomacyStatusProvider& status,
                       const TrustLedger& ledger,
                       AnalyzerParams params = AnalyzerParams{});

  const AnalyzerParams& params() const { return params_; }

  // Errors: ValidationError (a == b), NotFound (either faction unknown).
  Result<RelationshipSummary> summarize(FactionId a, FactionId b, double nowDays) const;

  // Aggregates the faction's pairs with every id in `counterparts` (the
  // faction itself and duplicates are ignored).
  // Errors: NotFound (faction or a counterpart unknown).
  Result<FactionReputation> reputation(FactionId faction, const std::vector<FactionId>& counterparts,
                                       double nowDays) const;

private:
  const AttributeProvider& attributes_;
  const DiplomacyStatusProvider& status_;
  const TrustLedger& ledger_;
  AnalyzerParams params_;
};

} // namespace entente::diplo
