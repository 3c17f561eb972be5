#pragma once

#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"
#include "entente/diplo/RelationshipAnalyzer.h"

#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Diplomatic network
// -----------------------------------------------------------------------------
//
// Aggregates mean trust over every unordered pair of a faction set.
//
// Clustering is greedy over the pair list in input order: a pair at or above
// the alliance threshold becomes a two-member cluster unless either member is
// already clustered. Overlapping high-trust pairs are NOT merged transitively,
// so a three-way bloc shows up as one pair cluster plus nothing.

struct NetworkParams {
  double neutralTrust{0.5}; // pairs without an evolution
  double allianceThreshold{0.7};
  double strongClusterThreshold{0.8};
  double hotspotThreshold{0.3};
  double highTensionThreshold{0.1};
  double conflictRiskThreshold{0.3};
};

struct PairTrust {
  FactionId a{0}; // earlier in the input order
  FactionId b{0};
  double trust{0.5};
  double volatility{0.0};
  double baselineCompatibility{0.5};
  bool hasEvolution{false};
};

enum class ClusterStrength : core::u8 { Strong = 0, Moderate = 1 };
enum class TensionLevel : core::u8 { High = 0, Moderate = 1 };

const char* clusterStrengthName(ClusterStrength s);
const char* tensionLevelName(TensionLevel t);

struct AllianceCluster {
  std::vector<FactionId> members;
  double averageTrust{0.0};
  ClusterStrength strength{ClusterStrength::Moderate};
};

struct TensionHotspot {
  FactionId a{0};
  FactionId b{0};
  double trust{0.0};
  TensionLevel tension{TensionLevel::Moderate};
  double conflictProbability{0.0};
};

struct InfluenceEntry {
  FactionId faction{0};
  double influence{0.5};
};

struct NetworkAnalysis {
  std::vector<FactionId> factions;
  std::vector<PairTrust> matrix; // (i, j) for i < j in input order
  std::vector<AllianceCluster> clusters;
  std::vector<TensionHotspot> hotspots;  // lowest trust first
  std::vector<InfluenceEntry> influence; // highest first
  double stability{1.0};
  double conflictRisk{0.0};
};

std::vector<AllianceCluster> identifyAllianceClusters(const std::vector<PairTrust>& matrix,
                                                      const NetworkParams& params = NetworkParams{});

std::vector<TensionHotspot> identifyTensionHotspots(const std::vector<PairTrust>& matrix,
                                                    const NetworkParams& params = NetworkParams{},
                                                    const AnalyzerParams& analyzer = AnalyzerParams{});

// Mean pair trust per faction (neutral when the faction has no pairs),
// sorted descending; ties keep input order.
std::vector<InfluenceEntry> rankInfluence(const std::vector<FactionId>& factions,
                                          const std::vector<PairTrust>& matrix,
                                          const NetworkParams& params = NetworkParams{});

// mean * (1 - variance) over pair trust; 1 for an empty matrix.
double networkStability(const std::vector<PairTrust>& matrix);

// Share of pairs strictly below the conflict risk threshold; 0 when empty.
double networkConflictRisk(const std::vector<PairTrust>& matrix, const NetworkParams& params = NetworkParams{});

// Pure part: everything derived from an already built matrix.
NetworkAnalysis analyzeMatrix(const std::vector<FactionId>& factions, std::vector<PairTrust> matrix,
                              const NetworkParams& params = NetworkParams{},
                              const AnalyzerParams& analyzer = AnalyzerParams{});

// Builds the matrix from the store and analyzes it.
// Errors: ValidationError (fewer than two ids, duplicate ids), NotFound.
Result<NetworkAnalysis> analyzeNetwork(const AttributeProvider& attributes, const RelationshipStore& store,
                                       const std::vector<FactionId>& factions,
                                       const NetworkParams& params = NetworkParams{},
                                       const AnalyzerParams& analyzer = AnalyzerParams{});

} // namespace entente::diplo
