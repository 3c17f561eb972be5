#include "entente/diplo/NetworkAnalyzer.h"

#include "entente/core/Clamp.h"
#include "entente/core/Log.h"
#include "entente/diplo/TrustLedger.h"

#include <algorithm>
#include <set>

namespace entente::diplo {

const char* clusterStrengthName(ClusterStrength s) {
  switch (s) {
    case ClusterStrength::Strong: return "strong";
    case ClusterStrength::Moderate: return "moderate";
  }
  return "unknown";
}

const char* tensionLevelName(TensionLevel t) {
  switch (t) {
    case TensionLevel::High: return "high";
    case TensionLevel::Moderate: return "moderate";
  }
  return "unknown";
}

std::vector<AllianceCluster> identifyAllianceClusters(const std::vector<PairTrust>& matrix,
                                                      const NetworkParams& params) {
  std::vector<AllianceCluster> out;
  std::set<FactionId> clustered;

  for (const auto& p : matrix) {
    if (p.trust < params.allianceThreshold) continue;
    if (clustered.count(p.a) || clustered.count(p.b)) continue;

    AllianceCluster c;
    c.members = {p.a, p.b};
    c.averageTrust = p.trust;
    c.strength = (p.trust > params.strongClusterThreshold) ? ClusterStrength::Strong : ClusterStrength::Moderate;
    out.push_back(std::move(c));

    clustered.insert(p.a);
    clustered.insert(p.b);
  }
  return out;
}

std::vector<TensionHotspot> identifyTensionHotspots(const std::vector<PairTrust>& matrix,
                                                    const NetworkParams& params,
                                                    const AnalyzerParams& analyzer) {
  std::vector<TensionHotspot> out;
  for (const auto& p : matrix) {
    if (p.trust > params.hotspotThreshold) continue;

    TensionHotspot h;
    h.a = p.a;
    h.b = p.b;
    h.trust = p.trust;
    h.tension = (p.trust < params.highTensionThreshold) ? TensionLevel::High : TensionLevel::Moderate;
    h.conflictProbability = conflictProbability(p.trust, p.volatility, p.baselineCompatibility, analyzer);
    out.push_back(h);
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const TensionHotspot& x, const TensionHotspot& y) { return x.trust < y.trust; });
  return out;
}

std::vector<InfluenceEntry> rankInfluence(const std::vector<FactionId>& factions,
                                          const std::vector<PairTrust>& matrix,
                                          const NetworkParams& params) {
  std::vector<InfluenceEntry> out;
  out.reserve(factions.size());
  for (const FactionId f : factions) {
    double sum = 0.0;
    int n = 0;
    for (const auto& p : matrix) {
      if (p.a == f || p.b == f) {
        sum += p.trust;
        ++n;
      }
    }
    out.push_back(InfluenceEntry{f, (n > 0) ? (sum / n) : params.neutralTrust});
  }
  std::stable_sort(out.begin(), out.end(),
                   [](const InfluenceEntry& x, const InfluenceEntry& y) { return x.influence > y.influence; });
  return out;
}

double networkStability(const std::vector<PairTrust>& matrix) {
  if (matrix.empty()) return 1.0;

  std::vector<double> values;
  values.reserve(matrix.size());
  double mean = 0.0;
  for (const auto& p : matrix) {
    values.push_back(p.trust);
    mean += p.trust;
  }
  mean /= static_cast<double>(values.size());
  return core::clamp01(mean * (1.0 - populationVariance(values)));
}

double networkConflictRisk(const std::vector<PairTrust>& matrix, const NetworkParams& params) {
  if (matrix.empty()) return 0.0;
  const auto low = std::count_if(matrix.begin(), matrix.end(),
                                 [&](const PairTrust& p) { return p.trust < params.conflictRiskThreshold; });
  return core::clamp01(static_cast<double>(low) / static_cast<double>(matrix.size()));
}

NetworkAnalysis analyzeMatrix(const std::vector<FactionId>& factions, std::vector<PairTrust> matrix,
                              const NetworkParams& params, const AnalyzerParams& analyzer) {
  NetworkAnalysis out;
  out.factions = factions;
  out.clusters = identifyAllianceClusters(matrix, params);
  out.hotspots = identifyTensionHotspots(matrix, params, analyzer);
  out.influence = rankInfluence(factions, matrix, params);
  out.stability = networkStability(matrix);
  out.conflictRisk = networkConflictRisk(matrix, params);
  out.matrix = std::move(matrix);
  return out;
}

Result<NetworkAnalysis> analyzeNetwork(const AttributeProvider& attributes, const RelationshipStore& store,
                                       const std::vector<FactionId>& factions,
                                       const NetworkParams& params, const AnalyzerParams& analyzer) {
  using R = Result<NetworkAnalysis>;
  if (factions.size() < 2) {
    return R::failure(DiploError::ValidationError, "network analysis needs at least 2 factions");
  }
  {
    std::set<FactionId> seen;
    for (const FactionId f : factions) {
      if (!seen.insert(f).second) {
        return R::failure(DiploError::ValidationError, "faction " + std::to_string(f) + " listed twice");
      }
    }
  }
  for (const FactionId f : factions) {
    if (!attributes.getFaction(f)) {
      return R::failure(DiploError::NotFound, "faction " + std::to_string(f) + " not found");
    }
  }

  std::vector<PairTrust> matrix;
  matrix.reserve(factions.size() * (factions.size() - 1) / 2);
  for (std::size_t i = 0; i < factions.size(); ++i) {
    for (std::size_t j = i + 1; j < factions.size(); ++j) {
      PairTrust p;
      p.a = factions[i];
      p.b = factions[j];
      p.trust = params.neutralTrust;
      if (const auto t = store.getTrustEvolution(p.a, p.b)) {
        p.trust = t->mutualTrust();
        p.volatility = t->volatility;
        p.baselineCompatibility = t->baselineCompatibility;
        p.hasEvolution = true;
      }
      matrix.push_back(p);
    }
  }

  ENTENTE_LOG_DEBUG("network: " + std::to_string(factions.size()) + " factions, " +
                    std::to_string(matrix.size()) + " pairs");
  return R::success(analyzeMatrix(factions, std::move(matrix), params, analyzer));
}

} // namespace entente::diplo
