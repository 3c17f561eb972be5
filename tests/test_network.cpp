#include "entente/diplo/NetworkAnalyzer.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/TrustLedger.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <vector>

using namespace entente;
using entente::test::near;
using entente::test::traits;

static diplo::PairTrust pair(diplo::FactionId a, diplo::FactionId b, double trust) {
  diplo::PairTrust p;
  p.a = a;
  p.b = b;
  p.trust = trust;
  p.hasEvolution = true;
  return p;
}

int test_network() {
  int failures = 0;

  // ---- Hand-built four-faction matrix ----
  {
    const std::vector<diplo::FactionId> ids{1, 2, 3, 4};
    const std::vector<diplo::PairTrust> m{pair(1, 2, 0.85), pair(1, 3, 0.75), pair(1, 4, 0.25),
                                          pair(2, 3, 0.72), pair(2, 4, 0.5), pair(3, 4, 0.05)};

    // Greedy pairing: 3 trusts both 1 and 2 but both are already taken.
    const auto clusters = diplo::identifyAllianceClusters(m);
    CHECK(clusters.size() == 1);
    CHECK(clusters[0].members.size() == 2);
    CHECK(clusters[0].members[0] == 1 && clusters[0].members[1] == 2);
    CHECK(clusters[0].strength == diplo::ClusterStrength::Strong);

    const auto hot = diplo::identifyTensionHotspots(m);
    CHECK(hot.size() == 2);
    CHECK(hot[0].a == 3 && hot[0].b == 4);
    CHECK(hot[0].tension == diplo::TensionLevel::High);
    CHECK(near(hot[0].conflictProbability, 0.7));
    CHECK(hot[1].tension == diplo::TensionLevel::Moderate);

    const auto inf = diplo::rankInfluence(ids, m);
    CHECK(inf.size() == 4);
    CHECK(inf[0].faction == 2);
    CHECK(inf[1].faction == 1);
    CHECK(inf[2].faction == 3);
    CHECK(inf[3].faction == 4);
    CHECK(near(inf[0].influence, (0.85 + 0.72 + 0.5) / 3.0));

    CHECK(near(diplo::networkConflictRisk(m), 2.0 / 6.0));

    std::vector<double> values;
    for (const auto& p : m) values.push_back(p.trust);
    CHECK(near(diplo::networkStability(m), 0.52 * (1.0 - diplo::populationVariance(values))));

    const auto all = diplo::analyzeMatrix(ids, m);
    CHECK(all.matrix.size() == 6);
    CHECK(all.clusters.size() == 1);
    CHECK(all.hotspots.size() == 2);
    CHECK(all.influence.front().faction == 2);
  }

  CHECK(near(diplo::networkStability({}), 1.0));
  CHECK(near(diplo::networkConflictRisk({}), 0.0));

  // A moderate cluster sits between the two thresholds.
  {
    const auto c = diplo::identifyAllianceClusters({pair(5, 6, 0.75)});
    CHECK(c.size() == 1 && c[0].strength == diplo::ClusterStrength::Moderate);
  }

  // ---- Store-backed ----
  {
    diplo::FactionRoster roster;
    CHECK(test::addFaction(roster, 1, "Azure Compact", traits(5, 5, 5, 5, 5)));
    CHECK(test::addFaction(roster, 2, "Crimson Throne", traits(5, 5, 5, 5, 5)));
    CHECK(test::addFaction(roster, 3, "Verdant League", traits(8, 2, 1, 3, 9)));
    diplo::MemoryRelationshipStore store;

    const auto neutral = diplo::analyzeNetwork(roster, store, {1, 2, 3});
    CHECK(neutral.ok());
    CHECK(neutral.value.matrix.size() == 3);
    CHECK(!neutral.value.matrix[0].hasEvolution);
    CHECK(neutral.value.clusters.empty());
    CHECK(neutral.value.hotspots.empty());
    CHECK(near(neutral.value.stability, 0.5));

    diplo::TrustEvolution close = diplo::seedTrustEvolution(1, 2, 1.0, 0.0);
    close.aTrustsB = 0.9;
    close.bTrustsA = 0.9;
    store.storeTrustEvolution(close);

    diplo::TrustEvolution cold = diplo::seedTrustEvolution(3, 2, 0.2, 0.0);
    cold.aTrustsB = 0.1;
    cold.bTrustsA = 0.2;
    store.storeTrustEvolution(cold);

    const auto r = diplo::analyzeNetwork(roster, store, {2, 1, 3});
    CHECK(r.ok());
    CHECK(r.value.matrix[0].a == 2 && r.value.matrix[0].b == 1);
    CHECK(r.value.clusters.size() == 1);
    CHECK(r.value.hotspots.size() == 1);
    CHECK(r.value.hotspots[0].a == 2 && r.value.hotspots[0].b == 3);
    // Hotspot risk uses the pair's own compatibility.
    CHECK(near(r.value.hotspots[0].conflictProbability, 0.3 + 0.8 * 0.4));

    CHECK(diplo::analyzeNetwork(roster, store, {1}).error == diplo::DiploError::ValidationError);
    CHECK(diplo::analyzeNetwork(roster, store, {1, 2, 1}).error == diplo::DiploError::ValidationError);
    CHECK(diplo::analyzeNetwork(roster, store, {1, 9}).error == diplo::DiploError::NotFound);
  }

  return failures;
}
