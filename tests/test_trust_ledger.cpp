#include "entente/diplo/TrustLedger.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <algorithm>
#include <vector>

using namespace entente;
using entente::test::near;
using entente::test::traits;

static diplo::InteractionInput interaction(diplo::FactionId from, diplo::FactionId to, diplo::InteractionKind kind,
                                           double impact, double day) {
  diplo::InteractionInput in;
  in.initiator = from;
  in.target = to;
  in.kind = kind;
  in.trustImpact = impact;
  in.timeDays = day;
  return in;
}

int test_trust_ledger() {
  int failures = 0;

  // ---- Pure helpers ----
  CHECK(near(diplo::seededTrust(0.5), 0.5));
  CHECK(near(diplo::seededTrust(1.0), 0.6));
  CHECK(near(diplo::seededTrust(0.0), 0.4));
  CHECK(near(diplo::clampedTrustDelta(-0.9), -0.2));
  CHECK(near(diplo::clampedTrustDelta(0.05), 0.05));
  CHECK(near(diplo::populationVariance({1.0, 2.0, 3.0, 4.0}), 1.25));
  CHECK(near(diplo::populationVariance({0.7}), 0.0));
  CHECK(diplo::trustCategory(0.95) == diplo::TrustCategory::AbsoluteTrust);
  CHECK(diplo::trustCategory(0.5) == diplo::TrustCategory::ModerateTrust);
  CHECK(diplo::trustCategory(0.05) == diplo::TrustCategory::DeepMistrust);

  diplo::FactionRoster roster;
  CHECK(test::addFaction(roster, 1, "Azure Compact", traits(5, 5, 5, 5, 5)));
  CHECK(test::addFaction(roster, 2, "Crimson Throne", traits(5, 5, 5, 5, 5)));
  CHECK(test::addFaction(roster, 3, "Verdant League", traits(8, 2, 1, 3, 9)));

  // ---- Betrayal between previously neutral factions ----
  {
    diplo::MemoryRelationshipStore store;
    store.storeTrustEvolution(diplo::seedTrustEvolution(1, 2, 0.5, 0.0));
    diplo::TrustLedger ledger(roster, store);

    auto in = interaction(2, 1, diplo::InteractionKind::Betrayal, -0.9, 5.0);
    in.description = "seized the shared shipyards";
    const auto r = ledger.recordInteraction(in);
    CHECK(r.ok());
    CHECK(!r.value.seeded);

    const auto& t = r.value.evolution;
    CHECK(near(t.trustFrom(1), 0.3)); // victim
    CHECK(near(t.trustFrom(2), 0.4)); // betrayer
    CHECK(near(t.lowestTrust, 0.3));
    CHECK(near(t.peakTrust, 0.5));
    CHECK(t.history.size() == 2);

    CHECK(near(r.value.record.tensionImpact, -1.8));
    CHECK(r.value.record.consequences.size() == 3);
    CHECK(store.interactionCount() == 1);

    const auto stored = store.getTrustEvolution(2, 1);
    CHECK(stored && near(stored->aTrustsB, 0.3));
  }

  // ---- Seeding from compatibility and explicit initialization ----
  {
    diplo::MemoryRelationshipStore store;
    diplo::TrustLedger ledger(roster, store);

    const auto preview = ledger.preview(1, 2, 0.0);
    CHECK(preview.ok() && near(preview.value.aTrustsB, 0.6));
    CHECK(store.evolutionCount() == 0);

    const auto first = ledger.initialize(2, 1, 0.0);
    CHECK(first.ok());
    CHECK(first.value.key.low == 1 && first.value.key.high == 2);
    CHECK(store.evolutionCount() == 1);

    // Initialization never overwrites.
    CHECK(ledger.recordInteraction(interaction(1, 2, diplo::InteractionKind::TradeAgreement, 0.5, 1.0)).ok());
    const auto second = ledger.initialize(1, 2, 9.0);
    CHECK(second.ok() && second.value.history.size() == 2);

    const auto fresh = ledger.recordInteraction(interaction(1, 3, diplo::InteractionKind::CulturalExchange, 0.1, 2.0));
    CHECK(fresh.ok() && fresh.value.seeded);
    CHECK(fresh.value.evolution.baselineCompatibility < 1.0);

    CHECK(ledger.initialize(1, 1, 0.0).error == diplo::DiploError::ValidationError);
    CHECK(ledger.initialize(1, 8, 0.0).error == diplo::DiploError::NotFound);
  }

  // ---- Volatility appears once the window fills ----
  {
    diplo::MemoryRelationshipStore store;
    diplo::TrustLedger ledger(roster, store);

    diplo::RecordedInteraction last;
    for (int i = 0; i < 3; ++i) {
      const auto r = ledger.recordInteraction(interaction(1, 2, diplo::InteractionKind::MilitarySupport, 0.2, i + 1.0));
      CHECK(r.ok());
      last = r.value;
    }
    CHECK(last.evolution.history.size() == 4);
    CHECK(last.evolution.volatility == 0.0);

    const auto r = ledger.recordInteraction(interaction(2, 1, diplo::InteractionKind::BorderIncident, -0.3, 5.0));
    CHECK(r.ok());
    const auto& t = r.value.evolution;
    CHECK(t.history.size() == 5);

    std::vector<double> maxima;
    for (const auto& s : t.history) maxima.push_back(std::max(s.aTrustsB, s.bTrustsA));
    CHECK(t.volatility > 0.0);
    CHECK(near(t.volatility, diplo::populationVariance(maxima)));

    // Trust stays within bounds however hard it is pushed.
    for (int i = 0; i < 20; ++i) {
      const auto up = ledger.recordInteraction(interaction(1, 2, diplo::InteractionKind::HumanitarianAid, 1.0, 10.0 + i));
      CHECK(up.ok());
      CHECK(up.value.evolution.aTrustsB <= 1.0 && up.value.evolution.bTrustsA <= 1.0);
    }
    CHECK(near(store.getTrustEvolution(1, 2)->peakTrust, 1.0));

    // Ids grow monotonically.
    const auto recs = store.getInteractions(2, 1);
    for (std::size_t i = 1; i < recs.size(); ++i) CHECK(recs[i].id > recs[i - 1].id);
  }

  // ---- Failures store nothing ----
  {
    diplo::MemoryRelationshipStore store;
    diplo::TrustLedger ledger(roster, store);

    CHECK(ledger.recordInteraction(interaction(1, 42, diplo::InteractionKind::TradeAgreement, 0.2, 0.0)).error ==
          diplo::DiploError::NotFound);
    CHECK(ledger.recordInteraction(interaction(1, 2, diplo::InteractionKind::TradeAgreement, 1.5, 0.0)).error ==
          diplo::DiploError::ValidationError);
    CHECK(ledger.recordInteraction(interaction(2, 2, diplo::InteractionKind::TradeAgreement, 0.2, 0.0)).error ==
          diplo::DiploError::ValidationError);

    auto sev = interaction(1, 2, diplo::InteractionKind::TradeAgreement, 0.2, 0.0);
    sev.severity = 1.2;
    CHECK(ledger.recordInteraction(sev).error == diplo::DiploError::ValidationError);

    CHECK(store.interactionCount() == 0);
    CHECK(store.evolutionCount() == 0);
  }

  return failures;
}
