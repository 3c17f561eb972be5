#include "entente/diplo/DiplomacyConfig.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/TrustLedger.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <string>

using namespace entente;
using entente::test::near;
using entente::test::traits;

int test_diplomacy_config() {
  int failures = 0;

  // Without the vars every field keeps its default.
  {
    core::CVarRegistry empty;
    const auto p = diplo::diplomacyParamsFromCVars(empty);
    CHECK(p.negotiation.maxRounds == 10);
    CHECK(near(p.trust.maxDeltaPerEvent, 0.2));
    CHECK(near(p.betrayal.probabilityCap, 0.8));
  }

  core::CVarRegistry reg;
  diplo::installDiplomacyCVars(reg);
  CHECK(reg.find("diplo.negotiation.max_rounds") != nullptr);
  CHECK(reg.getInt("diplo.negotiation.max_rounds", 0) == 10);
  CHECK(near(reg.getFloat("diplo.negotiation.duration_days", 0.0), 30.0));
  CHECK(near(reg.getFloat("diplo.compat.integrity_weight", 0.0), 0.35));

  std::string err;
  CHECK(reg.setInt("diplo.negotiation.max_rounds", 4, &err));
  CHECK(reg.setFromString("diplo.trust.max_delta", "0.1", &err));

  // Out-of-range values are refused and leave the previous value.
  CHECK(!reg.setFloat("diplo.trust.max_delta", 1.5, &err));
  CHECK(!reg.setInt("diplo.negotiation.max_participants", 1, &err));
  CHECK(near(reg.getFloat("diplo.trust.max_delta", 0.0), 0.1));

  // Installing again keeps edited values.
  diplo::installDiplomacyCVars(reg);
  CHECK(reg.getInt("diplo.negotiation.max_rounds", 0) == 4);

  const auto p = diplo::diplomacyParamsFromCVars(reg);
  CHECK(p.negotiation.maxRounds == 4);
  CHECK(near(p.trust.maxDeltaPerEvent, 0.1));
  CHECK(p.negotiation.maxParticipants == 8);

  // The tuned step bound reaches the ledger.
  {
    diplo::FactionRoster roster;
    CHECK(test::addFaction(roster, 1, "Azure Compact", traits(5, 5, 5, 5, 5)));
    CHECK(test::addFaction(roster, 2, "Crimson Throne", traits(5, 5, 5, 5, 5)));
    diplo::MemoryRelationshipStore store;
    store.storeTrustEvolution(diplo::seedTrustEvolution(1, 2, 0.5, 0.0));
    diplo::TrustLedger ledger(roster, store, p.trust, p.compatibility);

    diplo::InteractionInput in;
    in.initiator = 2;
    in.target = 1;
    in.kind = diplo::InteractionKind::Betrayal;
    in.trustImpact = -0.9;
    in.timeDays = 1.0;
    const auto r = ledger.recordInteraction(in);
    CHECK(r.ok());
    CHECK(near(r.value.evolution.trustFrom(1), 0.4));
  }

  return failures;
}
