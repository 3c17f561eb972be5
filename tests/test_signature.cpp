#include "entente/diplo/Signature.h"

#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/TrustLedger.h"

#include "diplo_fixtures.h"

#include <iostream>

using namespace entente;
using entente::test::traits;

// Replays the same interactions and negotiation twice; both runs must hash
// identically, and any change to the inputs must show up in the signature.
static core::u64 replayLedger(double lastImpact) {
  diplo::FactionRoster roster;
  test::addFaction(roster, 1, "Azure Compact", traits(7, 9, 5, 3, 0));
  test::addFaction(roster, 2, "Verdant League", traits(6, 7, 4, 4, 0));

  diplo::MemoryRelationshipStore store;
  diplo::TrustLedger ledger(roster, store);

  const double impacts[] = {0.3, -0.1, 0.05, -0.4, 0.2, lastImpact};
  double day = 0.0;
  for (const double impact : impacts) {
    diplo::InteractionInput in;
    in.initiator = (impact >= 0.0) ? 1 : 2;
    in.target = (impact >= 0.0) ? 2 : 1;
    in.kind = (impact >= 0.0) ? diplo::InteractionKind::TradeAgreement : diplo::InteractionKind::BorderIncident;
    in.trustImpact = impact;
    in.timeDays = day;
    day += 3.0;
    if (!ledger.recordInteraction(in).ok()) return 0;
  }

  const auto t = store.getTrustEvolution(1, 2);
  return t ? diplo::signatureTrustEvolution(*t) : 0;
}

static core::u64 replaySession(double militarySupport) {
  diplo::FactionRoster roster;
  test::addFaction(roster, 1, "Azure Compact", traits(6, 5, 8, 0, 0));
  test::addFaction(roster, 2, "Verdant League", traits(2, 5, 5, 0, 0));

  diplo::NegotiationEngine negotiations(roster);
  const auto s = negotiations.initiate(1, {2}, diplo::AllianceType::Military, diplo::TermOverrides{}, 0.0);
  if (!s.ok()) return 0;

  diplo::ActionParams propose;
  propose.overrides.militarySupportLevel = militarySupport;
  propose.note = "opening offer";
  if (!negotiations.advance(s.value.id, 1, diplo::NegotiationAction::ProposeTerms, propose, 1.0).ok()) return 0;

  diplo::ActionParams modify;
  modify.requestedTerms = {diplo::TermKey::SharedBorders};
  if (!negotiations.advance(s.value.id, 2, diplo::NegotiationAction::RequestModification, modify, 2.0).ok()) {
    return 0;
  }

  const auto st = negotiations.status(s.value.id, 3.0);
  return st.ok() ? diplo::signatureNegotiationSession(st.value) : 0;
}

int test_signature() {
  int fails = 0;

  const core::u64 ledgerA = replayLedger(0.1);
  const core::u64 ledgerB = replayLedger(0.1);
  const core::u64 ledgerC = replayLedger(0.15);
  if (ledgerA == 0 || ledgerA != ledgerB) {
    std::cerr << "[test_signature] ledger replay mismatch. a=" << (unsigned long long)ledgerA
              << " b=" << (unsigned long long)ledgerB << "\n";
    ++fails;
  }
  if (ledgerA == ledgerC) {
    std::cerr << "[test_signature] ledger signature ignores the last impact\n";
    ++fails;
  }

  const core::u64 sessionA = replaySession(0.7);
  const core::u64 sessionB = replaySession(0.7);
  const core::u64 sessionC = replaySession(0.6);
  if (sessionA == 0 || sessionA != sessionB) {
    std::cerr << "[test_signature] session replay mismatch. a=" << (unsigned long long)sessionA
              << " b=" << (unsigned long long)sessionB << "\n";
    ++fails;
  }
  if (sessionA == sessionC) {
    std::cerr << "[test_signature] session signature ignores the proposed terms\n";
    ++fails;
  }

  // Term signatures follow the version bump.
  diplo::AllianceTerms terms = diplo::defaultAllianceTerms(diplo::AllianceType::Economic);
  const core::u64 v1 = diplo::signatureAllianceTerms(terms);
  terms.version += 1;
  if (v1 == diplo::signatureAllianceTerms(terms)) {
    std::cerr << "[test_signature] terms signature ignores the version\n";
    ++fails;
  }

  if (fails == 0) std::cout << "[test_signature] pass\n";
  return fails;
}
