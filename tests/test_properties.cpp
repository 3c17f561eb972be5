#include <catch2/catch_test_macros.hpp>

#include "entente/diplo/AllianceFormation.h"
#include "entente/diplo/BetrayalRisk.h"
#include "entente/diplo/Compatibility.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/Signature.h"
#include "entente/diplo/TrustLedger.h"

#include "diplo_fixtures.h"

#include <cmath>

using namespace entente;

static diplo::TraitVector randomTraits(core::SplitMix64& rng) {
  return test::traits(rng.range(0, 10), rng.range(0, 10), rng.range(0, 10), rng.range(0, 10), rng.range(0, 10));
}

TEST_CASE("Compatibility is bounded and symmetric over random trait vectors") {
  core::SplitMix64 rng(0xD1A7ull);
  for (int i = 0; i < 2000; ++i) {
    const auto a = randomTraits(rng);
    const auto b = randomTraits(rng);
    const double ab = diplo::traitCompatibility(a, b);
    const double ba = diplo::traitCompatibility(b, a);
    REQUIRE(ab >= 0.0);
    REQUIRE(ab <= 1.0);
    REQUIRE(std::fabs(ab - ba) <= 1e-12);

    const double threat = diplo::estimateThreatLevel(rng.range(0, 12), rng);
    REQUIRE(threat >= 0.0);
    REQUIRE(threat <= 1.0);

    const double w = diplo::allianceWillingness(a, threat, ab);
    REQUIRE(w >= 0.0);
    REQUIRE(w <= 1.0);
  }
}

TEST_CASE("Betrayal risk grows with ambition and shrinks with integrity") {
  core::SplitMix64 rng(42);
  for (int i = 0; i < 500; ++i) {
    auto t = randomTraits(rng);
    double previous = -1.0;
    for (int amb = 0; amb <= 10; ++amb) {
      t.ambition = amb;
      const double r = diplo::baseBetrayalRisk(t);
      REQUIRE(r >= previous);
      previous = r;
    }

    previous = 2.0;
    for (int integ = 0; integ <= 10; ++integ) {
      t.integrity = integ;
      const double r = diplo::baseBetrayalRisk(t);
      REQUIRE(r <= previous);
      previous = r;
    }

    diplo::ExternalFactors f;
    f.underPressure = rng.chance(0.5);
    f.recentDefeats = rng.range(0, 5);
    f.resourceShortage = rng.chance(0.5);
    f.betterOpportunity = rng.chance(0.5);
    const auto a = diplo::evaluateBetrayalRisk(t, f);
    REQUIRE(a.probability >= 0.0);
    REQUIRE(a.probability <= 0.8);
  }
}

TEST_CASE("Trust stays in range and each step is bounded") {
  diplo::FactionRoster roster;
  REQUIRE(test::addFaction(roster, 1, "Azure Compact", test::traits(7, 9, 5, 3, 0)));
  REQUIRE(test::addFaction(roster, 2, "Crimson Throne", test::traits(1, 1, 9, 9, 10)));

  diplo::MemoryRelationshipStore store;
  diplo::TrustLedger ledger(roster, store);
  core::SplitMix64 rng(99);

  double before = ledger.preview(1, 2, 0.0).value.trustFrom(2);
  for (int i = 0; i < 300; ++i) {
    diplo::InteractionInput in;
    in.initiator = 1;
    in.target = 2;
    in.kind = diplo::InteractionKind::MediationAttempt;
    in.trustImpact = rng.uniform(-1.0, 1.0);
    in.timeDays = static_cast<double>(i);
    const auto r = ledger.recordInteraction(in);
    REQUIRE(r.ok());

    const auto& t = r.value.evolution;
    REQUIRE(t.aTrustsB >= 0.0);
    REQUIRE(t.aTrustsB <= 1.0);
    REQUIRE(t.bTrustsA >= 0.0);
    REQUIRE(t.bTrustsA <= 1.0);
    REQUIRE(t.lowestTrust <= t.peakTrust);

    const double after = t.trustFrom(2);
    REQUIRE(std::fabs(after - before) <= 0.2 + 1e-12);
    before = after;
  }
}

TEST_CASE("Every declared phase edge leaves a non-terminal phase") {
  for (int f = 0; f < diplo::kNegotiationPhaseCount; ++f) {
    const auto from = static_cast<diplo::NegotiationPhase>(f);
    for (int t = 0; t < diplo::kNegotiationPhaseCount; ++t) {
      const auto to = static_cast<diplo::NegotiationPhase>(t);
      if (diplo::isTerminalPhase(from)) REQUIRE_FALSE(diplo::isAllowedTransition(from, to));
    }
    if (diplo::isTerminalPhase(from)) {
      REQUIRE(diplo::availableActions(from).empty());
    } else {
      REQUIRE(diplo::isAllowedTransition(from, diplo::NegotiationPhase::Expired));
    }
  }
}

TEST_CASE("Negotiation status is idempotent between actions") {
  diplo::FactionRoster roster;
  REQUIRE(test::addFaction(roster, 1, "Azure Compact", test::traits(6, 5, 8, 0, 0)));
  REQUIRE(test::addFaction(roster, 2, "Verdant League", test::traits(5, 5, 5, 0, 7)));

  diplo::NegotiationEngine negotiations(roster);
  const auto s = negotiations.initiate(1, {2}, diplo::AllianceType::Trade, diplo::TermOverrides{}, 0.0);
  REQUIRE(s.ok());

  const auto first = negotiations.status(s.value.id, 40.0);
  const auto second = negotiations.status(s.value.id, 41.0);
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  REQUIRE(first.value.phase == diplo::NegotiationPhase::Expired);
  REQUIRE(diplo::signatureNegotiationSession(first.value) == diplo::signatureNegotiationSession(second.value));
}
