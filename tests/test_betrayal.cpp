#include "entente/diplo/BetrayalRisk.h"
#include "entente/diplo/FactionRoster.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <algorithm>
#include <string>

using namespace entente;
using entente::test::near;
using entente::test::traits;

static bool hasConsequence(const diplo::BetrayalEvent& e, const std::string& text) {
  return std::find(e.consequences.begin(), e.consequences.end(), text) != e.consequences.end();
}

int test_betrayal() {
  int failures = 0;

  // ---- Ambitious, unprincipled faction under pressure and short of supplies ----
  {
    const diplo::TraitVector t = traits(0, 2, 9, 8, 0);
    diplo::ExternalFactors f;
    f.underPressure = true;
    f.resourceShortage = true;

    CHECK(near(diplo::baseBetrayalRisk(t), 0.43));
    CHECK(near(diplo::externalBetrayalModifier(f), 0.23));

    const auto a = diplo::evaluateBetrayalRisk(t, f, {5, 6});
    CHECK(near(a.probability, 0.66));
    CHECK(a.tier == diplo::RiskTier::High);
    CHECK(a.motivation == diplo::BetrayalMotivation::Ambition);
    CHECK(near(a.expectedTrustDamage, 0.48));
    CHECK(a.trustDamage.size() == 2);
  }

  // ---- Cap at 0.8 ----
  {
    diplo::ExternalFactors f;
    f.underPressure = true;
    f.recentDefeats = 5;
    f.resourceShortage = true;
    f.betterOpportunity = true;
    const auto a = diplo::evaluateBetrayalRisk(traits(0, 0, 10, 10, 0), f);
    CHECK(near(a.probability, 0.8));
  }

  // Two defeats do not yet count; three do.
  {
    diplo::ExternalFactors f;
    f.recentDefeats = 2;
    CHECK(near(diplo::externalBetrayalModifier(f), 0.0));
    f.recentDefeats = 3;
    CHECK(near(diplo::externalBetrayalModifier(f), 0.10));
  }

  // ---- Tiers and motivations ----
  CHECK(diplo::classifyBetrayalRisk(0.61) == diplo::RiskTier::High);
  CHECK(diplo::classifyBetrayalRisk(0.6) == diplo::RiskTier::Medium);
  CHECK(diplo::classifyBetrayalRisk(0.31) == diplo::RiskTier::Medium);
  CHECK(diplo::classifyBetrayalRisk(0.3) == diplo::RiskTier::Low);
  {
    diplo::ExternalFactors pressed;
    pressed.underPressure = true;
    CHECK(diplo::primaryBetrayalMotivation(traits(5, 5, 5, 5, 5), pressed) == diplo::BetrayalMotivation::Pressure);
    CHECK(diplo::primaryBetrayalMotivation(traits(8, 5, 5, 5, 5), {}) == diplo::BetrayalMotivation::Opportunity);
    CHECK(diplo::primaryBetrayalMotivation(traits(5, 5, 5, 5, 5), {}) == diplo::BetrayalMotivation::Ideology);
    // Ambition wins over pressure.
    CHECK(diplo::primaryBetrayalMotivation(traits(5, 3, 8, 5, 5), pressed) == diplo::BetrayalMotivation::Ambition);
  }

  // A principled, pragmatic faction sits at the floor.
  {
    const auto a = diplo::evaluateBetrayalRisk(traits(10, 10, 0, 0, 5), {});
    CHECK(a.probability >= 0.0);
    CHECK(a.tier == diplo::RiskTier::Low);
  }

  // ---- Betrayal events ----
  {
    const auto e = diplo::makeBetrayalEvent(3, traits(0, 2, 9, 8, 0), diplo::BetrayalKind::Military,
                                            diplo::BetrayalMotivation::Ambition, "fleet withdrawn", 12.0);
    CHECK(near(e.severity, 0.9));
    CHECK(near(e.trustDamage, 0.68));
    CHECK(hasConsequence(e, "Alliance dissolution"));
    CHECK(hasConsequence(e, "Diplomatic isolation"));
    CHECK(hasConsequence(e, "Military retaliation risk"));

    const auto mild = diplo::makeBetrayalEvent(3, traits(5, 10, 0, 0, 5), diplo::BetrayalKind::Economic,
                                               diplo::BetrayalMotivation::Ideology, "", 0.0);
    CHECK(near(mild.severity, 0.3));
    CHECK(near(mild.trustDamage, 0.2));
    CHECK(!hasConsequence(mild, "Diplomatic isolation"));
    CHECK(!hasConsequence(mild, "Military retaliation risk"));
  }

  // ---- Provider-backed ----
  {
    diplo::FactionRoster roster;
    CHECK(test::addFaction(roster, 3, "Crimson Throne", traits(0, 2, 9, 8, 0)));

    const auto ok = diplo::evaluateBetrayalRisk(roster, 3, {}, {3, 4, 4, 5});
    CHECK(ok.ok());
    CHECK(ok.value.faction == 3);
    CHECK(ok.value.trustDamage.size() == 2);

    CHECK(diplo::evaluateBetrayalRisk(roster, 99, {}, {}).error == diplo::DiploError::NotFound);

    diplo::ExternalFactors bad;
    bad.recentDefeats = -1;
    CHECK(diplo::evaluateBetrayalRisk(roster, 3, bad, {}).error == diplo::DiploError::ValidationError);
  }

  // ---- Names ----
  {
    diplo::BetrayalKind k;
    CHECK(diplo::tryParseBetrayalKind("military", k) && k == diplo::BetrayalKind::Military);
    CHECK(!diplo::tryParseBetrayalKind("naval", k));
    diplo::BetrayalMotivation m;
    CHECK(diplo::tryParseBetrayalMotivation(diplo::betrayalMotivationName(diplo::BetrayalMotivation::Opportunity), m));
    CHECK(m == diplo::BetrayalMotivation::Opportunity);
  }

  return failures;
}
