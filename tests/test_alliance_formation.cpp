#include "entente/diplo/AllianceFormation.h"
#include "entente/diplo/FactionRoster.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <algorithm>
#include <string>

using namespace entente;
using entente::test::near;
using entente::test::traits;

template <class T>
static bool contains(const std::vector<T>& v, const T& x) {
  return std::find(v.begin(), v.end(), x) != v.end();
}

int test_alliance_formation() {
  int failures = 0;

  // ---- Willingness ----
  {
    // Ambition counts against willingness below the threat pivot, for it above.
    const diplo::TraitVector t = traits(5, 5, 10, 0, 0);
    const double calm = diplo::allianceWillingness(t, 0.2, 0.5);
    const double tense = diplo::allianceWillingness(t, 0.6, 0.5);
    CHECK(near(calm, 0.2 + 0.075 + 0.08 - 0.1));
    CHECK(near(tense, 0.2 + 0.075 + 0.24 + 0.1));

    CHECK(near(diplo::allianceWillingness(traits(10, 10, 0, 0, 0), 0.6, 1.0), 0.94));
    CHECK(near(diplo::allianceWillingness(traits(10, 10, 10, 0, 0), 1.0, 1.0), 1.0));
    CHECK(near(diplo::allianceWillingness(traits(0, 0, 10, 0, 0), 0.0, 0.0), 0.0));
  }

  // ---- Recommendations ----
  {
    const auto defensive = diplo::recommendAllianceTypes(traits(5, 5, 5, 5, 5), traits(5, 5, 5, 5, 5), 0.75);
    CHECK(defensive.size() == 2);
    CHECK(defensive[0] == diplo::AllianceType::Defensive);
    CHECK(defensive[1] == diplo::AllianceType::MutualProtection);

    const auto fallback = diplo::recommendAllianceTypes(traits(5, 5, 5, 5, 5), traits(5, 5, 5, 5, 5), 0.1);
    CHECK(fallback.size() == 1 && fallback[0] == diplo::AllianceType::Cooperation);

    const auto rich = diplo::recommendAllianceTypes(traits(8, 9, 8, 0, 0), traits(8, 9, 8, 0, 0), 0.1);
    CHECK(contains(rich, diplo::AllianceType::Expansionist));
    CHECK(contains(rich, diplo::AllianceType::Trade));
    CHECK(contains(rich, diplo::AllianceType::Formal));
    CHECK(!contains(rich, diplo::AllianceType::Cooperation));
  }

  // ---- Risks / benefits / duration ----
  {
    const auto risks = diplo::identifyAllianceRisks(traits(5, 2, 1, 9, 2), traits(5, 5, 9, 0, 8));
    CHECK(risks.size() == 4);

    const auto none = diplo::identifyAllianceRisks(traits(5, 5, 5, 5, 5), traits(5, 5, 5, 5, 5));
    CHECK(none.empty());

    const auto benefits = diplo::identifyAllianceBenefits(traits(7, 8, 2, 0, 0), traits(7, 8, 8, 0, 0), 0.6);
    CHECK(benefits.size() == 4);

    CHECK(diplo::estimateAllianceDuration(traits(0, 9, 0, 0, 9), traits(0, 8, 0, 0, 8)) ==
          diplo::AllianceDuration::LongTerm);
    CHECK(diplo::estimateAllianceDuration(traits(0, 6, 0, 0, 6), traits(0, 6, 0, 0, 6)) ==
          diplo::AllianceDuration::MediumTerm);
    CHECK(diplo::estimateAllianceDuration(traits(0, 9, 0, 0, 0), traits(0, 7, 0, 0, 0)) ==
          diplo::AllianceDuration::ShortTerm);
    CHECK(diplo::estimateAllianceDuration(traits(0, 1, 0, 0, 1), traits(0, 1, 0, 0, 1)) ==
          diplo::AllianceDuration::VeryShortTerm);
  }

  // ---- Two compatible factions facing one shared enemy ----
  {
    diplo::FactionRoster roster;
    CHECK(test::addFaction(roster, 1, "Azure Compact", traits(7, 9, 5, 3, 0)));
    CHECK(test::addFaction(roster, 2, "Verdant League", traits(6, 7, 4, 4, 0)));
    CHECK(test::addFaction(roster, 9, "Ash Horde", traits(1, 1, 9, 9, 10)));

    core::SplitMix64 rng(1337);
    const auto r = diplo::evaluateAllianceOpportunity(roster, 1, 2, {9}, std::nullopt, rng);
    CHECK(r.ok());
    const auto& o = r.value;
    CHECK(o.compatible);
    CHECK(o.assessment.compatibility > 0.6);
    CHECK(o.assessment.threatLevel >= 0.2 && o.assessment.threatLevel < 0.5);
    CHECK(o.willingnessA > 0.0 && o.willingnessA <= 1.0);
    CHECK(o.willingnessB > 0.0 && o.willingnessB <= 1.0);
    CHECK(near(o.overallWillingness, 0.5 * (o.willingnessA + o.willingnessB)));

    CHECK(o.recommendedTypes.size() == 2);
    CHECK(contains(o.recommendedTypes, diplo::AllianceType::Trade));
    CHECK(contains(o.recommendedTypes, diplo::AllianceType::Formal));
    CHECK(o.suggestedTerms.type == o.recommendedTypes.front());

    CHECK(o.duration == diplo::AllianceDuration::ShortTerm);
    CHECK(contains(o.risks, std::string("Poor discipline may affect alliance reliability")));
    CHECK(contains(o.benefits, std::string("High mutual integrity ensures reliability")));

    // A requested type replaces the recommendation list.
    const auto forced = diplo::evaluateAllianceOpportunity(roster, 1, 2, {9}, diplo::AllianceType::Military, rng);
    CHECK(forced.ok());
    CHECK(forced.value.recommendedTypes.size() == 1);
    CHECK(forced.value.suggestedTerms.military.mutualDefense);

    // Incompatible pair without a threat override.
    const auto poor = diplo::evaluateAllianceOpportunity(roster, 1, 9, {}, std::nullopt, rng);
    CHECK(poor.ok());
    CHECK(!poor.value.compatible);

    CHECK(diplo::evaluateAllianceOpportunity(roster, 1, 5, {}, std::nullopt, rng).error ==
          diplo::DiploError::NotFound);
  }

  return failures;
}
