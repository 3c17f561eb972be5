#include "entente/diplo/Compatibility.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <vector>

using namespace entente;
using entente::test::near;
using entente::test::traits;

int test_compatibility() {
  int failures = 0;

  // ---- Pure trait scoring ----
  {
    const diplo::TraitVector a = traits(7, 9, 5, 3, 0);
    const diplo::TraitVector b = traits(6, 7, 4, 4, 0);

    // 0.8*0.35 + 0.9*0.25 + 1.0*0.25 + 0.9*0.15
    const double c = diplo::traitCompatibility(a, b);
    CHECK(near(c, 0.89));
    CHECK(near(c, diplo::traitCompatibility(b, a)));

    CHECK(near(diplo::traitCompatibility(a, a), 1.0));

    // Opposites keep only the ambition complementarity score.
    const double opp = diplo::traitCompatibility(traits(0, 0, 0, 0, 0), traits(10, 10, 10, 10, 10));
    CHECK(near(opp, 0.8 * 0.15));
  }

  // Ambition gap above 0.3 scores 0.8 rather than 1 - diff.
  {
    const double close = diplo::traitCompatibility(traits(5, 5, 5, 0, 5), traits(5, 5, 6, 0, 5));
    const double far = diplo::traitCompatibility(traits(5, 5, 2, 0, 5), traits(5, 5, 9, 0, 5));
    CHECK(near(close, 0.85 + 0.9 * 0.15));
    CHECK(near(far, 0.85 + 0.8 * 0.15));
  }

  // ---- Threat ----
  {
    core::SplitMix64 rng(42);
    for (int i = 0; i < 200; ++i) {
      const double t = diplo::estimateThreatLevel(1, rng);
      CHECK(t >= 0.2 && t < 0.5);
    }
    for (int i = 0; i < 50; ++i) {
      CHECK(near(diplo::estimateThreatLevel(6, rng), 1.0));
    }

    core::SplitMix64 r1(7), r2(7);
    CHECK(diplo::estimateThreatLevel(2, r1) == diplo::estimateThreatLevel(2, r2));
  }

  CHECK(diplo::countSharedEnemies(1, 2, {3, 3, 4, 1, 2}) == 2);
  CHECK(diplo::countSharedEnemies(1, 2, {}) == 0);

  // ---- Provider-backed ----
  {
    diplo::FactionRoster roster;
    CHECK(test::addFaction(roster, 1, "Azure Compact", traits(7, 9, 5, 3, 0)));
    CHECK(test::addFaction(roster, 2, "Verdant League", traits(6, 7, 4, 4, 0)));

    core::SplitMix64 rng(1337);
    const auto ok = diplo::assessCompatibility(roster, 1, 2, {9}, rng);
    CHECK(ok.ok());
    CHECK(ok.value.compatibility > 0.6);
    CHECK(ok.value.sharedEnemies == 1);
    CHECK(ok.value.threatLevel >= 0.2 && ok.value.threatLevel < 0.5);

    const auto missing = diplo::assessCompatibility(roster, 1, 77, {}, rng);
    CHECK(missing.error == diplo::DiploError::NotFound);

    const auto self = diplo::assessCompatibility(roster, 1, 1, {}, rng);
    CHECK(self.error == diplo::DiploError::ValidationError);
  }

  return failures;
}
