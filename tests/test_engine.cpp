#include "entente/diplo/DiplomacyEngine.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <optional>
#include <string>
#include <vector>

using namespace entente;
using entente::test::near;
using entente::test::traits;

// Roster view whose hidden traits for one faction are out of range.
class CorruptTraitsProvider : public diplo::AttributeProvider {
public:
  CorruptTraitsProvider(const diplo::FactionRoster& roster, diplo::FactionId corrupt)
    : roster_(roster), corrupt_(corrupt) {}

  std::optional<diplo::FactionSnapshot> getFaction(diplo::FactionId id) const override {
    return roster_.getFaction(id);
  }
  std::optional<diplo::TraitVector> getHiddenAttributes(diplo::FactionId id) const override {
    auto t = roster_.getHiddenAttributes(id);
    if (t && id == corrupt_) t->ambition = 14;
    return t;
  }

private:
  const diplo::FactionRoster& roster_;
  diplo::FactionId corrupt_;
};

int test_engine() {
  int failures = 0;

  diplo::FactionRoster roster;
  CHECK(test::addFaction(roster, 1, "Azure Compact", traits(5, 5, 5, 5, 5)));
  CHECK(test::addFaction(roster, 2, "Verdant League", traits(5, 5, 5, 5, 5)));
  CHECK(test::addFaction(roster, 3, "Crimson Throne", traits(5, 2, 9, 8, 0)));
  CHECK(roster.setStatus(1, 3, diplo::DiplomaticStatus::Hostile));

  diplo::MemoryRelationshipStore store;
  diplo::DiplomacyEngine engine(roster, roster, store);

  // ---- Formation / risk ----
  {
    core::SplitMix64 rng(7);
    const auto r = engine.evaluateAlliance(1, 2, {3}, std::nullopt, rng);
    CHECK(r.ok());
    CHECK(near(r.value.assessment.compatibility, 1.0));
    CHECK(r.value.assessment.sharedEnemies == 1);
    CHECK(r.value.compatible);
    CHECK(!r.value.recommendedTypes.empty());

    const auto missing = engine.evaluateAlliance(1, 99, {}, std::nullopt, rng);
    CHECK(!missing.ok() && missing.error == diplo::DiploError::NotFound);

    diplo::ExternalFactors f;
    f.underPressure = true;
    const auto b = engine.evaluateBetrayal(3, f, {1, 2});
    CHECK(b.ok());
    CHECK(near(b.value.baseRisk, 0.34));
    CHECK(near(b.value.probability, 0.49));
    CHECK(b.value.tier == diplo::RiskTier::Medium);
  }

  // ---- Betrayal recording: validation happens before any write ----
  {
    const auto bad = engine.recordBetrayal(3, diplo::BetrayalKind::Military, diplo::BetrayalMotivation::Ambition,
                                           "raid", {1, 99}, 5.0);
    CHECK(!bad.ok() && bad.error == diplo::DiploError::NotFound);
    CHECK(store.interactionCount() == 0);
    CHECK(store.evolutionCount() == 0);

    const auto self = engine.recordBetrayal(3, diplo::BetrayalKind::Military, diplo::BetrayalMotivation::Ambition,
                                            "raid", {3}, 5.0);
    CHECK(!self.ok() && self.error == diplo::DiploError::ValidationError);

    const auto seed1 = engine.ledger().preview(1, 3, 5.0);
    CHECK(seed1.ok());

    const auto r = engine.recordBetrayal(3, diplo::BetrayalKind::Military, diplo::BetrayalMotivation::Ambition,
                                         "fleet turned on its allies", {1, 2, 1}, 5.0);
    CHECK(r.ok());
    CHECK(near(r.value.event.severity, 0.9));
    CHECK(near(r.value.event.trustDamage, 0.68));
    CHECK(r.value.interactions.size() == 2);
    CHECK(store.interactionCount() == 2);
    for (const auto& rec : r.value.interactions) {
      CHECK(rec.record.kind == diplo::InteractionKind::Betrayal);
      CHECK(rec.record.initiator == 3);
      CHECK(near(rec.record.trustImpact, -0.68));
    }
    CHECK(r.value.interactions[0].record.target == 1);
    CHECK(r.value.interactions[1].record.target == 2);
    CHECK(near(r.value.interactions[0].evolution.trustFrom(1), seed1.value.trustFrom(1) - 0.2));
  }

  // A victim with unusable traits fails the whole call before anything is recorded.
  {
    const CorruptTraitsProvider corrupt(roster, 2);
    diplo::MemoryRelationshipStore cleanStore;
    diplo::DiplomacyEngine strict(corrupt, roster, cleanStore);
    const auto r = strict.recordBetrayal(3, diplo::BetrayalKind::Economic, diplo::BetrayalMotivation::Opportunity,
                                         "embargo broken", {1, 2}, 6.0);
    CHECK(!r.ok() && r.error == diplo::DiploError::ValidationError);
    CHECK(cleanStore.interactionCount() == 0);
    CHECK(cleanStore.evolutionCount() == 0);
  }

  // ---- Analysis over what was recorded ----
  {
    const auto s = engine.relationshipSummary(1, 3, 10.0);
    CHECK(s.ok());
    CHECK(s.value.totalInteractions == 1);
    CHECK(s.value.status == diplo::DiplomaticStatus::Hostile);
    CHECK(s.value.nameB == "Crimson Throne");

    const auto rep3 = engine.factionReputation(3, {1, 2}, 10.0);
    const auto rep1 = engine.factionReputation(1, {2, 3}, 10.0);
    CHECK(rep3.ok() && rep1.ok());
    CHECK(rep3.value.overall < rep1.value.overall);
    CHECK(!engine.factionReputation(99, {}, 10.0).ok());

    const auto n = engine.analyzeNetwork({1, 2, 3});
    CHECK(n.ok());
    CHECK(n.value.factions.size() == 3);
    CHECK(n.value.matrix.size() == 3);
    CHECK(n.value.stability >= 0.0 && n.value.stability <= 1.0);
    CHECK(!engine.analyzeNetwork({1, 99}).ok());
  }

  // ---- Trust entry points ----
  {
    const auto init = engine.initializeTrust(1, 2, 11.0);
    CHECK(init.ok());
    CHECK(near(init.value.aTrustsB, 0.6));

    diplo::InteractionInput in;
    in.initiator = 1;
    in.target = 2;
    in.kind = diplo::InteractionKind::TradeAgreement;
    in.trustImpact = 0.1;
    in.timeDays = 12.0;
    const auto rec = engine.recordInteraction(in);
    CHECK(rec.ok());
    CHECK(!rec.value.seeded);
    CHECK(near(rec.value.evolution.trustFrom(2), 0.7));
  }

  // ---- Negotiations through the facade ----
  {
    const auto s = engine.initiateNegotiation(1, {2}, diplo::AllianceType::Military, diplo::TermOverrides{}, 0.0);
    CHECK(s.ok());
    CHECK(engine.activeNegotiations(1.0).size() == 1);
    CHECK(engine.activeNegotiations(1.0, diplo::FactionId(2)).size() == 1);
    CHECK(engine.activeNegotiations(1.0, diplo::FactionId(3)).empty());

    const auto a = engine.advanceNegotiation(s.value.id, 3, diplo::NegotiationAction::AcceptTerms,
                                             diplo::ActionParams{}, 1.0);
    CHECK(!a.ok() && a.error == diplo::DiploError::NotAParticipant);

    const auto st = engine.negotiationStatus(s.value.id, 2.0);
    CHECK(st.ok() && st.value.participants.size() == 2);
    CHECK(!engine.negotiationStatus(999, 2.0).ok());
  }

  // ---- Replaying a logged history ----
  {
    diplo::MemoryRelationshipStore replayStore;
    diplo::DiplomacyEngine replay(roster, roster, replayStore);

    std::vector<diplo::InteractionInput> log(3);
    log[0].initiator = 1; log[0].target = 2; log[0].kind = diplo::InteractionKind::TradeAgreement;
    log[0].trustImpact = 0.3; log[0].timeDays = 9.0;
    log[1].initiator = 2; log[1].target = 1; log[1].kind = diplo::InteractionKind::CulturalExchange;
    log[1].trustImpact = 0.1; log[1].timeDays = 2.0;
    log[2].initiator = 3; log[2].target = 1; log[2].kind = diplo::InteractionKind::BorderIncident;
    log[2].trustImpact = -0.2; log[2].timeDays = 4.0;

    const auto r = replay.replayInteractions(log);
    CHECK(r.ok() && near(r.value, 9.0));
    CHECK(replayStore.interactionCount() == 3);
    const auto first = replayStore.getInteractions(1, 2);
    CHECK(first.size() == 2 && near(first[0].timeDays, 2.0));

    log.push_back(log[0]);
    log.back().target = 99;
    log.back().timeDays = 1.0;
    diplo::MemoryRelationshipStore otherStore;
    diplo::DiplomacyEngine other(roster, roster, otherStore);
    const auto bad = other.replayInteractions(log);
    CHECK(!bad.ok() && bad.error == diplo::DiploError::NotFound);
    CHECK(bad.message.find("record 1") == 0);
    CHECK(otherStore.interactionCount() == 0);
  }

  return failures;
}
