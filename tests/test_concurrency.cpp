#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/RelationshipAnalyzer.h"
#include "entente/diplo/TrustLedger.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <algorithm>
#include <atomic>
#include <set>
#include <thread>
#include <vector>

using namespace entente;
using entente::test::traits;

int test_concurrency() {
  int failures = 0;

  constexpr int kThreads = 4;
  constexpr int kPerThread = 50;

  diplo::FactionRoster roster;
  CHECK(test::addFaction(roster, 1, "Azure Compact", traits(2, 5, 5, 0, 0)));
  CHECK(test::addFaction(roster, 2, "Verdant League", traits(2, 5, 5, 0, 0)));
  CHECK(test::addFaction(roster, 3, "Crimson Throne", traits(5, 5, 5, 5, 5)));

  // ---- Trust writers on one pair and on a second pair ----
  {
    diplo::MemoryRelationshipStore store;
    diplo::TrustLedger ledger(roster, store);
    std::atomic<int> okCount{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&, t]() {
        for (int i = 0; i < kPerThread; ++i) {
          diplo::InteractionInput in;
          in.initiator = (t % 2 == 0) ? 1 : 2;
          in.target = (t % 2 == 0) ? 2 : 1;
          if (t == 3) in.target = 3;
          in.kind = diplo::InteractionKind::CulturalExchange;
          in.trustImpact = 0.001;
          in.timeDays = static_cast<double>(i);
          if (ledger.recordInteraction(in).ok()) ++okCount;
        }
      });
    }
    for (auto& th : threads) th.join();

    CHECK(okCount.load() == kThreads * kPerThread);
    CHECK(store.interactionCount() == static_cast<std::size_t>(kThreads * kPerThread));
    CHECK(store.evolutionCount() == 2);

    // Every applied update left a sample: seed + one per interaction.
    const auto t12 = store.getTrustEvolution(1, 2);
    CHECK(t12 && t12->history.size() == static_cast<std::size_t>(3 * kPerThread + 1));
    CHECK(store.getInteractions(1, 2).size() == static_cast<std::size_t>(3 * kPerThread));

    // Interaction ids are unique across threads.
    std::set<core::u64> ids;
    for (const auto& r : store.interactionsInvolving(1)) ids.insert(r.id);
    for (const auto& r : store.getInteractions(2, 3)) ids.insert(r.id);
    CHECK(ids.size() == static_cast<std::size_t>(kThreads * kPerThread));
  }

  // ---- Readers see a pair's evolution and interactions from the same moment ----
  {
    diplo::MemoryRelationshipStore store;
    diplo::TrustLedger ledger(roster, store);
    diplo::RelationshipAnalyzer analyzer(roster, roster, ledger);
    std::atomic<bool> done{false};
    std::atomic<int> torn{0};
    std::atomic<int> badSummaries{0};

    std::thread writer([&]() {
      for (int i = 0; i < kThreads * kPerThread; ++i) {
        diplo::InteractionInput in;
        in.initiator = (i % 2 == 0) ? 1 : 2;
        in.target = (i % 2 == 0) ? 2 : 1;
        in.kind = diplo::InteractionKind::TradeAgreement;
        in.trustImpact = 0.002;
        in.timeDays = static_cast<double>(i);
        (void)ledger.recordInteraction(in);
      }
      done = true;
    });

    std::vector<std::thread> readers;
    for (int t = 0; t < 2; ++t) {
      readers.emplace_back([&]() {
        while (!done.load()) {
          const diplo::PairHistory h = ledger.history(1, 2);
          const std::size_t samples = h.evolution ? h.evolution->history.size() : 1u;
          if (samples != h.interactions.size() + 1) ++torn;

          const auto sum = analyzer.summarize(1, 2, 1000.0);
          if (!sum.ok() || sum.value.totalInteractions > kThreads * kPerThread) ++badSummaries;
        }
      });
    }
    writer.join();
    for (auto& th : readers) th.join();

    CHECK(torn.load() == 0);
    CHECK(badSummaries.load() == 0);
    const diplo::PairHistory last = ledger.history(2, 1);
    CHECK(last.evolution && last.evolution->history.size() == last.interactions.size() + 1);
    CHECK(last.interactions.size() == static_cast<std::size_t>(kThreads * kPerThread));
  }

  // ---- Writers on one negotiation session ----
  {
    diplo::NegotiationParams params;
    params.maxRounds = 1000;
    diplo::NegotiationEngine negotiations(roster, params);

    const auto s = negotiations.initiate(1, {2}, diplo::AllianceType::Economic, diplo::TermOverrides{}, 0.0);
    CHECK(s.ok());
    const diplo::SessionId id = s.value.id;

    std::atomic<int> okCount{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
      threads.emplace_back([&, t]() {
        const diplo::FactionId actor = (t % 2 == 0) ? 1 : 2;
        for (int i = 0; i < kPerThread; ++i) {
          const auto r = negotiations.advance(id, actor, diplo::NegotiationAction::ProposeTerms,
                                              diplo::ActionParams{}, 1.0);
          if (r.ok()) ++okCount;
          // Readers run alongside the writers.
          (void)negotiations.status(id, 1.0);
        }
      });
    }
    for (auto& th : threads) th.join();

    CHECK(okCount.load() == kThreads * kPerThread);
    const auto st = negotiations.status(id, 1.0);
    CHECK(st.ok());
    CHECK(st.value.roundsCompleted == kThreads * kPerThread);
    CHECK(st.value.terms.version == static_cast<core::u32>(kThreads * kPerThread + 1));
    CHECK(st.value.phase == diplo::NegotiationPhase::TermsDiscussion);

    const auto actions = std::count_if(st.value.events.begin(), st.value.events.end(),
                                       [](const diplo::NegotiationEvent& e) {
                                         return e.kind == diplo::NegotiationEventKind::Action;
                                       });
    CHECK(actions == kThreads * kPerThread);
  }

  return failures;
}
