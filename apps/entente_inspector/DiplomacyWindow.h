#pragma once

#include "LogWindow.h"

#include "entente/core/CVar.h"
#include "entente/core/Random.h"
#include "entente/diplo/DiplomacyEngine.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace entente::inspector {

// Everything the inspector looks at. The engine borrows roster and store, so
// it is rebuilt in place (rebuildEngine) rather than copied.
struct InspectorWorld {
  diplo::FactionRoster roster;
  diplo::MemoryRelationshipStore store;
  std::unique_ptr<diplo::DiplomacyEngine> engine;

  double nowDays{0.0};
  core::u64 seed{1337};
  core::SplitMix64 rng{1337};
};

// Re-reads the diplo.* cvars into a fresh engine. Open negotiations live in
// the engine and are discarded; recorded trust stays in the store.
void rebuildEngine(InspectorWorld& world, const core::CVarRegistry& registry);

struct DiplomacyWindowState {
  bool open{true};

  diplo::FactionId a{0};
  diplo::FactionId b{0};

  // Alliance / betrayal inputs
  std::vector<diplo::FactionId> threats;
  int requestedType{-1}; // -1 = let the engine recommend
  diplo::ExternalFactors factors;
  int betrayalKind{0};
  int betrayalMotivation{0};
  char betrayalDesc[160]{"Alliance betrayed"};

  // Interaction entry
  int interactionKind{0};
  double interactionImpact{0.1};
  char interactionDesc[160]{};

  // Negotiation
  std::vector<diplo::FactionId> negotiationTargets;
  int negotiationType{0};
  diplo::SessionId selectedSession{0};
  diplo::FactionId actor{0};
  char actionNote[160]{};
  char termLine[256]{};

  // Cached results (refreshed on demand)
  std::optional<diplo::Result<diplo::AllianceOpportunity>> opportunity;
  std::optional<diplo::Result<diplo::BetrayalAssessment>> betrayal;
  std::optional<diplo::Result<diplo::NetworkAnalysis>> network;
};

void drawDiplomacyWindow(DiplomacyWindowState& st, InspectorWorld& world, const core::CVarRegistry& registry,
                         const ToastFn& toast);

} // namespace entente::inspector
