#pragma once

#include "entente/diplo/Relationship.h"
#include "entente/diplo/Traits.h"

#include <optional>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Consumed capabilities
// -----------------------------------------------------------------------------
//
// The engine depends only on these interfaces. Persistence and transport live
// behind them; FactionRoster and MemoryRelationshipStore are the in-memory
// implementations used by the tool and the tests.
//
// Implementations must be safe to call from several threads at once.

class AttributeProvider {
public:
  virtual ~AttributeProvider() = default;

  // std::nullopt when the faction is unknown.
  virtual std::optional<FactionSnapshot> getFaction(FactionId id) const = 0;
  virtual std::optional<TraitVector> getHiddenAttributes(FactionId id) const = 0;
};

class DiplomacyStatusProvider {
public:
  virtual ~DiplomacyStatusProvider() = default;

  // Symmetric. Used for reporting only, never for scoring.
  virtual DiplomaticStatus getStatus(FactionId a, FactionId b) const = 0;
};

class RelationshipStore {
public:
  virtual ~RelationshipStore() = default;

  virtual void storeInteraction(const InteractionRecord& record) = 0;

  // Oldest first. Order of (a, b) does not matter.
  virtual std::vector<InteractionRecord> getInteractions(FactionId a, FactionId b) const = 0;

  // Replaces the stored evolution for t.key.
  virtual void storeTrustEvolution(const TrustEvolution& t) = 0;
  virtual std::optional<TrustEvolution> getTrustEvolution(FactionId a, FactionId b) const = 0;
};

} // namespace entente::diplo
