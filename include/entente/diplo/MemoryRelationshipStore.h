#pragma once

#include "entente/diplo/Providers.h"

#include <cstddef>
#include <map>
#include <mutex>

namespace entente::diplo {

// RelationshipStore kept in process memory.
//
// Every read returns a copy taken under the store mutex, so readers never
// observe a half-written record while a writer replaces it.
class MemoryRelationshipStore final : public RelationshipStore {
public:
  void storeInteraction(const InteractionRecord& record) override;
  std::vector<InteractionRecord> getInteractions(FactionId a, FactionId b) const override;

  void storeTrustEvolution(const TrustEvolution& t) override;
  std::optional<TrustEvolution> getTrustEvolution(FactionId a, FactionId b) const override;

  // Every interaction in which `faction` took part, oldest first.
  std::vector<InteractionRecord> interactionsInvolving(FactionId faction) const;

  std::size_t interactionCount() const;
  std::size_t evolutionCount() const;

private:
  mutable std::mutex mutex_;
  std::map<PairKey, std::vector<InteractionRecord>> interactions_;
  std::map<PairKey, TrustEvolution> evolutions_;
};

} // namespace entente::diplo
