#include "entente/diplo/MemoryRelationshipStore.h"

#include <algorithm>

namespace entente::diplo {

void MemoryRelationshipStore::storeInteraction(const InteractionRecord& record) {
  std::lock_guard<std::mutex> lock(mutex_);
  interactions_[makePairKey(record.initiator, record.target)].push_back(record);
}

std::vector<InteractionRecord> MemoryRelationshipStore::getInteractions(FactionId a, FactionId b) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = interactions_.find(makePairKey(a, b));
  if (it == interactions_.end()) return {};
  return it->second;
}

void MemoryRelationshipStore::storeTrustEvolution(const TrustEvolution& t) {
  std::lock_guard<std::mutex> lock(mutex_);
  evolutions_[t.key] = t;
}

std::optional<TrustEvolution> MemoryRelationshipStore::getTrustEvolution(FactionId a, FactionId b) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = evolutions_.find(makePairKey(a, b));
  if (it == evolutions_.end()) return std::nullopt;
  return it->second;
}

std::vector<InteractionRecord> MemoryRelationshipStore::interactionsInvolving(FactionId faction) const {
  std::vector<InteractionRecord> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& kv : interactions_) {
      if (kv.first.low != faction && kv.first.high != faction) continue;
      out.insert(out.end(), kv.second.begin(), kv.second.end());
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const InteractionRecord& x, const InteractionRecord& y) {
    return x.timeDays < y.timeDays;
  });
  return out;
}

std::size_t MemoryRelationshipStore::interactionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t n = 0;
  for (const auto& kv : interactions_) n += kv.second.size();
  return n;
}

std::size_t MemoryRelationshipStore::evolutionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return evolutions_.size();
}

} // namespace entente::diplo
