#pragma once

#include "entente/diplo/Providers.h"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace entente::diplo {

inline constexpr const char* kRosterMagic = "EntenteRoster";

// In-memory faction roster: attribute and status provider for the tool and
// the tests.
//
// Text format (header "EntenteRoster 1", '#' comments):
//   faction <id> <name|"quoted name"> [<trait>=<0..10>...]
//   status <id> <id> <allied|friendly|neutral|hostile|at_war>
// Traits not listed are 0. Unlisted pairs are neutral.
class FactionRoster final : public AttributeProvider, public DiplomacyStatusProvider {
public:
  // Fails on a duplicate id or traits outside 0..10.
  bool addFaction(const FactionSnapshot& faction, std::string* outError = nullptr);

  // Fails when either id is unknown or a == b.
  bool setStatus(FactionId a, FactionId b, DiplomaticStatus status, std::string* outError = nullptr);

  std::optional<FactionSnapshot> getFaction(FactionId id) const override;
  std::optional<TraitVector> getHiddenAttributes(FactionId id) const override;
  DiplomaticStatus getStatus(FactionId a, FactionId b) const override;

  // Ascending.
  std::vector<FactionId> ids() const;
  std::size_t size() const;

  // Replaces nothing on failure.
  bool load(std::istream& in, std::string* outError = nullptr);
  bool loadFile(const std::string& path, std::string* outError = nullptr);

private:
  mutable std::mutex mutex_;
  std::map<FactionId, FactionSnapshot> factions_;
  std::map<PairKey, DiplomaticStatus> statuses_;
};

} // namespace entente::diplo
