#pragma once

#include "entente/core/Types.h"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Alliance terms
// -----------------------------------------------------------------------------
//
// A fixed, domain-grouped term bundle. Values are immutable per negotiation
// round: an update produces a new AllianceTerms with version + 1.

enum class AllianceType : core::u8 {
  Military         = 0,
  Economic         = 1,
  Diplomatic       = 2,
  Defensive        = 3,
  MutualProtection = 4,
  Expansionist     = 5,
  Trade            = 6,
  Formal           = 7,
  Cooperation      = 8,
};

inline constexpr int kAllianceTypeCount = 9;

const char* allianceTypeName(AllianceType t);
bool tryParseAllianceType(std::string_view text, AllianceType& out);

// Boolean provisions, addressable by key (priority terms, deal-breakers,
// override assignments).
enum class TermKey : core::u8 {
  MutualDefense          = 0,
  OffensiveCoordination  = 1,
  SharedIntelligence     = 2,
  JointMilitaryExercises = 3,
  TradePreferences       = 4,
  SharedInfrastructure   = 5,
  JointEconomicProjects  = 6,
  DiplomaticCoordination = 7,
  SharedEmbassies        = 8,
  CulturalExchange       = 9,
  JointDiplomaticMissions = 10,
  SharedBorders          = 11,
  TerritorialGuarantees  = 12,
};

inline constexpr int kTermKeyCount = 13;

const char* termKeyName(TermKey k);
bool tryParseTermKey(std::string_view text, TermKey& out);

struct MilitaryTerms {
  bool mutualDefense{false};
  bool offensiveCoordination{false};
  double supportLevel{0.0}; // [0,1]
  bool sharedIntelligence{false};
  bool jointExercises{false};
};

struct EconomicTerms {
  bool tradePreferences{false};
  std::map<std::string, double> resourceSharing; // resource -> share [0,1]
  double supportLevel{0.0};                      // [0,1]
  bool sharedInfrastructure{false};
  bool jointProjects{false};
};

struct DiplomaticTerms {
  bool coordination{false};
  bool sharedEmbassies{false};
  bool culturalExchange{false};
  bool jointMissions{false};
};

struct TerritorialTerms {
  std::vector<std::string> accessRegions;
  bool sharedBorders{false};
  bool guarantees{false};
};

struct AllianceTerms {
  std::string name;
  AllianceType type{AllianceType::Cooperation};
  std::optional<int> durationMonths; // nullopt = indefinite
  bool autoRenew{false};

  MilitaryTerms military;
  EconomicTerms economic;
  DiplomaticTerms diplomatic;
  TerritorialTerms territorial;

  std::vector<std::string> exitClauses;
  std::optional<std::string> reviewSchedule;
  std::string disputeResolution{"negotiation"};

  std::vector<std::string> activationTriggers;
  std::vector<std::string> suspensionConditions;

  core::u32 version{1};
};

bool termEnabled(const AllianceTerms& t, TermKey k);
void setTerm(AllianceTerms& t, TermKey k, bool enabled);

// Partial update. Unset fields leave the base untouched.
struct TermOverrides {
  std::optional<std::string> name;
  std::optional<int> durationMonths;
  std::optional<bool> indefinite; // true clears durationMonths
  std::optional<bool> autoRenew;

  std::map<TermKey, bool> provisions;
  std::optional<double> militarySupportLevel;
  std::optional<double> economicSupportLevel;
  std::map<std::string, double> resourceSharing;

  std::optional<std::vector<std::string>> accessRegions;
  std::optional<std::vector<std::string>> exitClauses;
  std::optional<std::string> reviewSchedule;
  std::optional<std::string> disputeResolution;
  std::optional<std::vector<std::string>> activationTriggers;
  std::optional<std::vector<std::string>> suspensionConditions;

  bool empty() const;
};

// Checks levels/shares within [0,1], duration > 0, non-empty name.
bool validateTermOverrides(const TermOverrides& o, std::string* outError = nullptr);

// Returns false (and leaves `out` untouched) when `o` is invalid. Does not
// touch the version; the negotiation bumps it.
bool applyTermOverrides(const AllianceTerms& base, const TermOverrides& o,
                        AllianceTerms& out, std::string* outError = nullptr);

// Type-specific starting terms:
//  military   => mutual defense, support 0.5, shared intelligence
//  economic   => trade preferences, support 0.6, shared infrastructure
//  diplomatic => coordination, cultural exchange, shared embassies
// Other types carry the base terms only.
AllianceTerms defaultAllianceTerms(AllianceType type);

// Parses one "key=value" assignment into `io`:
//   name=..., duration=<months>|indefinite, auto_renew=<bool>,
//   military_support=<0..1>, economic_support=<0..1>, share.<resource>=<0..1>,
//   review=..., dispute=..., and '|'-separated lists exit=, triggers=,
//   suspend=, access=; <term_key>=<bool> for provisions
bool parseTermAssignment(std::string_view assignment, TermOverrides& io, std::string* outError = nullptr);

} // namespace entente::diplo
