#include "entente/diplo/AllianceTerms.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

namespace entente::diplo {

static std::string lowerAscii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) out.push_back((char)std::tolower((unsigned char)c));
  return out;
}

static std::string_view trimView(std::string_view s) {
  std::size_t b = 0;
  while (b < s.size() && std::isspace((unsigned char)s[b])) ++b;
  std::size_t e = s.size();
  while (e > b && std::isspace((unsigned char)s[e - 1])) --e;
  return s.substr(b, e - b);
}

const char* allianceTypeName(AllianceType t) {
  switch (t) {
    case AllianceType::Military: return "military";
    case AllianceType::Economic: return "economic";
    case AllianceType::Diplomatic: return "diplomatic";
    case AllianceType::Defensive: return "defensive";
    case AllianceType::MutualProtection: return "mutual_protection";
    case AllianceType::Expansionist: return "expansionist";
    case AllianceType::Trade: return "trade";
    case AllianceType::Formal: return "formal";
    case AllianceType::Cooperation: return "cooperation";
  }
  return "unknown";
}

bool tryParseAllianceType(std::string_view text, AllianceType& out) {
  const std::string k = lowerAscii(trimView(text));
  for (int i = 0; i < kAllianceTypeCount; ++i) {
    const auto t = static_cast<AllianceType>(i);
    if (k == allianceTypeName(t)) {
      out = t;
      return true;
    }
  }
  return false;
}

const char* termKeyName(TermKey k) {
  switch (k) {
    case TermKey::MutualDefense: return "mutual_defense";
    case TermKey::OffensiveCoordination: return "offensive_coordination";
    case TermKey::SharedIntelligence: return "shared_intelligence";
    case TermKey::JointMilitaryExercises: return "joint_military_exercises";
    case TermKey::TradePreferences: return "trade_preferences";
    case TermKey::SharedInfrastructure: return "shared_infrastructure";
    case TermKey::JointEconomicProjects: return "joint_economic_projects";
    case TermKey::DiplomaticCoordination: return "diplomatic_coordination";
    case TermKey::SharedEmbassies: return "shared_embassies";
    case TermKey::CulturalExchange: return "cultural_exchange";
    case TermKey::JointDiplomaticMissions: return "joint_diplomatic_missions";
    case TermKey::SharedBorders: return "shared_borders";
    case TermKey::TerritorialGuarantees: return "territorial_guarantees";
  }
  return "unknown";
}

bool tryParseTermKey(std::string_view text, TermKey& out) {
  const std::string k = lowerAscii(trimView(text));
  for (int i = 0; i < kTermKeyCount; ++i) {
    const auto key = static_cast<TermKey>(i);
    if (k == termKeyName(key)) {
      out = key;
      return true;
    }
  }
  return false;
}

bool termEnabled(const AllianceTerms& t, TermKey k) {
  switch (k) {
    case TermKey::MutualDefense: return t.military.mutualDefense;
    case TermKey::OffensiveCoordination: return t.military.offensiveCoordination;
    case TermKey::SharedIntelligence: return t.military.sharedIntelligence;
    case TermKey::JointMilitaryExercises: return t.military.jointExercises;
    case TermKey::TradePreferences: return t.economic.tradePreferences;
    case TermKey::SharedInfrastructure: return t.economic.sharedInfrastructure;
    case TermKey::JointEconomicProjects: return t.economic.jointProjects;
    case TermKey::DiplomaticCoordination: return t.diplomatic.coordination;
    case TermKey::SharedEmbassies: return t.diplomatic.sharedEmbassies;
    case TermKey::CulturalExchange: return t.diplomatic.culturalExchange;
    case TermKey::JointDiplomaticMissions: return t.diplomatic.jointMissions;
    case TermKey::SharedBorders: return t.territorial.sharedBorders;
    case TermKey::TerritorialGuarantees: return t.territorial.guarantees;
  }
  return false;
}

void setTerm(AllianceTerms& t, TermKey k, bool enabled) {
  switch (k) {
    case TermKey::MutualDefense: t.military.mutualDefense = enabled; break;
    case TermKey::OffensiveCoordination: t.military.offensiveCoordination = enabled; break;
    case TermKey::SharedIntelligence: t.military.sharedIntelligence = enabled; break;
    case TermKey::JointMilitaryExercises: t.military.jointExercises = enabled; break;
    case TermKey::TradePreferences: t.economic.tradePreferences = enabled; break;
    case TermKey::SharedInfrastructure: t.economic.sharedInfrastructure = enabled; break;
    case TermKey::JointEconomicProjects: t.economic.jointProjects = enabled; break;
    case TermKey::DiplomaticCoordination: t.diplomatic.coordination = enabled; break;
    case TermKey::SharedEmbassies: t.diplomatic.sharedEmbassies = enabled; break;
    case TermKey::CulturalExchange: t.diplomatic.culturalExchange = enabled; break;
    case TermKey::JointDiplomaticMissions: t.diplomatic.jointMissions = enabled; break;
    case TermKey::SharedBorders: t.territorial.sharedBorders = enabled; break;
    case TermKey::TerritorialGuarantees: t.territorial.guarantees = enabled; break;
  }
}

bool TermOverrides::empty() const {
  return !name && !durationMonths && !indefinite && !autoRenew && provisions.empty() &&
         !militarySupportLevel && !economicSupportLevel && resourceSharing.empty() &&
         !accessRegions && !exitClauses && !reviewSchedule && !disputeResolution &&
         !activationTriggers && !suspensionConditions;
}

static bool unitInterval(double v) { return std::isfinite(v) && v >= 0.0 && v <= 1.0; }

bool validateTermOverrides(const TermOverrides& o, std::string* outError) {
  if (o.name && trimView(*o.name).empty()) {
    if (outError) *outError = "alliance name must not be empty";
    return false;
  }
  if (o.durationMonths && *o.durationMonths <= 0) {
    if (outError) *outError = "duration must be a positive number of months";
    return false;
  }
  if (o.durationMonths && o.indefinite && *o.indefinite) {
    if (outError) *outError = "duration and indefinite are mutually exclusive";
    return false;
  }
  if (o.militarySupportLevel && !unitInterval(*o.militarySupportLevel)) {
    if (outError) *outError = "military support level must be within [0, 1]";
    return false;
  }
  if (o.economicSupportLevel && !unitInterval(*o.economicSupportLevel)) {
    if (outError) *outError = "economic support level must be within [0, 1]";
    return false;
  }
  for (const auto& kv : o.resourceSharing) {
    if (kv.first.empty()) {
      if (outError) *outError = "resource share needs a resource name";
      return false;
    }
    if (!unitInterval(kv.second)) {
      if (outError) *outError = "resource share for '" + kv.first + "' must be within [0, 1]";
      return false;
    }
  }
  if (o.disputeResolution && trimView(*o.disputeResolution).empty()) {
    if (outError) *outError = "dispute resolution must not be empty";
    return false;
  }
  return true;
}

bool applyTermOverrides(const AllianceTerms& base, const TermOverrides& o,
                        AllianceTerms& out, std::string* outError) {
  if (!validateTermOverrides(o, outError)) return false;

  AllianceTerms t = base;
  if (o.name) t.name = *o.name;
  if (o.indefinite && *o.indefinite) t.durationMonths.reset();
  if (o.durationMonths) t.durationMonths = *o.durationMonths;
  if (o.autoRenew) t.autoRenew = *o.autoRenew;

  for (const auto& kv : o.provisions) setTerm(t, kv.first, kv.second);
  if (o.militarySupportLevel) t.military.supportLevel = *o.militarySupportLevel;
  if (o.economicSupportLevel) t.economic.supportLevel = *o.economicSupportLevel;
  for (const auto& kv : o.resourceSharing) t.economic.resourceSharing[kv.first] = kv.second;

  if (o.accessRegions) t.territorial.accessRegions = *o.accessRegions;
  if (o.exitClauses) t.exitClauses = *o.exitClauses;
  if (o.reviewSchedule) t.reviewSchedule = *o.reviewSchedule;
  if (o.disputeResolution) t.disputeResolution = *o.disputeResolution;
  if (o.activationTriggers) t.activationTriggers = *o.activationTriggers;
  if (o.suspensionConditions) t.suspensionConditions = *o.suspensionConditions;

  out = std::move(t);
  return true;
}

static std::string titleCase(std::string_view snake) {
  std::string out;
  bool upper = true;
  for (const char c : snake) {
    if (c == '_') {
      out.push_back(' ');
      upper = true;
      continue;
    }
    out.push_back(upper ? (char)std::toupper((unsigned char)c) : c);
    upper = false;
  }
  return out;
}

AllianceTerms defaultAllianceTerms(AllianceType type) {
  AllianceTerms t;
  t.type = type;
  t.name = titleCase(allianceTypeName(type)) + " Alliance";

  switch (type) {
    case AllianceType::Military:
      t.military.mutualDefense = true;
      t.military.supportLevel = 0.5;
      t.military.sharedIntelligence = true;
      break;
    case AllianceType::Economic:
      t.economic.tradePreferences = true;
      t.economic.supportLevel = 0.6;
      t.economic.sharedInfrastructure = true;
      break;
    case AllianceType::Diplomatic:
      t.diplomatic.coordination = true;
      t.diplomatic.culturalExchange = true;
      t.diplomatic.sharedEmbassies = true;
      break;
    case AllianceType::Defensive:
    case AllianceType::MutualProtection:
    case AllianceType::Expansionist:
    case AllianceType::Trade:
    case AllianceType::Formal:
    case AllianceType::Cooperation:
      break;
  }
  return t;
}

static bool parseBoolText(std::string_view s, bool& out) {
  const std::string k = lowerAscii(trimView(s));
  if (k == "1" || k == "true" || k == "on" || k == "yes") { out = true; return true; }
  if (k == "0" || k == "false" || k == "off" || k == "no") { out = false; return true; }
  return false;
}

static bool parseNumber(std::string_view s, double& out) {
  const std::string tmp(trimView(s));
  if (tmp.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

static std::vector<std::string> splitList(std::string_view s) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= s.size()) {
    const std::size_t bar = s.find('|', start);
    const std::string_view part = trimView(s.substr(start, (bar == std::string_view::npos) ? s.size() - start : bar - start));
    if (!part.empty()) out.emplace_back(part);
    if (bar == std::string_view::npos) break;
    start = bar + 1;
  }
  return out;
}

bool parseTermAssignment(std::string_view assignment, TermOverrides& io, std::string* outError) {
  const std::size_t eq = assignment.find('=');
  if (eq == std::string_view::npos) {
    if (outError) *outError = "expected key=value, got '" + std::string(assignment) + "'";
    return false;
  }
  const std::string key = lowerAscii(trimView(assignment.substr(0, eq)));
  const std::string_view val = trimView(assignment.substr(eq + 1));

  auto bad = [&](const char* what) {
    if (outError) *outError = std::string("invalid ") + what + " for '" + key + "': '" + std::string(val) + "'";
    return false;
  };

  if (key == "name") {
    io.name = std::string(val);
    return true;
  }
  if (key == "duration") {
    if (lowerAscii(val) == "indefinite") {
      io.indefinite = true;
      io.durationMonths.reset();
      return true;
    }
    double months = 0.0;
    if (!parseNumber(val, months) || months != std::floor(months)) return bad("month count");
    io.durationMonths = static_cast<int>(months);
    return true;
  }
  if (key == "auto_renew") {
    bool b = false;
    if (!parseBoolText(val, b)) return bad("bool");
    io.autoRenew = b;
    return true;
  }
  if (key == "military_support" || key == "economic_support") {
    double v = 0.0;
    if (!parseNumber(val, v)) return bad("number");
    if (key == "military_support") io.militarySupportLevel = v;
    else io.economicSupportLevel = v;
    return true;
  }
  if (key.rfind("share.", 0) == 0) {
    double v = 0.0;
    if (!parseNumber(val, v)) return bad("number");
    io.resourceSharing[key.substr(6)] = v;
    return true;
  }
  if (key == "review") {
    io.reviewSchedule = std::string(val);
    return true;
  }
  if (key == "dispute") {
    io.disputeResolution = std::string(val);
    return true;
  }
  if (key == "exit") { io.exitClauses = splitList(val); return true; }
  if (key == "triggers") { io.activationTriggers = splitList(val); return true; }
  if (key == "suspend") { io.suspensionConditions = splitList(val); return true; }
  if (key == "access") { io.accessRegions = splitList(val); return true; }

  TermKey tk;
  if (tryParseTermKey(key, tk)) {
    bool b = false;
    if (!parseBoolText(val, b)) return bad("bool");
    io.provisions[tk] = b;
    return true;
  }

  if (outError) *outError = "unknown term '" + key + "'";
  return false;
}

} // namespace entente::diplo
