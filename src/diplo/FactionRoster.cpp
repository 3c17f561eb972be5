#include "entente/diplo/FactionRoster.h"

#include "entente/core/Log.h"
#include "entente/diplo/DiplomacyText.h"

#include <cctype>
#include <fstream>
#include <istream>

namespace entente::diplo {

bool FactionRoster::addFaction(const FactionSnapshot& faction, std::string* outError) {
  std::string err;
  if (!validateTraits(faction.traits, &err)) {
    if (outError) *outError = "faction " + std::to_string(faction.id) + ": " + err;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (factions_.count(faction.id)) {
    if (outError) *outError = "duplicate faction id " + std::to_string(faction.id);
    return false;
  }
  factions_[faction.id] = faction;
  return true;
}

bool FactionRoster::setStatus(FactionId a, FactionId b, DiplomaticStatus status, std::string* outError) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (a == b) {
    if (outError) *outError = "status needs two different factions";
    return false;
  }
  if (!factions_.count(a) || !factions_.count(b)) {
    if (outError) *outError = "status for unknown faction " + std::to_string(factions_.count(a) ? b : a);
    return false;
  }
  statuses_[makePairKey(a, b)] = status;
  return true;
}

std::optional<FactionSnapshot> FactionRoster::getFaction(FactionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = factions_.find(id);
  if (it == factions_.end()) return std::nullopt;
  return it->second;
}

std::optional<TraitVector> FactionRoster::getHiddenAttributes(FactionId id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = factions_.find(id);
  if (it == factions_.end()) return std::nullopt;
  return it->second.traits;
}

DiplomaticStatus FactionRoster::getStatus(FactionId a, FactionId b) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = statuses_.find(makePairKey(a, b));
  return (it != statuses_.end()) ? it->second : DiplomaticStatus::Neutral;
}

std::vector<FactionId> FactionRoster::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<FactionId> out;
  out.reserve(factions_.size());
  for (const auto& kv : factions_) out.push_back(kv.first);
  return out;
}

std::size_t FactionRoster::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return factions_.size();
}

static bool parseFactionLine(const std::vector<std::string>& tok, FactionSnapshot& out, std::string& err) {
  if (tok.size() < 3) {
    err = "expected: faction <id> <name> [trait=value...]";
    return false;
  }
  FactionSnapshot f;
  if (!parseFactionId(tok[1], f.id)) {
    err = "bad faction id '" + tok[1] + "'";
    return false;
  }
  f.name = tok[2];

  for (std::size_t i = 3; i < tok.size(); ++i) {
    const auto eq = tok[i].find('=');
    if (eq == std::string::npos) {
      err = "expected trait=value, got '" + tok[i] + "'";
      return false;
    }
    Trait t{};
    if (!tryParseTrait(std::string_view(tok[i]).substr(0, eq), t)) {
      err = "unknown trait '" + tok[i].substr(0, eq) + "'";
      return false;
    }
    double v = 0.0;
    if (!parseNumber(std::string_view(tok[i]).substr(eq + 1), v) || v != static_cast<double>(static_cast<int>(v))) {
      err = "trait value must be an integer: '" + tok[i] + "'";
      return false;
    }
    f.traits.set(t, static_cast<int>(v));
  }

  out = std::move(f);
  return true;
}

bool FactionRoster::load(std::istream& in, std::string* outError) {
  int lineNo = 0;
  if (!readTextHeader(in, kRosterMagic, lineNo, outError)) return false;

  // Parse into a scratch roster first so a bad line changes nothing.
  FactionRoster scratch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    scratch.factions_ = factions_;
    scratch.statuses_ = statuses_;
  }

  auto failAt = [&](const std::string& msg) {
    if (outError) *outError = "line " + std::to_string(lineNo) + ": " + msg;
    return false;
  };

  std::string line;
  std::vector<std::string> tok;
  std::string err;
  while (std::getline(in, line)) {
    ++lineNo;
    const auto first = line.find_first_not_of(" \t\r");
    if (first == std::string::npos || line[first] == '#') continue;
    if (!tokenizeLine(line, tok, &err)) return failAt(err);
    if (tok.empty()) continue;

    std::string kind = tok[0];
    for (char& c : kind) c = (char)std::tolower((unsigned char)c);

    if (kind == "faction") {
      FactionSnapshot f;
      if (!parseFactionLine(tok, f, err)) return failAt(err);
      if (!scratch.addFaction(f, &err)) return failAt(err);
    } else if (kind == "status") {
      if (tok.size() != 4) return failAt("expected: status <id> <id> <status>");
      FactionId a = 0, b = 0;
      if (!parseFactionId(tok[1], a) || !parseFactionId(tok[2], b)) return failAt("bad faction id");
      DiplomaticStatus s{};
      if (!tryParseDiplomaticStatus(tok[3], s)) return failAt("unknown status '" + tok[3] + "'");
      if (!scratch.setStatus(a, b, s, &err)) return failAt(err);
    } else {
      return failAt("unknown record '" + tok[0] + "'");
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  factions_ = std::move(scratch.factions_);
  statuses_ = std::move(scratch.statuses_);
  return true;
}

bool FactionRoster::loadFile(const std::string& path, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    ENTENTE_LOG_DEBUG("roster: file not found: " + path);
    if (outError) *outError = "cannot open " + path;
    return false;
  }
  std::string err;
  if (!load(f, &err)) {
    ENTENTE_LOG_WARN("roster: " + path + ": " + err);
    if (outError) *outError = path + ": " + err;
    return false;
  }
  ENTENTE_LOG_INFO("roster: loaded " + std::to_string(size()) + " factions from " + path);
  return true;
}

} // namespace entente::diplo
