#include "entente/core/Args.h"
#include "entente/core/CVar.h"
#include "entente/core/JsonWriter.h"
#include "entente/core/Log.h"
#include "entente/diplo/DiplomacyConfig.h"
#include "entente/diplo/DiplomacyEngine.h"
#include "entente/diplo/DiplomacyJson.h"
#include "entente/diplo/DiplomacyText.h"
#include "entente/diplo/FactionRoster.h"
#include "entente/diplo/MemoryRelationshipStore.h"
#include "entente/diplo/Signature.h"

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace entente;
using diplo::FactionId;

static void printHelp() {
  std::cout << "entente_cli\n"
            << "  --roster <path>            Faction roster (EntenteRoster 1)\n"
            << "  --interactions <path>      Interaction log replayed into the trust ledger\n"
            << "  --config <path>            Config file with 'name = value' cvar lines\n"
            << "  --set <name=value>         Override one cvar (repeatable)\n"
            << "  --cvars                    Print every cvar and exit\n"
            << "  --seed <u64>               Seed for threat estimation (default: 1337)\n"
            << "  --day <days>               Current simulation day (default: last logged day)\n"
            << "  --json                     Emit machine-readable JSON\n"
            << "  --out <path>               Write output to a file ('-' means stdout)\n"
            << "  --sig                      Include stable signatures of sessions / trust pairs\n"
            << "\n"
            << "Commands:\n"
            << "  --evaluate <a> <b>         Alliance opportunity [--threats ids...] [--type t]\n"
            << "  --betrayal <a>             Betrayal risk [--members ids...] [--pressure]\n"
            << "                             [--defeats n] [--shortage] [--opportunity]\n"
            << "  --betray <a>               Record a betrayal --victims ids... [--kind k]\n"
            << "                             [--motivation m] [--desc text]\n"
            << "  --negotiate <a> <b>...     Start a negotiation [--type t] [--terms k=v...]\n"
            << "                             [--script path] (EntenteScript 1)\n"
            << "  --summary <a> <b>          Relationship summary\n"
            << "  --reputation <a>           Faction reputation over the whole roster\n"
            << "  --network [ids...]         Network analysis (default: whole roster)\n";
}

static int reportError(std::ostream& out, bool json, diplo::DiploError e, const std::string& message) {
  if (json) {
    core::JsonWriter j(out, true);
    diplo::writeJsonError(j, e, message);
    j.finish();
  } else {
    std::cerr << "error: " << diplo::diploErrorName(e) << ": " << message << "\n";
  }
  return (diplo::diploErrorClass(e) == diplo::DiploErrorClass::NotFound) ? 3 : 1;
}

static bool parseIds(const std::vector<std::string>& tokens, std::vector<FactionId>& out, std::string& err) {
  out.clear();
  for (const auto& t : tokens) {
    FactionId id = 0;
    if (!diplo::parseFactionId(t, id)) {
      err = "bad faction id '" + t + "'";
      return false;
    }
    out.push_back(id);
  }
  return true;
}

static std::string fmt(double v, int precision = 3) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(precision) << v;
  return ss.str();
}

static std::string joinIds(const std::vector<FactionId>& ids) {
  std::string s;
  for (const FactionId f : ids) {
    if (!s.empty()) s += ", ";
    s += std::to_string(f);
  }
  return s;
}

static void printList(std::ostream& out, const char* title, const std::vector<std::string>& items) {
  if (items.empty()) return;
  out << "  " << title << ":\n";
  for (const auto& s : items) out << "    - " << s << "\n";
}

static void printOpportunity(std::ostream& out, const diplo::AllianceOpportunity& o) {
  out << "Alliance opportunity " << o.assessment.a << " <-> " << o.assessment.b << "\n"
      << "  compatibility  " << fmt(o.assessment.compatibility) << "\n"
      << "  threat level   " << fmt(o.assessment.threatLevel) << " (" << o.assessment.sharedEnemies
      << " shared enemies)\n"
      << "  willingness    " << fmt(o.willingnessA) << " / " << fmt(o.willingnessB) << " (overall "
      << fmt(o.overallWillingness) << ")\n"
      << "  compatible     " << (o.compatible ? "yes" : "no") << "\n"
      << "  duration       " << diplo::allianceDurationLabel(o.duration) << "\n";
  out << "  recommended   ";
  for (const auto t : o.recommendedTypes) out << " " << diplo::allianceTypeName(t);
  out << "\n";
  printList(out, "risks", o.risks);
  printList(out, "benefits", o.benefits);
  out << "  suggested terms: " << o.suggestedTerms.name << "\n";
}

static void printBetrayal(std::ostream& out, const diplo::BetrayalAssessment& b) {
  out << "Betrayal risk for " << b.faction << "\n"
      << "  probability    " << fmt(b.probability) << " (" << diplo::riskTierName(b.tier) << ")\n"
      << "  base risk      " << fmt(b.baseRisk) << "\n"
      << "  external       " << fmt(b.externalModifier) << "\n"
      << "  motivation     " << diplo::betrayalMotivationName(b.motivation) << "\n"
      << "  trust damage   " << fmt(b.expectedTrustDamage) << " per member\n";
}

static void printSession(std::ostream& out, const diplo::NegotiationSession& s, bool sig) {
  out << "Negotiation " << s.id << " (" << diplo::allianceTypeName(s.terms.type) << ")\n"
      << "  phase          " << diplo::negotiationPhaseName(s.phase) << "\n"
      << "  participants   " << joinIds(s.participants) << "\n"
      << "  rounds         " << s.roundsCompleted << "/" << s.maxRounds << "\n"
      << "  deadline day   " << fmt(s.deadlineDays, 1) << "\n"
      << "  success prob.  " << fmt(s.successProbability) << "\n"
      << "  terms version  " << s.terms.version << "\n";
  for (const FactionId f : s.participants) {
    const auto* p = s.position(f);
    if (!p) continue;
    out << "    " << std::setw(6) << f << "  " << std::left << std::setw(12) << diplo::negotiationStanceName(p->stance)
        << std::right << diplo::factionResponseMessage(p->initialResponse) << "\n";
  }
  if (sig) {
    out << "  signature      0x" << std::hex << diplo::signatureNegotiationSession(s) << std::dec << "\n";
  }
}

static void printSummary(std::ostream& out, const diplo::RelationshipSummary& s) {
  out << "Relationship " << s.nameA << " (" << s.a << ") <-> " << s.nameB << " (" << s.b << ")\n"
      << "  trust          " << fmt(s.mutualTrust) << " (" << diplo::trustCategoryName(s.category) << "; "
      << fmt(s.aTrustsB) << " / " << fmt(s.bTrustsA) << ")\n"
      << "  status         " << diplo::diplomaticStatusName(s.status) << "\n"
      << "  trend          " << diplo::relationshipTrendName(s.trend) << " -> "
      << diplo::relationshipTrendName(s.trajectory) << "\n"
      << "  interactions   " << s.totalInteractions << " (+" << s.positiveInteractions << " / -"
      << s.negativeInteractions << ") over " << s.durationDays << " days\n"
      << "  alliance prob. " << fmt(s.allianceProbability) << "\n"
      << "  conflict prob. " << fmt(s.conflictProbability) << "\n"
      << "  stability      " << fmt(s.stability) << "\n";
  if (!s.turningPoints.empty()) {
    out << "  turning points:\n";
    for (const auto& r : s.turningPoints) {
      out << "    day " << fmt(r.timeDays, 1) << "  " << diplo::interactionKindName(r.kind) << "  "
          << fmt(r.trustImpact, 2) << "  " << r.description << "\n";
    }
  }
  if (!s.evolutionStored) out << "  (no recorded trust history; seeded estimate)\n";
}

static void printReputation(std::ostream& out, const diplo::FactionReputation& r) {
  out << "Reputation of " << r.name << " (" << r.faction << ")\n"
      << "  overall        " << fmt(r.overall) << " (" << diplo::reputationStandingName(r.standing) << ")\n"
      << "  trustworthy    " << fmt(r.trustworthiness) << "\n"
      << "  reliability    " << fmt(r.reliability) << "\n"
      << "  recent change  " << fmt(r.recentChange) << " (" << diplo::relationshipTrendName(r.direction) << ")\n"
      << "  allies         " << joinIds(r.notableAlliances) << "\n"
      << "  rivals         " << joinIds(r.notableConflicts) << "\n";
}

static void printNetwork(std::ostream& out, const diplo::NetworkAnalysis& n) {
  out << "Network of " << n.factions.size() << " factions, " << n.matrix.size() << " pairs\n"
      << "  stability      " << fmt(n.stability) << "\n"
      << "  conflict risk  " << fmt(n.conflictRisk) << "\n";
  for (const auto& c : n.clusters) {
    out << "  cluster [" << joinIds(c.members) << "] trust " << fmt(c.averageTrust) << " ("
        << diplo::clusterStrengthName(c.strength) << ")\n";
  }
  for (const auto& h : n.hotspots) {
    out << "  hotspot " << h.a << " / " << h.b << " trust " << fmt(h.trust) << " ("
        << diplo::tensionLevelName(h.tension) << ", conflict " << fmt(h.conflictProbability) << ")\n";
  }
  out << "  influence:\n";
  for (const auto& e : n.influence) out << "    " << std::setw(6) << e.faction << "  " << fmt(e.influence) << "\n";
}

int main(int argc, char** argv) {
  core::setLogLevel(core::LogLevel::Warn);

  core::Args args;
  args.setArity("evaluate", 2);
  args.setArity("summary", 2);
  args.setGreedy("negotiate");
  args.setGreedy("network");
  args.setGreedy("threats");
  args.setGreedy("members");
  args.setGreedy("victims");
  args.setGreedy("terms");
  args.parse(argc, argv);

  for (const auto& key : args.unknownOptions({"betray", "betrayal", "config", "cvars", "day", "defeats", "desc",
                                              "evaluate", "h", "help", "interactions", "json", "kind", "members",
                                              "motivation", "negotiate", "network", "opportunity", "out",
                                              "pressure", "reputation", "roster", "script", "seed", "set",
                                              "shortage", "sig", "summary", "terms", "threats", "type",
                                              "victims"})) {
    std::cerr << "warning: unknown option --" << key << " (see --help)\n";
  }

  if (args.hasFlag("help") || args.hasFlag("h")) {
    printHelp();
    return 0;
  }

  // --- configuration ---
  core::CVarRegistry& reg = core::cvars();
  core::installDefaultCVars(reg);
  diplo::installDiplomacyCVars(reg);
  {
    std::string path;
    if (args.getString("config", path)) {
      std::string err;
      if (!reg.loadFile(path, &err)) {
        std::cerr << "config: " << err << "\n";
        return 2;
      }
    }
    for (const auto& assignment : args.values("set")) {
      const auto eq = assignment.find('=');
      std::string err;
      if (eq == std::string::npos || !reg.setFromString(assignment.substr(0, eq), assignment.substr(eq + 1), &err)) {
        std::cerr << "--set " << assignment << ": " << (err.empty() ? "expected name=value" : err) << "\n";
        return 2;
      }
    }
  }
  if (args.hasFlag("cvars")) {
    reg.writeTo(std::cout);
    return 0;
  }
  const diplo::DiplomacyParams params = diplo::diplomacyParamsFromCVars(reg);

  // --- output ---
  const bool json = args.hasFlag("json");
  const bool sig = args.hasFlag("sig");
  std::string outPath;
  (void)args.getString("out", outPath);
  std::ofstream outFile;
  if (!outPath.empty() && outPath != "-") {
    outFile.open(outPath);
    if (!outFile) {
      std::cerr << "cannot write " << outPath << "\n";
      return 2;
    }
  }
  std::ostream& out = outFile.is_open() ? static_cast<std::ostream&>(outFile) : std::cout;

  // --- world ---
  diplo::FactionRoster roster;
  {
    std::string path;
    if (!args.getString("roster", path)) {
      std::cerr << "missing --roster (see --help)\n";
      return 2;
    }
    std::string err;
    if (!roster.loadFile(path, &err)) {
      std::cerr << "roster: " << err << "\n";
      return 2;
    }
  }

  diplo::MemoryRelationshipStore store;
  diplo::DiplomacyEngine engine(roster, roster, store, params);

  double nowDays = 0.0;
  {
    std::string path;
    if (args.getString("interactions", path)) {
      std::vector<diplo::InteractionInput> log;
      std::string err;
      if (!diplo::loadInteractionLogFile(path, log, &err)) {
        std::cerr << "interactions: " << err << "\n";
        return 2;
      }
      const auto r = engine.replayInteractions(std::move(log));
      if (!r.ok()) {
        std::cerr << "interactions: " << r.message << "\n";
        return 2;
      }
      nowDays = r.value;
    }
  }
  (void)args.getDouble("day", nowDays);

  core::u64 seed = 1337;
  {
    unsigned long long s = (unsigned long long)seed;
    (void)args.getU64("seed", s);
    seed = (core::u64)s;
  }
  core::SplitMix64 rng(seed);

  std::optional<diplo::AllianceType> type;
  {
    std::string t;
    if (args.getString("type", t)) {
      diplo::AllianceType parsed{};
      if (!diplo::tryParseAllianceType(t, parsed)) {
        std::cerr << "unknown alliance type '" << t << "'\n";
        return 2;
      }
      type = parsed;
    }
  }

  std::string err;

  // --- commands ---
  if (args.has("evaluate")) {
    std::vector<FactionId> pair, threats;
    if (!parseIds(args.values("evaluate"), pair, err) || pair.size() != 2 ||
        !parseIds(args.values("threats"), threats, err)) {
      std::cerr << "--evaluate: " << (err.empty() ? "expected two faction ids" : err) << "\n";
      return 2;
    }
    const auto r = engine.evaluateAlliance(pair[0], pair[1], threats, type, rng);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      printOpportunity(out, r.value);
    }
    return 0;
  }

  if (args.has("betrayal")) {
    std::vector<FactionId> who, members;
    if (!parseIds(args.values("betrayal"), who, err) || who.size() != 1 ||
        !parseIds(args.values("members"), members, err)) {
      std::cerr << "--betrayal: " << (err.empty() ? "expected one faction id" : err) << "\n";
      return 2;
    }
    diplo::ExternalFactors f;
    f.underPressure = args.hasFlag("pressure");
    f.resourceShortage = args.hasFlag("shortage");
    f.betterOpportunity = args.hasFlag("opportunity");
    {
      unsigned long long d = 0;
      if (args.getU64("defeats", d)) f.recentDefeats = static_cast<int>(d);
    }
    const auto r = engine.evaluateBetrayal(who[0], f, members);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      printBetrayal(out, r.value);
    }
    return 0;
  }

  if (args.has("betray")) {
    std::vector<FactionId> who, victims;
    if (!parseIds(args.values("betray"), who, err) || who.size() != 1 ||
        !parseIds(args.values("victims"), victims, err)) {
      std::cerr << "--betray: " << (err.empty() ? "expected one faction id" : err) << "\n";
      return 2;
    }
    diplo::BetrayalKind kind = diplo::BetrayalKind::Diplomatic;
    diplo::BetrayalMotivation motivation = diplo::BetrayalMotivation::Ambition;
    std::string text;
    if (args.getString("kind", text) && !diplo::tryParseBetrayalKind(text, kind)) {
      std::cerr << "unknown betrayal kind '" << text << "'\n";
      return 2;
    }
    if (args.getString("motivation", text) && !diplo::tryParseBetrayalMotivation(text, motivation)) {
      std::cerr << "unknown motivation '" << text << "'\n";
      return 2;
    }
    std::string desc = "Alliance betrayed";
    (void)args.getString("desc", desc);

    const auto r = engine.recordBetrayal(who[0], kind, motivation, desc, victims, nowDays);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      const auto& e = r.value.event;
      out << "Betrayal by " << e.betrayer << " (" << diplo::betrayalKindName(e.kind) << ", "
          << diplo::betrayalMotivationName(e.motivation) << ")\n"
          << "  severity       " << fmt(e.severity) << "\n"
          << "  trust damage   " << fmt(e.trustDamage) << "\n";
      printList(out, "consequences", e.consequences);
      for (const auto& i : r.value.interactions) {
        out << "  " << i.record.target << " now trusts " << e.betrayer << " at "
            << fmt(i.evolution.trustFrom(i.record.target)) << "\n";
      }
    }
    return 0;
  }

  if (args.has("negotiate")) {
    std::vector<FactionId> ids;
    if (!parseIds(args.values("negotiate"), ids, err) || ids.empty()) {
      std::cerr << "--negotiate: " << (err.empty() ? "expected faction ids" : err) << "\n";
      return 2;
    }
    diplo::TermOverrides proposed;
    for (const auto& a : args.values("terms")) {
      if (!diplo::parseTermAssignment(a, proposed, &err)) {
        std::cerr << "--terms " << a << ": " << err << "\n";
        return 2;
      }
    }
    std::vector<diplo::ScriptStep> script;
    {
      std::string path;
      if (args.getString("script", path) && !diplo::loadNegotiationScriptFile(path, script, &err)) {
        std::cerr << "script: " << err << "\n";
        return 2;
      }
    }

    const std::vector<FactionId> targets(ids.begin() + 1, ids.end());
    const auto started = engine.initiateNegotiation(ids[0], targets, type.value_or(diplo::AllianceType::Cooperation),
                                                    proposed, nowDays);
    if (!started.ok()) return reportError(out, json, started.error, started.message);
    const diplo::SessionId id = started.value.id;

    std::vector<diplo::Result<diplo::ActionResult>> steps;
    double day = nowDays;
    for (const auto& s : script) {
      day = std::max(day, s.day);
      steps.push_back(engine.advanceNegotiation(id, s.faction, s.action, s.params, day));
    }
    const auto closing = engine.negotiationStatus(id, day);
    if (!closing.ok()) return reportError(out, json, closing.error, closing.message);

    if (json) {
      core::JsonWriter j(out, true);
      j.beginObject();
      j.key("steps");
      j.beginArray();
      for (const auto& r : steps) {
        if (r.ok()) diplo::writeJson(j, r.value); else diplo::writeJsonError(j, r.error, r.message);
      }
      j.endArray();
      j.key("session");
      diplo::writeJson(j, closing.value);
      if (sig) {
        j.key("signature");
        j.value(static_cast<unsigned long long>(diplo::signatureNegotiationSession(closing.value)));
      }
      j.endObject();
      j.finish();
    } else {
      for (std::size_t i = 0; i < steps.size(); ++i) {
        const auto& r = steps[i];
        out << "step " << (i + 1) << ": ";
        if (r.ok()) {
          out << script[i].faction << " " << diplo::negotiationActionName(r.value.action) << "  "
              << diplo::negotiationPhaseName(r.value.phaseBefore) << " -> " << diplo::negotiationPhaseName(r.value.phase)
              << "\n";
        } else {
          out << "refused (" << diplo::diploErrorName(r.error) << "): " << r.message << "\n";
        }
      }
      printSession(out, closing.value, sig);
    }
    return 0;
  }

  if (args.has("summary")) {
    std::vector<FactionId> pair;
    if (!parseIds(args.values("summary"), pair, err) || pair.size() != 2) {
      std::cerr << "--summary: " << (err.empty() ? "expected two faction ids" : err) << "\n";
      return 2;
    }
    const auto r = engine.relationshipSummary(pair[0], pair[1], nowDays);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      printSummary(out, r.value);
      if (sig) {
        if (const auto t = store.getTrustEvolution(pair[0], pair[1])) {
          out << "  signature      0x" << std::hex << diplo::signatureTrustEvolution(*t) << std::dec << "\n";
        }
      }
    }
    return 0;
  }

  if (args.has("reputation")) {
    std::vector<FactionId> who;
    if (!parseIds(args.values("reputation"), who, err) || who.size() != 1) {
      std::cerr << "--reputation: " << (err.empty() ? "expected one faction id" : err) << "\n";
      return 2;
    }
    const auto r = engine.factionReputation(who[0], roster.ids(), nowDays);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      printReputation(out, r.value);
    }
    return 0;
  }

  if (args.has("network")) {
    std::vector<FactionId> ids;
    if (!parseIds(args.values("network"), ids, err)) {
      std::cerr << "--network: " << err << "\n";
      return 2;
    }
    if (ids.empty()) ids = roster.ids();
    const auto r = engine.analyzeNetwork(ids);
    if (!r.ok()) return reportError(out, json, r.error, r.message);
    if (json) {
      core::JsonWriter j(out, true);
      diplo::writeJson(j, r.value);
      j.finish();
    } else {
      printNetwork(out, r.value);
    }
    return 0;
  }

  printHelp();
  return 2;
}
