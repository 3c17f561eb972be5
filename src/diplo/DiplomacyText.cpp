#include "entente/diplo/DiplomacyText.h"

#include "entente/core/Log.h"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <sstream>

namespace entente::diplo {

static std::string_view trimView(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static bool isSkippable(std::string_view line) {
  line = trimView(line);
  return line.empty() || line.front() == '#';
}

static bool fail(std::string* outError, std::string msg) {
  if (outError) *outError = std::move(msg);
  return false;
}

bool parseFactionId(std::string_view text, FactionId& out) {
  if (text.empty() || !std::isdigit((unsigned char)text.front())) return false;
  const std::string tmp(text);
  char* end = nullptr;
  const auto v = std::strtoull(tmp.c_str(), &end, 10);
  if (end != tmp.c_str() + tmp.size()) return false;
  out = static_cast<FactionId>(v);
  return true;
}

bool parseNumber(std::string_view text, double& out) {
  if (text.empty()) return false;
  const std::string tmp(text);
  char* end = nullptr;
  const double v = std::strtod(tmp.c_str(), &end);
  if (end != tmp.c_str() + tmp.size() || !std::isfinite(v)) return false;
  out = v;
  return true;
}

bool tokenizeLine(std::string_view line, std::vector<std::string>& out, std::string* outError) {
  out.clear();
  std::string cur;
  bool inQuote = false;
  bool haveToken = false;

  for (const char c : line) {
    if (c == '"') {
      inQuote = !inQuote;
      haveToken = true;
      continue;
    }
    if (!inQuote && std::isspace((unsigned char)c)) {
      if (haveToken) {
        out.push_back(std::move(cur));
        cur.clear();
        haveToken = false;
      }
      continue;
    }
    cur.push_back(c);
    haveToken = true;
  }

  if (inQuote) return fail(outError, "unterminated quote");
  if (haveToken) out.push_back(std::move(cur));
  return true;
}

bool readTextHeader(std::istream& in, std::string_view magic, int& lineNo, std::string* outError) {
  std::string line;
  while (std::getline(in, line)) {
    ++lineNo;
    if (isSkippable(line)) continue;

    std::istringstream ss(line);
    std::string header;
    int version = 0;
    if (!(ss >> header >> version) || header != magic) {
      return fail(outError, "line " + std::to_string(lineNo) + ": expected header '" + std::string(magic) + " " +
                              std::to_string(kTextFormatVersion) + "'");
    }
    if (version != kTextFormatVersion) {
      return fail(outError, "line " + std::to_string(lineNo) + ": unsupported version " + std::to_string(version));
    }
    return true;
  }
  return fail(outError, "missing header '" + std::string(magic) + "'");
}

// Splits "key=value"; false when there is no '='.
static bool splitAssignment(std::string_view token, std::string_view& key, std::string_view& value) {
  const auto eq = token.find('=');
  if (eq == std::string_view::npos || eq == 0) return false;
  key = token.substr(0, eq);
  value = token.substr(eq + 1);
  return true;
}

bool parseInteractionLine(std::string_view line, InteractionInput& out, std::string* outError) {
  std::vector<std::string> tok;
  if (!tokenizeLine(line, tok, outError)) return false;
  if (tok.size() < 5) return fail(outError, "expected: <day> <initiator> <target> <kind> <trust_impact> ...");

  InteractionInput in;
  if (!parseNumber(tok[0], in.timeDays)) return fail(outError, "bad day '" + tok[0] + "'");
  if (!parseFactionId(tok[1], in.initiator)) return fail(outError, "bad initiator id '" + tok[1] + "'");
  if (!parseFactionId(tok[2], in.target)) return fail(outError, "bad target id '" + tok[2] + "'");
  if (!tryParseInteractionKind(tok[3], in.kind)) return fail(outError, "unknown interaction kind '" + tok[3] + "'");
  if (!parseNumber(tok[4], in.trustImpact)) return fail(outError, "bad trust impact '" + tok[4] + "'");

  std::string description;
  for (std::size_t i = 5; i < tok.size(); ++i) {
    std::string_view key, value;
    if (splitAssignment(tok[i], key, value)) {
      if (key == "reputation") {
        if (!parseNumber(value, in.reputationImpact)) return fail(outError, "bad reputation '" + tok[i] + "'");
        continue;
      }
      if (key == "severity") {
        if (!parseNumber(value, in.severity)) return fail(outError, "bad severity '" + tok[i] + "'");
        continue;
      }
    }
    if (!description.empty()) description.push_back(' ');
    description += tok[i];
  }
  in.description = std::move(description);

  out = std::move(in);
  return true;
}

bool loadInteractionLog(std::istream& in, std::vector<InteractionInput>& out, std::string* outError) {
  int lineNo = 0;
  if (!readTextHeader(in, kInteractionLogMagic, lineNo, outError)) return false;

  std::vector<InteractionInput> records;
  std::string line;
  std::string err;
  while (std::getline(in, line)) {
    ++lineNo;
    if (isSkippable(line)) continue;

    InteractionInput rec;
    if (!parseInteractionLine(line, rec, &err)) {
      return fail(outError, "line " + std::to_string(lineNo) + ": " + err);
    }
    records.push_back(std::move(rec));
  }

  out = std::move(records);
  return true;
}

bool loadInteractionLogFile(const std::string& path, std::vector<InteractionInput>& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    ENTENTE_LOG_DEBUG("interactions: file not found: " + path);
    return fail(outError, "cannot open " + path);
  }
  std::string err;
  if (!loadInteractionLog(f, out, &err)) {
    ENTENTE_LOG_WARN("interactions: " + path + ": " + err);
    return fail(outError, path + ": " + err);
  }
  return true;
}

bool parseScriptLine(std::string_view line, ScriptStep& out, std::string* outError) {
  std::vector<std::string> tok;
  if (!tokenizeLine(line, tok, outError)) return false;
  if (tok.size() < 3) return fail(outError, "expected: <day> <faction> <action> ...");

  ScriptStep step;
  if (!parseNumber(tok[0], step.day)) return fail(outError, "bad day '" + tok[0] + "'");
  if (!parseFactionId(tok[1], step.faction)) return fail(outError, "bad faction id '" + tok[1] + "'");
  if (!tryParseNegotiationAction(tok[2], step.action)) return fail(outError, "unknown action '" + tok[2] + "'");

  std::string err;
  for (std::size_t i = 3; i < tok.size(); ++i) {
    std::string_view key, value;
    if (!splitAssignment(tok[i], key, value)) return fail(outError, "expected key=value, got '" + tok[i] + "'");

    if (key == "note") {
      step.params.note = std::string(value);
    } else if (key == "request") {
      TermKey k{};
      if (!tryParseTermKey(value, k)) return fail(outError, "unknown term '" + std::string(value) + "'");
      step.params.requestedTerms.push_back(k);
    } else if (!parseTermAssignment(tok[i], step.params.overrides, &err)) {
      return fail(outError, err);
    }
  }

  out = std::move(step);
  return true;
}

bool loadNegotiationScript(std::istream& in, std::vector<ScriptStep>& out, std::string* outError) {
  int lineNo = 0;
  if (!readTextHeader(in, kNegotiationScriptMagic, lineNo, outError)) return false;

  std::vector<ScriptStep> steps;
  std::string line;
  std::string err;
  while (std::getline(in, line)) {
    ++lineNo;
    if (isSkippable(line)) continue;

    ScriptStep step;
    if (!parseScriptLine(line, step, &err)) {
      return fail(outError, "line " + std::to_string(lineNo) + ": " + err);
    }
    steps.push_back(std::move(step));
  }

  out = std::move(steps);
  return true;
}

bool loadNegotiationScriptFile(const std::string& path, std::vector<ScriptStep>& out, std::string* outError) {
  std::ifstream f(path);
  if (!f) {
    ENTENTE_LOG_DEBUG("script: file not found: " + path);
    return fail(outError, "cannot open " + path);
  }
  std::string err;
  if (!loadNegotiationScript(f, out, &err)) {
    ENTENTE_LOG_WARN("script: " + path + ": " + err);
    return fail(outError, path + ": " + err);
  }
  return true;
}

} // namespace entente::diplo
