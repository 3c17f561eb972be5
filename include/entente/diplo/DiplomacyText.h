#pragma once

#include "entente/diplo/Negotiation.h"
#include "entente/diplo/Relationship.h"

#include <iosfwd>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Line-based text formats used by the command-line tool
// -----------------------------------------------------------------------------
//
// Every file starts with a header line "<Magic> <version>" followed by one
// record per line. Blank lines and lines starting with '#' are skipped.
// Errors name the 1-based line number.
//
// Interaction log (EntenteInteractions 1):
//   <day> <initiator> <target> <kind> <trustImpact> [reputation=x] [severity=x] [description...]
//
// Negotiation script (EntenteScript 1):
//   <day> <faction> <action> [<term assignment>...] [request=<term_key>] [note="..."]
// where term assignments use parseTermAssignment() syntax.

inline constexpr const char* kInteractionLogMagic = "EntenteInteractions";
inline constexpr const char* kNegotiationScriptMagic = "EntenteScript";
inline constexpr int kTextFormatVersion = 1;

// Whitespace-separated tokens; double quotes group a token ("Iron Pact").
// Returns false on an unterminated quote.
bool tokenizeLine(std::string_view line, std::vector<std::string>& out, std::string* outError = nullptr);

// Reads and checks the "<magic> <version>" line, skipping leading comments.
// `lineNo` is advanced past every consumed line.
bool readTextHeader(std::istream& in, std::string_view magic, int& lineNo, std::string* outError = nullptr);

bool parseInteractionLine(std::string_view line, InteractionInput& out, std::string* outError = nullptr);

bool loadInteractionLog(std::istream& in, std::vector<InteractionInput>& out, std::string* outError = nullptr);
bool loadInteractionLogFile(const std::string& path, std::vector<InteractionInput>& out,
                            std::string* outError = nullptr);

struct ScriptStep {
  double day{0.0};
  FactionId faction{0};
  NegotiationAction action{NegotiationAction::AcceptTerms};
  ActionParams params;
};

bool parseScriptLine(std::string_view line, ScriptStep& out, std::string* outError = nullptr);

bool loadNegotiationScript(std::istream& in, std::vector<ScriptStep>& out, std::string* outError = nullptr);
bool loadNegotiationScriptFile(const std::string& path, std::vector<ScriptStep>& out,
                               std::string* outError = nullptr);

// Shared scalar parsers (whole token must parse).
bool parseFactionId(std::string_view text, FactionId& out);
bool parseNumber(std::string_view text, double& out);

} // namespace entente::diplo
