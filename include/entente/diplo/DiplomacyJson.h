#pragma once

#include "entente/core/JsonWriter.h"
#include "entente/diplo/DiplomacyEngine.h"

#include <string_view>
#include <vector>

namespace entente::diplo {

// JSON projections of engine results (the tool's --json output).
// Enums are written by their snake_case names, ids as unsigned integers.

void writeJson(core::JsonWriter& j, const AllianceTerms& t);
void writeJson(core::JsonWriter& j, const AllianceOpportunity& o);
void writeJson(core::JsonWriter& j, const BetrayalAssessment& b);
void writeJson(core::JsonWriter& j, const BetrayalEvent& e);
void writeJson(core::JsonWriter& j, const RecordedBetrayal& b);
void writeJson(core::JsonWriter& j, const NegotiationSession& s);
void writeJson(core::JsonWriter& j, const ActionResult& r);
void writeJson(core::JsonWriter& j, const std::vector<SessionSummary>& list);
void writeJson(core::JsonWriter& j, const InteractionRecord& r);
void writeJson(core::JsonWriter& j, const TrustEvolution& t);
void writeJson(core::JsonWriter& j, const RecordedInteraction& r);
void writeJson(core::JsonWriter& j, const RelationshipSummary& s);
void writeJson(core::JsonWriter& j, const FactionReputation& r);
void writeJson(core::JsonWriter& j, const NetworkAnalysis& n);

// {"error": "<name>", "class": "<class>", "message": "..."}
void writeJsonError(core::JsonWriter& j, DiploError e, std::string_view message);

} // namespace entente::diplo
