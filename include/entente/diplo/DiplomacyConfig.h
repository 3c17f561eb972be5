#pragma once

#include "entente/core/CVar.h"
#include "entente/diplo/AllianceFormation.h"
#include "entente/diplo/BetrayalRisk.h"
#include "entente/diplo/Compatibility.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/NetworkAnalyzer.h"
#include "entente/diplo/RelationshipAnalyzer.h"
#include "entente/diplo/TrustLedger.h"

namespace entente::diplo {

// Every calibration constant of the engine, grouped per component.
struct DiplomacyParams {
  CompatibilityParams compatibility;
  BetrayalParams betrayal;
  BetrayalEventParams betrayalEvent;
  FormationParams formation;
  NegotiationParams negotiation;
  TrustParams trust;
  AnalyzerParams analyzer;
  NetworkParams network;
};

// Defines the diplo.* cvars with the defaults of DiplomacyParams{}.
// Already defined vars keep their values; safe to call more than once.
void installDiplomacyCVars(core::CVarRegistry& registry);

// Reads the diplo.* cvars; vars that are not defined keep their defaults.
DiplomacyParams diplomacyParamsFromCVars(const core::CVarRegistry& registry);

} // namespace entente::diplo
