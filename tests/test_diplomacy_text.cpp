#include "entente/diplo/DiplomacyText.h"

#include "diplo_fixtures.h"
#include "test_harness.h"

#include <sstream>
#include <string>
#include <vector>

using namespace entente;
using entente::test::near;

int test_diplomacy_text() {
  int failures = 0;

  // ---- Tokenizer ----
  {
    std::vector<std::string> tok;
    CHECK(diplo::tokenizeLine("  a  \"b c\"  note=\"x y\" ", tok));
    CHECK(tok.size() == 3);
    CHECK(tok[1] == "b c");
    CHECK(tok[2] == "note=x y");

    CHECK(diplo::tokenizeLine("\"\"", tok));
    CHECK(tok.size() == 1 && tok[0].empty());

    std::string err;
    CHECK(!diplo::tokenizeLine("a \"b", tok, &err));
    CHECK(!err.empty());
  }

  // ---- Scalars ----
  {
    diplo::FactionId id = 0;
    CHECK(diplo::parseFactionId("17", id) && id == 17);
    CHECK(!diplo::parseFactionId("-1", id));
    CHECK(!diplo::parseFactionId("4x", id));
    double v = 0.0;
    CHECK(diplo::parseNumber("-0.25", v) && near(v, -0.25));
    CHECK(!diplo::parseNumber("0.5.1", v));
    CHECK(!diplo::parseNumber("", v));
  }

  // ---- Interaction lines ----
  {
    diplo::InteractionInput in;
    std::string err;
    CHECK(diplo::parseInteractionLine("12.5 3 1 betrayal -0.9 reputation=-0.4 severity=0.8 \"fleet turned\" at dawn",
                                      in, &err));
    CHECK(near(in.timeDays, 12.5));
    CHECK(in.initiator == 3 && in.target == 1);
    CHECK(in.kind == diplo::InteractionKind::Betrayal);
    CHECK(near(in.trustImpact, -0.9));
    CHECK(near(in.reputationImpact, -0.4));
    CHECK(near(in.severity, 0.8));
    CHECK(in.description == "fleet turned at dawn");

    CHECK(!diplo::parseInteractionLine("1 2 3 betrayal", in, &err));
    CHECK(!diplo::parseInteractionLine("1 2 3 bribery 0.1", in, &err));
    CHECK(err.find("bribery") != std::string::npos);
    CHECK(!diplo::parseInteractionLine("1 2 3 betrayal -0.1 severity=high", in, &err));
  }

  {
    std::istringstream in(
      "EntenteInteractions 1\n"
      "# day init target kind impact\n"
      "1 1 2 trade_agreement 0.4 first convoy\n"
      "\n"
      "5 2 1 border_incident -0.2\n");
    std::vector<diplo::InteractionInput> out;
    std::string err;
    CHECK(diplo::loadInteractionLog(in, out, &err));
    CHECK(out.size() == 2);
    CHECK(out[0].description == "first convoy");
    CHECK(out[1].kind == diplo::InteractionKind::BorderIncident);

    std::istringstream bad("EntenteInteractions 1\n1 1 2 trade_agreement 0.4\noops\n");
    std::vector<diplo::InteractionInput> untouched(1);
    CHECK(!diplo::loadInteractionLog(bad, untouched, &err));
    CHECK(err.find("line 3") == 0);
    CHECK(untouched.size() == 1);

    std::istringstream wrong("EntenteScript 1\n");
    CHECK(!diplo::loadInteractionLog(wrong, out, &err));
  }

  // ---- Negotiation scripts ----
  {
    diplo::ScriptStep step;
    std::string err;
    CHECK(diplo::parseScriptLine("3 2 propose military_support=0.7 offensive_coordination=false note=\"hold the line\"",
                                 step, &err));
    CHECK(near(step.day, 3.0));
    CHECK(step.faction == 2);
    CHECK(step.action == diplo::NegotiationAction::ProposeTerms);
    CHECK(step.params.overrides.militarySupportLevel && near(*step.params.overrides.militarySupportLevel, 0.7));
    CHECK(step.params.overrides.provisions.count(diplo::TermKey::OffensiveCoordination) == 1);
    CHECK(step.params.note == "hold the line");

    CHECK(diplo::parseScriptLine("4 3 modify request=shared_borders request=mutual_defense", step, &err));
    CHECK(step.action == diplo::NegotiationAction::RequestModification);
    CHECK(step.params.requestedTerms.size() == 2);

    CHECK(!diplo::parseScriptLine("4 3 modify request=warp_lanes", step, &err));
    CHECK(!diplo::parseScriptLine("4 3 bribe", step, &err));
    CHECK(!diplo::parseScriptLine("4 3 accept loose_token", step, &err));

    std::istringstream in(
      "EntenteScript 1\n"
      "1 1 accept\n"
      "2 3 accept_terms note=finally\n");
    std::vector<diplo::ScriptStep> steps;
    CHECK(diplo::loadNegotiationScript(in, steps, &err));
    CHECK(steps.size() == 2);
    CHECK(steps[1].params.note == "finally");
  }

  {
    std::vector<diplo::InteractionInput> out;
    std::string err;
    CHECK(!diplo::loadInteractionLogFile("entente_test_missing_log.txt", out, &err));
    CHECK(err.find("cannot open") == 0);
  }

  return failures;
}
