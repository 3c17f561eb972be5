#include "DiplomacyWindow.h"

#include "entente/core/Log.h"
#include "entente/diplo/DiplomacyConfig.h"
#include "entente/diplo/DiplomacyText.h"
#include "entente/diplo/Signature.h"

#include <imgui.h>

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

namespace entente::inspector {

void rebuildEngine(InspectorWorld& world, const core::CVarRegistry& registry) {
  world.engine.reset();
  world.engine = std::make_unique<diplo::DiplomacyEngine>(world.roster, world.roster, world.store,
                                                          diplo::diplomacyParamsFromCVars(registry));
  ENTENTE_LOG_INFO("inspector: engine rebuilt from cvars");
}

namespace {

std::string factionLabel(const diplo::FactionRoster& roster, diplo::FactionId id) {
  if (id == 0) return "(none)";
  const auto f = roster.getFaction(id);
  if (!f) return std::to_string(id) + " (unknown)";
  return std::to_string(id) + "  " + f->name;
}

bool factionCombo(const char* label, const diplo::FactionRoster& roster, diplo::FactionId& id) {
  bool changed = false;
  if (ImGui::BeginCombo(label, factionLabel(roster, id).c_str())) {
    for (const diplo::FactionId f : roster.ids()) {
      const bool selected = (f == id);
      if (ImGui::Selectable(factionLabel(roster, f).c_str(), selected)) {
        id = f;
        changed = true;
      }
      if (selected) ImGui::SetItemDefaultFocus();
    }
    ImGui::EndCombo();
  }
  return changed;
}

// Checkbox list over the roster; `exclude` ids are not offered.
void factionChecklist(const char* id, const diplo::FactionRoster& roster, std::vector<diplo::FactionId>& picked,
                      const std::vector<diplo::FactionId>& exclude) {
  ImGui::PushID(id);
  for (const diplo::FactionId f : roster.ids()) {
    if (std::find(exclude.begin(), exclude.end(), f) != exclude.end()) continue;
    const auto it = std::find(picked.begin(), picked.end(), f);
    bool on = it != picked.end();
    if (ImGui::Checkbox(factionLabel(roster, f).c_str(), &on)) {
      if (on) {
        picked.push_back(f);
      } else {
        picked.erase(it);
      }
    }
  }
  ImGui::PopID();
}

template <class NameFn>
bool enumCombo(const char* label, int& index, int count, NameFn name) {
  bool changed = false;
  if (ImGui::BeginCombo(label, name(index))) {
    for (int i = 0; i < count; ++i) {
      if (ImGui::Selectable(name(i), i == index)) {
        index = i;
        changed = true;
      }
    }
    ImGui::EndCombo();
  }
  return changed;
}

void textList(const char* title, const std::vector<std::string>& items) {
  if (items.empty()) return;
  ImGui::TextDisabled("%s", title);
  for (const auto& s : items) ImGui::BulletText("%s", s.c_str());
}

void errorText(diplo::DiploError e, const std::string& message) {
  ImGui::TextColored(ImVec4(1.0f, 0.45f, 0.4f, 1.0f), "%s: %s", diplo::diploErrorName(e), message.c_str());
}

// ---------------------------------------------------------------------------
// Tabs
// ---------------------------------------------------------------------------

void drawFactionsTab(InspectorWorld& world) {
  const ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingStretchProp;
  if (!ImGui::BeginTable("##factions", 2 + diplo::kTraitCount, flags)) return;

  ImGui::TableSetupColumn("Id", ImGuiTableColumnFlags_WidthFixed, 48.0f);
  ImGui::TableSetupColumn("Name", ImGuiTableColumnFlags_WidthStretch, 0.4f);
  for (int i = 0; i < diplo::kTraitCount; ++i) {
    ImGui::TableSetupColumn(diplo::traitName(static_cast<diplo::Trait>(i)), ImGuiTableColumnFlags_WidthFixed, 86.0f);
  }
  ImGui::TableHeadersRow();

  for (const diplo::FactionId id : world.roster.ids()) {
    const auto f = world.roster.getFaction(id);
    if (!f) continue;
    ImGui::TableNextRow();
    ImGui::TableSetColumnIndex(0);
    ImGui::Text("%llu", (unsigned long long)id);
    ImGui::TableSetColumnIndex(1);
    ImGui::TextUnformatted(f->name.c_str());
    for (int i = 0; i < diplo::kTraitCount; ++i) {
      ImGui::TableSetColumnIndex(2 + i);
      const int v = f->traits.get(static_cast<diplo::Trait>(i));
      char overlay[8];
      std::snprintf(overlay, sizeof(overlay), "%d", v);
      ImGui::ProgressBar(static_cast<float>(v) / 10.0f, ImVec2(-1.0f, 0.0f), overlay);
    }
  }
  ImGui::EndTable();
}

void drawRelationshipsTab(DiplomacyWindowState& st, InspectorWorld& world, const ToastFn& toast) {
  factionCombo("Faction A##rel", world.roster, st.a);
  factionCombo("Faction B##rel", world.roster, st.b);
  if (st.a == 0 || st.b == 0) {
    ImGui::TextDisabled("Pick two factions.");
    return;
  }

  const auto s = world.engine->relationshipSummary(st.a, st.b, world.nowDays);
  if (!s.ok()) {
    errorText(s.error, s.message);
    return;
  }
  const auto& r = s.value;

  ImGui::SeparatorText("Trust");
  ImGui::Text("%s trusts %s: %.3f", r.nameA.c_str(), r.nameB.c_str(), r.aTrustsB);
  ImGui::Text("%s trusts %s: %.3f", r.nameB.c_str(), r.nameA.c_str(), r.bTrustsA);
  ImGui::ProgressBar(static_cast<float>(r.mutualTrust), ImVec2(-1.0f, 0.0f), diplo::trustCategoryName(r.category));
  ImGui::Text("Status %s   trend %s -> %s", diplo::diplomaticStatusName(r.status),
              diplo::relationshipTrendName(r.trend), diplo::relationshipTrendName(r.trajectory));
  ImGui::Text("Interactions %d (+%d / -%d) over %d days", r.totalInteractions, r.positiveInteractions,
              r.negativeInteractions, r.durationDays);
  ImGui::Text("Alliance %.3f   conflict %.3f   stability %.3f", r.allianceProbability, r.conflictProbability,
              r.stability);
  if (!r.evolutionStored) ImGui::TextDisabled("No recorded history; values are a seeded estimate.");

  if (!r.turningPoints.empty()) {
    ImGui::SeparatorText("Turning points");
    for (const auto& t : r.turningPoints) {
      ImGui::BulletText("day %.1f  %s  %+.2f  %s", t.timeDays, diplo::interactionKindName(t.kind), t.trustImpact,
                        t.description.c_str());
    }
  }

  ImGui::SeparatorText("Record interaction (A -> B)");
  enumCombo("Kind##int", st.interactionKind, diplo::kInteractionKindCount,
            [](int i) { return diplo::interactionKindName(static_cast<diplo::InteractionKind>(i)); });
  if (ImGui::InputDouble("Trust impact", &st.interactionImpact, 0.05, 0.1, "%.2f")) {
    st.interactionImpact = std::clamp(st.interactionImpact, -1.0, 1.0);
  }
  ImGui::InputText("Description##int", st.interactionDesc, sizeof(st.interactionDesc));
  if (ImGui::Button("Record")) {
    diplo::InteractionInput in;
    in.initiator = st.a;
    in.target = st.b;
    in.kind = static_cast<diplo::InteractionKind>(st.interactionKind);
    in.trustImpact = st.interactionImpact;
    in.description = st.interactionDesc;
    in.timeDays = world.nowDays;
    const auto rec = world.engine->recordInteraction(in);
    if (toast) {
      toast(rec.ok() ? "Recorded " + std::string(diplo::interactionKindName(in.kind))
                     : std::string("Rejected: ") + rec.message,
            2.0);
    }
    st.network.reset();
  }

  const auto rep = world.engine->factionReputation(st.a, world.roster.ids(), world.nowDays);
  if (rep.ok()) {
    ImGui::SeparatorText("Reputation of A");
    ImGui::Text("%.3f (%s)  trustworthiness %.3f  reliability %.3f", rep.value.overall,
                diplo::reputationStandingName(rep.value.standing), rep.value.trustworthiness,
                rep.value.reliability);
  }
}

void drawAlliancesTab(DiplomacyWindowState& st, InspectorWorld& world, const ToastFn& toast) {
  factionCombo("Faction A##al", world.roster, st.a);
  factionCombo("Faction B##al", world.roster, st.b);

  if (ImGui::TreeNode("Common threats")) {
    factionChecklist("threats", world.roster, st.threats, {st.a, st.b});
    ImGui::TreePop();
  }
  enumCombo("Requested type", st.requestedType, diplo::kAllianceTypeCount + 1, [](int i) {
    return (i < 0 || i >= diplo::kAllianceTypeCount) ? "(recommend)"
                                                     : diplo::allianceTypeName(static_cast<diplo::AllianceType>(i));
  });
  if (st.requestedType >= diplo::kAllianceTypeCount) st.requestedType = -1;

  if (ImGui::Button("Evaluate alliance")) {
    std::optional<diplo::AllianceType> type;
    if (st.requestedType >= 0) type = static_cast<diplo::AllianceType>(st.requestedType);
    st.opportunity = world.engine->evaluateAlliance(st.a, st.b, st.threats, type, world.rng);
  }

  if (st.opportunity) {
    if (!st.opportunity->ok()) {
      errorText(st.opportunity->error, st.opportunity->message);
    } else {
      const auto& o = st.opportunity->value;
      ImGui::Text("Compatibility %.3f   threat %.3f (%d shared enemies)", o.assessment.compatibility,
                  o.assessment.threatLevel, o.assessment.sharedEnemies);
      ImGui::Text("Willingness %.3f / %.3f   overall %.3f", o.willingnessA, o.willingnessB, o.overallWillingness);
      ImGui::Text("%s, %s", o.compatible ? "Compatible" : "Incompatible", diplo::allianceDurationLabel(o.duration));
      std::string types;
      for (const auto t : o.recommendedTypes) types += std::string(types.empty() ? "" : ", ") + diplo::allianceTypeName(t);
      ImGui::Text("Recommended: %s", types.c_str());
      textList("Risks", o.risks);
      textList("Benefits", o.benefits);
    }
  }

  ImGui::SeparatorText("Betrayal (faction A)");
  ImGui::Checkbox("Under pressure", &st.factors.underPressure);
  ImGui::SameLine();
  ImGui::Checkbox("Resource shortage", &st.factors.resourceShortage);
  ImGui::SameLine();
  ImGui::Checkbox("Better opportunity", &st.factors.betterOpportunity);
  ImGui::SetNextItemWidth(120.0f);
  ImGui::InputInt("Recent defeats", &st.factors.recentDefeats);
  if (st.factors.recentDefeats < 0) st.factors.recentDefeats = 0;

  if (ImGui::Button("Evaluate betrayal risk")) {
    std::vector<diplo::FactionId> members;
    if (st.b != 0) members.push_back(st.b);
    st.betrayal = world.engine->evaluateBetrayal(st.a, st.factors, members);
  }
  if (st.betrayal) {
    if (!st.betrayal->ok()) {
      errorText(st.betrayal->error, st.betrayal->message);
    } else {
      const auto& b = st.betrayal->value;
      ImGui::ProgressBar(static_cast<float>(b.probability), ImVec2(-1.0f, 0.0f), diplo::riskTierName(b.tier));
      ImGui::Text("Base %.3f + external %.3f   motivation %s   damage %.3f", b.baseRisk, b.externalModifier,
                  diplo::betrayalMotivationName(b.motivation), b.expectedTrustDamage);
    }
  }

  enumCombo("Kind##betray", st.betrayalKind, 4,
            [](int i) { return diplo::betrayalKindName(static_cast<diplo::BetrayalKind>(i)); });
  enumCombo("Motivation##betray", st.betrayalMotivation, 4,
            [](int i) { return diplo::betrayalMotivationName(static_cast<diplo::BetrayalMotivation>(i)); });
  ImGui::InputText("Description##betray", st.betrayalDesc, sizeof(st.betrayalDesc));
  if (ImGui::Button("Record betrayal of B by A")) {
    const auto r = world.engine->recordBetrayal(st.a, static_cast<diplo::BetrayalKind>(st.betrayalKind),
                                                static_cast<diplo::BetrayalMotivation>(st.betrayalMotivation),
                                                st.betrayalDesc, {st.b}, world.nowDays);
    if (toast) {
      char buf[160];
      if (r.ok()) {
        std::snprintf(buf, sizeof(buf), "Betrayal recorded: severity %.2f, damage %.2f", r.value.event.severity,
                      r.value.event.trustDamage);
      } else {
        std::snprintf(buf, sizeof(buf), "Rejected: %s", r.message.c_str());
      }
      toast(buf, 2.4);
    }
    st.network.reset();
  }
}

void drawSessionDetail(DiplomacyWindowState& st, InspectorWorld& world, const ToastFn& toast) {
  const auto s = world.engine->negotiationStatus(st.selectedSession, world.nowDays);
  if (!s.ok()) {
    errorText(s.error, s.message);
    return;
  }
  const auto& n = s.value;

  ImGui::SeparatorText("Session");
  ImGui::Text("#%llu  %s  phase %s  round %d/%d  deadline day %.1f", (unsigned long long)n.id,
              diplo::allianceTypeName(n.terms.type), diplo::negotiationPhaseName(n.phase), n.roundsCompleted,
              n.maxRounds, n.deadlineDays);
  ImGui::Text("Success %.3f   agreeing %.2f   terms v%u", n.successProbability, diplo::agreeingFraction(n),
              (unsigned)n.terms.version);
  ImGui::TextDisabled("signature 0x%016llx", (unsigned long long)diplo::signatureNegotiationSession(n));

  const ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg | ImGuiTableFlags_SizingStretchProp;
  if (ImGui::BeginTable("##positions", 4, flags)) {
    ImGui::TableSetupColumn("Faction");
    ImGui::TableSetupColumn("Stance");
    ImGui::TableSetupColumn("Accepts");
    ImGui::TableSetupColumn("Response");
    ImGui::TableHeadersRow();
    for (const diplo::FactionId f : n.participants) {
      const auto* p = n.position(f);
      if (!p) continue;
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::TextUnformatted(factionLabel(world.roster, f).c_str());
      ImGui::TableSetColumnIndex(1);
      ImGui::TextUnformatted(diplo::negotiationStanceName(p->stance));
      ImGui::TableSetColumnIndex(2);
      ImGui::TextUnformatted(p->acceptedVersion == n.terms.version ? "yes" : "-");
      ImGui::TableSetColumnIndex(3);
      ImGui::TextUnformatted(diplo::factionResponseMessage(p->initialResponse));
    }
    ImGui::EndTable();
  }

  if (ImGui::TreeNode("Events")) {
    for (const auto& e : n.events) {
      ImGui::BulletText("day %.1f  r%d  %s  %s -> %s  %s", e.timeDays, e.round, diplo::negotiationEventKindName(e.kind),
                        diplo::negotiationPhaseName(e.from), diplo::negotiationPhaseName(e.to), e.detail.c_str());
    }
    ImGui::TreePop();
  }

  const auto actions = diplo::availableActions(n.phase);
  if (actions.empty()) return;

  ImGui::SeparatorText("Act");
  if (!n.isParticipant(st.actor)) st.actor = n.initiator;
  if (ImGui::BeginCombo("Actor", factionLabel(world.roster, st.actor).c_str())) {
    for (const diplo::FactionId f : n.participants) {
      if (ImGui::Selectable(factionLabel(world.roster, f).c_str(), f == st.actor)) st.actor = f;
    }
    ImGui::EndCombo();
  }
  ImGui::InputTextWithHint("Terms", "e.g. military_support=0.7 offensive_coordination=false", st.termLine,
                           sizeof(st.termLine));
  ImGui::InputText("Note", st.actionNote, sizeof(st.actionNote));

  for (const auto a : actions) {
    if (ImGui::Button(diplo::negotiationActionName(a))) {
      diplo::ActionParams params;
      params.note = st.actionNote;

      std::vector<std::string> tokens;
      std::string err;
      bool ok = diplo::tokenizeLine(st.termLine, tokens, &err);
      for (std::size_t i = 0; ok && i < tokens.size(); ++i) {
        diplo::TermKey key{};
        if (a == diplo::NegotiationAction::RequestModification && diplo::tryParseTermKey(tokens[i], key)) {
          params.requestedTerms.push_back(key);
        } else {
          ok = diplo::parseTermAssignment(tokens[i], params.overrides, &err);
        }
      }

      if (!ok) {
        if (toast) toast("Terms: " + err, 2.4);
      } else {
        const auto r = world.engine->advanceNegotiation(n.id, st.actor, a, params, world.nowDays);
        if (toast) {
          toast(r.ok() ? std::string("Phase: ") + diplo::negotiationPhaseName(r.value.phase)
                       : std::string(diplo::diploErrorName(r.error)) + ": " + r.message,
                2.2);
        }
      }
    }
    ImGui::SameLine();
  }
  ImGui::NewLine();
}

void drawNegotiationsTab(DiplomacyWindowState& st, InspectorWorld& world, const ToastFn& toast) {
  if (ImGui::TreeNode("New negotiation")) {
    factionCombo("Initiator", world.roster, st.a);
    factionChecklist("targets", world.roster, st.negotiationTargets, {st.a});
    enumCombo("Type##neg", st.negotiationType, diplo::kAllianceTypeCount,
              [](int i) { return diplo::allianceTypeName(static_cast<diplo::AllianceType>(i)); });
    if (ImGui::Button("Initiate")) {
      const auto r = world.engine->initiateNegotiation(st.a, st.negotiationTargets,
                                                       static_cast<diplo::AllianceType>(st.negotiationType),
                                                       diplo::TermOverrides{}, world.nowDays);
      if (r.ok()) {
        st.selectedSession = r.value.id;
        st.actor = r.value.initiator;
      }
      if (toast) toast(r.ok() ? "Negotiation #" + std::to_string(r.value.id) + " opened" : r.message, 2.2);
    }
    ImGui::TreePop();
  }

  ImGui::SeparatorText("Active");
  const auto active = world.engine->activeNegotiations(world.nowDays);
  if (active.empty()) ImGui::TextDisabled("No active negotiations.");
  for (const auto& s : active) {
    char label[160];
    std::snprintf(label, sizeof(label), "#%llu  %s  %s  %zu parties  p=%.2f", (unsigned long long)s.id,
                  diplo::allianceTypeName(s.type), diplo::negotiationPhaseName(s.phase), s.participants.size(),
                  s.successProbability);
    if (ImGui::Selectable(label, s.id == st.selectedSession)) st.selectedSession = s.id;
  }

  if (st.selectedSession != 0) drawSessionDetail(st, world, toast);
}

void drawNetworkTab(DiplomacyWindowState& st, InspectorWorld& world) {
  if (!st.network || ImGui::Button("Refresh")) st.network = world.engine->analyzeNetwork(world.roster.ids());
  if (!st.network->ok()) {
    errorText(st.network->error, st.network->message);
    return;
  }
  const auto& n = st.network->value;

  ImGui::Text("Stability %.3f   conflict risk %.3f", n.stability, n.conflictRisk);

  ImGui::SeparatorText("Clusters");
  for (const auto& c : n.clusters) {
    std::string members;
    for (const auto f : c.members) members += (members.empty() ? "" : ", ") + factionLabel(world.roster, f);
    ImGui::BulletText("%s  trust %.3f (%s)", members.c_str(), c.averageTrust, diplo::clusterStrengthName(c.strength));
  }

  ImGui::SeparatorText("Hotspots");
  for (const auto& h : n.hotspots) {
    ImGui::BulletText("%s / %s  trust %.3f  %s  conflict %.3f", factionLabel(world.roster, h.a).c_str(),
                      factionLabel(world.roster, h.b).c_str(), h.trust, diplo::tensionLevelName(h.tension),
                      h.conflictProbability);
  }

  ImGui::SeparatorText("Trust matrix");
  const int count = static_cast<int>(n.factions.size());
  const ImGuiTableFlags flags = ImGuiTableFlags_Borders | ImGuiTableFlags_SizingFixedFit;
  if (count > 0 && count < 60 && ImGui::BeginTable("##matrix", count + 1, flags)) {
    ImGui::TableSetupColumn("");
    for (const auto f : n.factions) ImGui::TableSetupColumn(std::to_string(f).c_str());
    ImGui::TableHeadersRow();
    for (int i = 0; i < count; ++i) {
      ImGui::TableNextRow();
      ImGui::TableSetColumnIndex(0);
      ImGui::Text("%llu", (unsigned long long)n.factions[i]);
      for (int j = 0; j < count; ++j) {
        ImGui::TableSetColumnIndex(j + 1);
        if (i == j) {
          ImGui::TextDisabled("-");
          continue;
        }
        const diplo::FactionId x = n.factions[i];
        const diplo::FactionId y = n.factions[j];
        const auto it = std::find_if(n.matrix.begin(), n.matrix.end(), [&](const diplo::PairTrust& p) {
          return (p.a == x && p.b == y) || (p.a == y && p.b == x);
        });
        if (it == n.matrix.end()) continue;
        const float t = static_cast<float>(it->trust);
        ImGui::TextColored(ImVec4(1.0f - t, 0.35f + 0.6f * t, 0.35f, 1.0f), "%.2f", it->trust);
      }
    }
    ImGui::EndTable();
  }

  ImGui::SeparatorText("Influence");
  for (const auto& e : n.influence) {
    ImGui::ProgressBar(static_cast<float>(e.influence), ImVec2(240.0f, 0.0f), factionLabel(world.roster, e.faction).c_str());
  }
}

} // namespace

void drawDiplomacyWindow(DiplomacyWindowState& st, InspectorWorld& world, const core::CVarRegistry& registry,
                         const ToastFn& toast) {
  if (!st.open || !world.engine) return;

  ImGui::SetNextWindowSize(ImVec2(900.0f, 680.0f), ImGuiCond_FirstUseEver);
  if (!ImGui::Begin("Diplomacy", &st.open)) {
    ImGui::End();
    return;
  }

  ImGui::SetNextItemWidth(140.0f);
  if (ImGui::InputDouble("Day", &world.nowDays, 1.0, 10.0, "%.1f")) {
    world.nowDays = std::max(0.0, world.nowDays);
    st.network.reset();
  }
  ImGui::SameLine();
  ImGui::Text("%zu factions, %zu interactions", world.roster.size(), world.store.interactionCount());
  ImGui::SameLine();
  if (ImGui::Button("Reseed")) {
    world.rng.reseed(world.seed);
    if (toast) toast("Threat RNG reseeded.", 1.5);
  }
  ImGui::SameLine();
  if (ImGui::Button("Apply cvars")) {
    rebuildEngine(world, registry);
    st.selectedSession = 0;
    st.opportunity.reset();
    st.betrayal.reset();
    st.network.reset();
    if (toast) toast("Engine rebuilt; open negotiations were closed.", 2.4);
  }

  if (ImGui::BeginTabBar("##diplo_tabs")) {
    if (ImGui::BeginTabItem("Factions")) {
      drawFactionsTab(world);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Relationships")) {
      drawRelationshipsTab(st, world, toast);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Alliances")) {
      drawAlliancesTab(st, world, toast);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Negotiations")) {
      drawNegotiationsTab(st, world, toast);
      ImGui::EndTabItem();
    }
    if (ImGui::BeginTabItem("Network")) {
      drawNetworkTab(st, world);
      ImGui::EndTabItem();
    }
    ImGui::EndTabBar();
  }

  ImGui::End();
}

} // namespace entente::inspector
