#include "entente/diplo/DiplomacyJson.h"

namespace entente::diplo {

namespace {

void idValue(core::JsonWriter& j, core::u64 id) { j.value(static_cast<unsigned long long>(id)); }

void idArray(core::JsonWriter& j, const std::vector<FactionId>& ids) {
  j.beginArray();
  for (const FactionId f : ids) idValue(j, f);
  j.endArray();
}

void termKeyArray(core::JsonWriter& j, const std::vector<TermKey>& keys) {
  j.beginArray();
  for (const TermKey k : keys) j.value(termKeyName(k));
  j.endArray();
}

} // namespace

void writeJson(core::JsonWriter& j, const AllianceTerms& t) {
  j.beginObject();
  j.key("name"); j.value(t.name);
  j.key("type"); j.value(allianceTypeName(t.type));
  j.key("version"); j.value(static_cast<int>(t.version));
  j.key("duration_months");
  if (t.durationMonths) j.value(*t.durationMonths); else j.null();
  j.key("auto_renew"); j.value(t.autoRenew);

  j.key("provisions");
  j.beginObject();
  for (int i = 0; i < kTermKeyCount; ++i) {
    const auto k = static_cast<TermKey>(i);
    j.key(termKeyName(k));
    j.value(termEnabled(t, k));
  }
  j.endObject();

  j.key("military_support"); j.value(t.military.supportLevel);
  j.key("economic_support"); j.value(t.economic.supportLevel);
  j.key("resource_sharing");
  j.beginObject();
  for (const auto& kv : t.economic.resourceSharing) {
    j.key(kv.first);
    j.value(kv.second);
  }
  j.endObject();
  j.key("access_regions"); j.value(t.territorial.accessRegions);

  j.key("exit_clauses"); j.value(t.exitClauses);
  j.key("review_schedule");
  if (t.reviewSchedule) j.value(*t.reviewSchedule); else j.null();
  j.key("dispute_resolution"); j.value(t.disputeResolution);
  j.key("activation_triggers"); j.value(t.activationTriggers);
  j.key("suspension_conditions"); j.value(t.suspensionConditions);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const AllianceOpportunity& o) {
  j.beginObject();
  j.key("faction_a"); idValue(j, o.assessment.a);
  j.key("faction_b"); idValue(j, o.assessment.b);
  j.key("compatibility"); j.value(o.assessment.compatibility);
  j.key("threat_level"); j.value(o.assessment.threatLevel);
  j.key("shared_enemies"); j.value(o.assessment.sharedEnemies);
  j.key("willingness_a"); j.value(o.willingnessA);
  j.key("willingness_b"); j.value(o.willingnessB);
  j.key("overall_willingness"); j.value(o.overallWillingness);
  j.key("compatible"); j.value(o.compatible);

  j.key("recommended_types");
  j.beginArray();
  for (const AllianceType t : o.recommendedTypes) j.value(allianceTypeName(t));
  j.endArray();

  j.key("risks"); j.value(o.risks);
  j.key("benefits"); j.value(o.benefits);
  j.key("duration"); j.value(allianceDurationName(o.duration));
  j.key("suggested_terms"); writeJson(j, o.suggestedTerms);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const BetrayalAssessment& b) {
  j.beginObject();
  j.key("faction"); idValue(j, b.faction);
  j.key("base_risk"); j.value(b.baseRisk);
  j.key("external_modifier"); j.value(b.externalModifier);
  j.key("probability"); j.value(b.probability);
  j.key("motivation"); j.value(betrayalMotivationName(b.motivation));
  j.key("risk_tier"); j.value(riskTierName(b.tier));
  j.key("expected_trust_damage"); j.value(b.expectedTrustDamage);
  j.key("trust_damage");
  j.beginArray();
  for (const auto& d : b.trustDamage) {
    j.beginObject();
    j.key("member"); idValue(j, d.member);
    j.key("damage"); j.value(d.expectedDamage);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeJson(core::JsonWriter& j, const BetrayalEvent& e) {
  j.beginObject();
  j.key("betrayer"); idValue(j, e.betrayer);
  j.key("kind"); j.value(betrayalKindName(e.kind));
  j.key("motivation"); j.value(betrayalMotivationName(e.motivation));
  j.key("description"); j.value(e.description);
  j.key("day"); j.value(e.timeDays);
  j.key("severity"); j.value(e.severity);
  j.key("trust_damage"); j.value(e.trustDamage);
  j.key("consequences"); j.value(e.consequences);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const RecordedBetrayal& b) {
  j.beginObject();
  j.key("event"); writeJson(j, b.event);
  j.key("interactions");
  j.beginArray();
  for (const auto& r : b.interactions) writeJson(j, r);
  j.endArray();
  j.endObject();
}

void writeJson(core::JsonWriter& j, const NegotiationSession& s) {
  j.beginObject();
  j.key("id"); idValue(j, s.id);
  j.key("initiator"); idValue(j, s.initiator);
  j.key("participants"); idArray(j, s.participants);
  j.key("phase"); j.value(negotiationPhaseName(s.phase));
  j.key("rounds_completed"); j.value(s.roundsCompleted);
  j.key("max_rounds"); j.value(s.maxRounds);
  j.key("created_day"); j.value(s.createdDays);
  j.key("deadline_day"); j.value(s.deadlineDays);
  j.key("consensus_threshold"); j.value(s.consensusThreshold);
  j.key("success_probability"); j.value(s.successProbability);
  j.key("agreeing_fraction"); j.value(agreeingFraction(s));
  j.key("terms"); writeJson(j, s.terms);

  j.key("positions");
  j.beginArray();
  for (const FactionId f : s.participants) {
    const NegotiationPosition* p = s.position(f);
    if (!p) continue;
    j.beginObject();
    j.key("faction"); idValue(j, p->faction);
    j.key("name"); j.value(p->name);
    j.key("stance"); j.value(negotiationStanceName(p->stance));
    j.key("priority_terms"); termKeyArray(j, p->priorityTerms);
    j.key("deal_breakers"); termKeyArray(j, p->dealBreakers);
    j.key("requested_terms"); termKeyArray(j, p->requestedTerms);
    j.key("trust_requirement"); j.value(p->trustRequirement);
    j.key("benefit_threshold"); j.value(p->benefitThreshold);
    j.key("flexibility"); j.value(p->flexibility);
    j.key("initial_response"); j.value(factionResponseName(p->initialResponse));
    j.key("initial_message"); j.value(factionResponseMessage(p->initialResponse));
    j.key("has_acted"); j.value(p->hasActed);
    j.key("accepts_current_terms"); j.value(p->acceptedVersion == s.terms.version);
    j.endObject();
  }
  j.endArray();

  j.key("events");
  j.beginArray();
  for (const auto& e : s.events) {
    j.beginObject();
    j.key("day"); j.value(e.timeDays);
    j.key("round"); j.value(e.round);
    j.key("kind"); j.value(negotiationEventKindName(e.kind));
    j.key("actor"); idValue(j, e.actor);
    j.key("action");
    if (e.action) j.value(negotiationActionName(*e.action)); else j.null();
    j.key("from"); j.value(negotiationPhaseName(e.from));
    j.key("to"); j.value(negotiationPhaseName(e.to));
    j.key("detail"); j.value(e.detail);
    j.endObject();
  }
  j.endArray();
  j.endObject();
}

void writeJson(core::JsonWriter& j, const ActionResult& r) {
  j.beginObject();
  j.key("session"); idValue(j, r.sessionId);
  j.key("actor"); idValue(j, r.actor);
  j.key("action"); j.value(negotiationActionName(r.action));
  j.key("phase_before"); j.value(negotiationPhaseName(r.phaseBefore));
  j.key("phase"); j.value(negotiationPhaseName(r.phase));
  j.key("rounds_completed"); j.value(r.roundsCompleted);
  j.key("success_probability"); j.value(r.successProbability);
  j.key("terms_version"); j.value(static_cast<int>(r.termsVersion));
  j.key("available_actions");
  j.beginArray();
  for (const NegotiationAction a : r.availableActions) j.value(negotiationActionName(a));
  j.endArray();
  j.endObject();
}

void writeJson(core::JsonWriter& j, const std::vector<SessionSummary>& list) {
  j.beginArray();
  for (const auto& s : list) {
    j.beginObject();
    j.key("id"); idValue(j, s.id);
    j.key("phase"); j.value(negotiationPhaseName(s.phase));
    j.key("type"); j.value(allianceTypeName(s.type));
    j.key("participants"); idArray(j, s.participants);
    j.key("deadline_day"); j.value(s.deadlineDays);
    j.key("rounds_completed"); j.value(s.roundsCompleted);
    j.key("success_probability"); j.value(s.successProbability);
    j.endObject();
  }
  j.endArray();
}

void writeJson(core::JsonWriter& j, const InteractionRecord& r) {
  j.beginObject();
  j.key("id"); idValue(j, r.id);
  j.key("day"); j.value(r.timeDays);
  j.key("kind"); j.value(interactionKindName(r.kind));
  j.key("initiator"); idValue(j, r.initiator);
  j.key("target"); idValue(j, r.target);
  j.key("description"); j.value(r.description);
  j.key("trust_impact"); j.value(r.trustImpact);
  j.key("reputation_impact"); j.value(r.reputationImpact);
  j.key("tension_impact"); j.value(r.tensionImpact);
  j.key("severity"); j.value(r.severity);
  j.key("consequences"); j.value(r.consequences);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const TrustEvolution& t) {
  j.beginObject();
  j.key("faction_a"); idValue(j, t.key.low);
  j.key("faction_b"); idValue(j, t.key.high);
  j.key("a_trusts_b"); j.value(t.aTrustsB);
  j.key("b_trusts_a"); j.value(t.bTrustsA);
  j.key("mutual_trust"); j.value(t.mutualTrust());
  j.key("category"); j.value(trustCategoryName(trustCategory(t.mutualTrust())));
  j.key("volatility"); j.value(t.volatility);
  j.key("peak_trust"); j.value(t.peakTrust);
  j.key("lowest_trust"); j.value(t.lowestTrust);
  j.key("baseline_compatibility"); j.value(t.baselineCompatibility);
  j.key("samples"); j.value(static_cast<int>(t.history.size()));
  j.endObject();
}

void writeJson(core::JsonWriter& j, const RecordedInteraction& r) {
  j.beginObject();
  j.key("record"); writeJson(j, r.record);
  j.key("trust"); writeJson(j, r.evolution);
  j.key("seeded"); j.value(r.seeded);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const RelationshipSummary& s) {
  j.beginObject();
  j.key("faction_a"); idValue(j, s.a);
  j.key("faction_b"); idValue(j, s.b);
  j.key("name_a"); j.value(s.nameA);
  j.key("name_b"); j.value(s.nameB);
  j.key("trust_category"); j.value(trustCategoryName(s.category));
  j.key("mutual_trust"); j.value(s.mutualTrust);
  j.key("a_trusts_b"); j.value(s.aTrustsB);
  j.key("b_trusts_a"); j.value(s.bTrustsA);
  j.key("trend"); j.value(relationshipTrendName(s.trend));
  j.key("trajectory"); j.value(relationshipTrendName(s.trajectory));
  j.key("diplomatic_status"); j.value(diplomaticStatusName(s.status));
  j.key("duration_days"); j.value(s.durationDays);
  j.key("total_interactions"); j.value(s.totalInteractions);
  j.key("positive_interactions"); j.value(s.positiveInteractions);
  j.key("negative_interactions"); j.value(s.negativeInteractions);
  j.key("last_interaction_day");
  if (s.lastInteractionDays) j.value(*s.lastInteractionDays); else j.null();
  j.key("alliance_probability"); j.value(s.allianceProbability);
  j.key("conflict_probability"); j.value(s.conflictProbability);
  j.key("stability"); j.value(s.stability);
  j.key("most_significant_positive");
  if (s.mostSignificantPositive) writeJson(j, *s.mostSignificantPositive); else j.null();
  j.key("most_significant_negative");
  if (s.mostSignificantNegative) writeJson(j, *s.mostSignificantNegative); else j.null();
  j.key("turning_points");
  j.beginArray();
  for (const auto& r : s.turningPoints) writeJson(j, r);
  j.endArray();
  j.key("evolution_stored"); j.value(s.evolutionStored);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const FactionReputation& r) {
  j.beginObject();
  j.key("faction"); idValue(j, r.faction);
  j.key("name"); j.value(r.name);
  j.key("overall"); j.value(r.overall);
  j.key("trustworthiness"); j.value(r.trustworthiness);
  j.key("reliability"); j.value(r.reliability);
  j.key("standing"); j.value(reputationStandingName(r.standing));
  j.key("notable_alliances"); idArray(j, r.notableAlliances);
  j.key("notable_conflicts"); idArray(j, r.notableConflicts);
  j.key("recent_change"); j.value(r.recentChange);
  j.key("direction"); j.value(relationshipTrendName(r.direction));
  j.key("relationships"); j.value(r.relationshipsConsidered);
  j.key("interactions_initiated"); j.value(r.interactionsInitiated);
  j.endObject();
}

void writeJson(core::JsonWriter& j, const NetworkAnalysis& n) {
  j.beginObject();
  j.key("factions"); idArray(j, n.factions);

  j.key("matrix");
  j.beginArray();
  for (const auto& p : n.matrix) {
    j.beginObject();
    j.key("a"); idValue(j, p.a);
    j.key("b"); idValue(j, p.b);
    j.key("trust"); j.value(p.trust);
    j.key("has_evolution"); j.value(p.hasEvolution);
    j.endObject();
  }
  j.endArray();

  j.key("alliance_clusters");
  j.beginArray();
  for (const auto& c : n.clusters) {
    j.beginObject();
    j.key("members"); idArray(j, c.members);
    j.key("average_trust"); j.value(c.averageTrust);
    j.key("strength"); j.value(clusterStrengthName(c.strength));
    j.endObject();
  }
  j.endArray();

  j.key("tension_hotspots");
  j.beginArray();
  for (const auto& h : n.hotspots) {
    j.beginObject();
    j.key("factions"); idArray(j, {h.a, h.b});
    j.key("trust"); j.value(h.trust);
    j.key("tension"); j.value(tensionLevelName(h.tension));
    j.key("conflict_probability"); j.value(h.conflictProbability);
    j.endObject();
  }
  j.endArray();

  j.key("influence");
  j.beginArray();
  for (const auto& e : n.influence) {
    j.beginObject();
    j.key("faction"); idValue(j, e.faction);
    j.key("influence"); j.value(e.influence);
    j.endObject();
  }
  j.endArray();

  j.key("stability"); j.value(n.stability);
  j.key("conflict_risk"); j.value(n.conflictRisk);
  j.endObject();
}

void writeJsonError(core::JsonWriter& j, DiploError e, std::string_view message) {
  j.beginObject();
  j.key("error"); j.value(diploErrorName(e));
  j.key("class"); j.value(diploErrorClassName(diploErrorClass(e)));
  j.key("message"); j.value(message);
  j.endObject();
}

} // namespace entente::diplo
