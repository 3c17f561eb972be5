#include "entente/diplo/DiplomacyEngine.h"

#include "entente/core/Log.h"

#include <algorithm>

namespace entente::diplo {

DiplomacyEngine::DiplomacyEngine(const AttributeProvider& attributes, const DiplomacyStatusProvider& status,
                                 RelationshipStore& store, DiplomacyParams params)
  : attributes_(attributes),
    store_(store),
    params_(std::move(params)),
    negotiations_(attributes, params_.negotiation),
    ledger_(attributes, store, params_.trust, params_.compatibility),
    analyzer_(attributes, status, ledger_, params_.analyzer) {}

Result<AllianceOpportunity> DiplomacyEngine::evaluateAlliance(FactionId a, FactionId b,
                                                              const std::vector<FactionId>& commonThreats,
                                                              std::optional<AllianceType> requestedType,
                                                              core::SplitMix64& rng) const {
  auto r = evaluateAllianceOpportunity(attributes_, a, b, commonThreats, requestedType, rng,
                                       params_.compatibility, params_.formation);
  if (!r.ok()) ENTENTE_LOG_DEBUG("alliance evaluation failed: " + r.message);
  return r;
}

Result<BetrayalAssessment> DiplomacyEngine::evaluateBetrayal(FactionId faction, const ExternalFactors& factors,
                                                             const std::vector<FactionId>& otherMembers) const {
  auto r = evaluateBetrayalRisk(attributes_, faction, factors, otherMembers, params_.betrayal);
  if (!r.ok()) ENTENTE_LOG_DEBUG("betrayal evaluation failed: " + r.message);
  return r;
}

Result<RecordedBetrayal> DiplomacyEngine::recordBetrayal(FactionId betrayer, BetrayalKind kind,
                                                         BetrayalMotivation motivation, std::string description,
                                                         const std::vector<FactionId>& victims, double nowDays) {
  using R = Result<RecordedBetrayal>;

  const auto traits = lookupTraits(attributes_, betrayer);
  if (!traits.ok()) return R::failure(traits.error, traits.message);

  std::vector<FactionId> targets;
  for (const FactionId v : victims) {
    if (v == betrayer) return R::failure(DiploError::ValidationError, "a faction cannot betray itself");
    if (std::find(targets.begin(), targets.end(), v) != targets.end()) continue;
    // Seeding a victim's pair needs valid traits; check them before any write.
    const auto victim = lookupTraits(attributes_, v);
    if (!victim.ok()) return R::failure(victim.error, victim.message);
    targets.push_back(v);
  }

  RecordedBetrayal out;
  out.event = makeBetrayalEvent(betrayer, traits.value, kind, motivation, std::move(description), nowDays,
                                params_.betrayalEvent);

  for (const FactionId v : targets) {
    InteractionInput in;
    in.initiator = betrayer;
    in.target = v;
    in.kind = InteractionKind::Betrayal;
    in.description = out.event.description;
    in.trustImpact = -out.event.trustDamage;
    in.reputationImpact = -out.event.severity;
    in.severity = out.event.severity;
    in.timeDays = nowDays;

    auto rec = ledger_.recordInteraction(in);
    if (!rec.ok()) {
      // Inputs were checked above; a failure here is a provider inconsistency.
      ENTENTE_LOG_ERROR("betrayal: recording against " + std::to_string(v) + " failed: " + rec.message);
      return R::failure(rec.error, rec.message);
    }
    out.interactions.push_back(std::move(rec.value));
  }

  ENTENTE_LOG_INFO("betrayal: faction " + std::to_string(betrayer) + " (" + betrayalKindName(kind) + ", " +
                   std::to_string(targets.size()) + " victims)");
  return R::success(std::move(out));
}

Result<NegotiationSession> DiplomacyEngine::initiateNegotiation(FactionId initiator,
                                                                const std::vector<FactionId>& targets,
                                                                AllianceType type, const TermOverrides& proposed,
                                                                double nowDays) {
  return negotiations_.initiate(initiator, targets, type, proposed, nowDays);
}

Result<ActionResult> DiplomacyEngine::advanceNegotiation(SessionId id, FactionId actor, NegotiationAction action,
                                                         const ActionParams& params, double nowDays) {
  auto r = negotiations_.advance(id, actor, action, params, nowDays);
  if (!r.ok()) ENTENTE_LOG_DEBUG("negotiation " + std::to_string(id) + ": " + r.message);
  return r;
}

Result<NegotiationSession> DiplomacyEngine::negotiationStatus(SessionId id, double nowDays) {
  return negotiations_.status(id, nowDays);
}

std::vector<SessionSummary> DiplomacyEngine::activeNegotiations(double nowDays, std::optional<FactionId> faction) {
  return negotiations_.listActive(nowDays, faction);
}

Result<RecordedInteraction> DiplomacyEngine::recordInteraction(const InteractionInput& input) {
  return ledger_.recordInteraction(input);
}

Result<double> DiplomacyEngine::replayInteractions(std::vector<InteractionInput> log) {
  std::stable_sort(log.begin(), log.end(), [](const InteractionInput& a, const InteractionInput& b) {
    return a.timeDays < b.timeDays;
  });

  double lastDay = 0.0;
  for (std::size_t i = 0; i < log.size(); ++i) {
    const auto r = ledger_.recordInteraction(log[i]);
    if (!r.ok()) {
      return Result<double>::failure(r.error, "record " + std::to_string(i + 1) + ": " + r.message);
    }
    lastDay = std::max(lastDay, log[i].timeDays);
  }
  ENTENTE_LOG_INFO("replayed " + std::to_string(log.size()) + " interactions");
  return Result<double>::success(lastDay);
}

Result<TrustEvolution> DiplomacyEngine::initializeTrust(FactionId a, FactionId b, double nowDays) {
  return ledger_.initialize(a, b, nowDays);
}

Result<RelationshipSummary> DiplomacyEngine::relationshipSummary(FactionId a, FactionId b, double nowDays) const {
  return analyzer_.summarize(a, b, nowDays);
}

Result<FactionReputation> DiplomacyEngine::factionReputation(FactionId faction,
                                                             const std::vector<FactionId>& counterparts,
                                                             double nowDays) const {
  return analyzer_.reputation(faction, counterparts, nowDays);
}

Result<NetworkAnalysis> DiplomacyEngine::analyzeNetwork(const std::vector<FactionId>& factions) const {
  return diplo::analyzeNetwork(attributes_, store_, factions, params_.network, params_.analyzer);
}

} // namespace entente::diplo
