#include "entente/diplo/Negotiation.h"

#include "entente/core/Clamp.h"
#include "entente/core/Log.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace entente::diplo {

const char* negotiationPhaseName(NegotiationPhase p) {
  switch (p) {
    case NegotiationPhase::Proposal: return "proposal";
    case NegotiationPhase::CounterProposal: return "counter_proposal";
    case NegotiationPhase::TermsDiscussion: return "terms_discussion";
    case NegotiationPhase::FinalReview: return "final_review";
    case NegotiationPhase::Ratification: return "ratification";
    case NegotiationPhase::Completed: return "completed";
    case NegotiationPhase::Rejected: return "rejected";
    case NegotiationPhase::Expired: return "expired";
  }
  return "unknown";
}

bool isTerminalPhase(NegotiationPhase p) {
  switch (p) {
    case NegotiationPhase::Completed:
    case NegotiationPhase::Rejected:
    case NegotiationPhase::Expired:
      return true;
    case NegotiationPhase::Proposal:
    case NegotiationPhase::CounterProposal:
    case NegotiationPhase::TermsDiscussion:
    case NegotiationPhase::FinalReview:
    case NegotiationPhase::Ratification:
      return false;
  }
  return true;
}

bool isAllowedTransition(NegotiationPhase from, NegotiationPhase to) {
  if (isTerminalPhase(from)) return false;
  if (to == NegotiationPhase::Rejected || to == NegotiationPhase::Expired) return true;

  switch (from) {
    case NegotiationPhase::Proposal:
      return to == NegotiationPhase::CounterProposal || to == NegotiationPhase::TermsDiscussion ||
             to == NegotiationPhase::Ratification;
    case NegotiationPhase::CounterProposal:
      return to == NegotiationPhase::TermsDiscussion || to == NegotiationPhase::Ratification;
    case NegotiationPhase::TermsDiscussion:
      return to == NegotiationPhase::FinalReview || to == NegotiationPhase::Ratification;
    case NegotiationPhase::FinalReview:
      return to == NegotiationPhase::TermsDiscussion || to == NegotiationPhase::Ratification;
    case NegotiationPhase::Ratification:
      return to == NegotiationPhase::Completed;
    case NegotiationPhase::Completed:
    case NegotiationPhase::Rejected:
    case NegotiationPhase::Expired:
      return false;
  }
  return false;
}

const char* negotiationStanceName(NegotiationStance s) {
  switch (s) {
    case NegotiationStance::Hostile: return "hostile";
    case NegotiationStance::Reluctant: return "reluctant";
    case NegotiationStance::Cautious: return "cautious";
    case NegotiationStance::Interested: return "interested";
    case NegotiationStance::Eager: return "eager";
  }
  return "unknown";
}

double stanceScore(NegotiationStance s) {
  switch (s) {
    case NegotiationStance::Eager: return 1.0;
    case NegotiationStance::Interested: return 0.8;
    case NegotiationStance::Cautious: return 0.5;
    case NegotiationStance::Reluctant: return 0.2;
    case NegotiationStance::Hostile: return 0.0;
  }
  return 0.0;
}

NegotiationStance improveStance(NegotiationStance s) {
  switch (s) {
    case NegotiationStance::Hostile: return NegotiationStance::Reluctant;
    case NegotiationStance::Reluctant: return NegotiationStance::Cautious;
    case NegotiationStance::Cautious: return NegotiationStance::Interested;
    case NegotiationStance::Interested:
    case NegotiationStance::Eager:
      return NegotiationStance::Eager;
  }
  return s;
}

const char* factionResponseName(FactionResponse r) {
  switch (r) {
    case FactionResponse::Accept: return "accept";
    case FactionResponse::CounterProposal: return "counter_proposal";
    case FactionResponse::RequestDetails: return "request_details";
    case FactionResponse::ConditionalInterest: return "conditional_interest";
    case FactionResponse::Reject: return "reject";
  }
  return "unknown";
}

const char* factionResponseMessage(FactionResponse r) {
  switch (r) {
    case FactionResponse::Accept: return "We are very interested in this alliance";
    case FactionResponse::CounterProposal: return "We're interested but have some concerns";
    case FactionResponse::RequestDetails: return "We need more information before proceeding";
    case FactionResponse::ConditionalInterest: return "We might consider under certain conditions";
    case FactionResponse::Reject: return "We are not interested in this alliance";
  }
  return "";
}

FactionResponse defaultResponse(NegotiationStance s) {
  switch (s) {
    case NegotiationStance::Eager: return FactionResponse::Accept;
    case NegotiationStance::Interested: return FactionResponse::CounterProposal;
    case NegotiationStance::Cautious: return FactionResponse::RequestDetails;
    case NegotiationStance::Reluctant: return FactionResponse::ConditionalInterest;
    case NegotiationStance::Hostile: return FactionResponse::Reject;
  }
  return FactionResponse::Reject;
}

const char* negotiationActionName(NegotiationAction a) {
  switch (a) {
    case NegotiationAction::ProposeTerms: return "propose_terms";
    case NegotiationAction::OfferConcession: return "offer_concession";
    case NegotiationAction::RequestModification: return "request_modification";
    case NegotiationAction::AcceptTerms: return "accept_terms";
    case NegotiationAction::RejectTerms: return "reject_terms";
    case NegotiationAction::Withdraw: return "withdraw";
  }
  return "unknown";
}

bool tryParseNegotiationAction(std::string_view text, NegotiationAction& out) {
  std::string k;
  k.reserve(text.size());
  for (const char c : text) k.push_back((char)std::tolower((unsigned char)c));
  for (int i = 0; i < kNegotiationActionCount; ++i) {
    const auto a = static_cast<NegotiationAction>(i);
    if (k == negotiationActionName(a)) {
      out = a;
      return true;
    }
  }
  // Short forms used in scripts.
  if (k == "propose") { out = NegotiationAction::ProposeTerms; return true; }
  if (k == "concede") { out = NegotiationAction::OfferConcession; return true; }
  if (k == "modify") { out = NegotiationAction::RequestModification; return true; }
  if (k == "accept") { out = NegotiationAction::AcceptTerms; return true; }
  if (k == "reject") { out = NegotiationAction::RejectTerms; return true; }
  return false;
}

std::vector<NegotiationAction> availableActions(NegotiationPhase phase) {
  if (isTerminalPhase(phase)) return {};
  if (phase == NegotiationPhase::Ratification) {
    return {NegotiationAction::AcceptTerms, NegotiationAction::RejectTerms, NegotiationAction::Withdraw};
  }
  return {NegotiationAction::ProposeTerms, NegotiationAction::OfferConcession,
          NegotiationAction::RequestModification, NegotiationAction::AcceptTerms,
          NegotiationAction::RejectTerms, NegotiationAction::Withdraw};
}

const char* negotiationEventKindName(NegotiationEventKind k) {
  switch (k) {
    case NegotiationEventKind::Initiated: return "initiated";
    case NegotiationEventKind::Action: return "action";
    case NegotiationEventKind::PhaseChanged: return "phase_changed";
    case NegotiationEventKind::Expired: return "expired";
  }
  return "unknown";
}

bool NegotiationSession::isParticipant(FactionId f) const {
  return std::find(participants.begin(), participants.end(), f) != participants.end();
}

const NegotiationPosition* NegotiationSession::position(FactionId f) const {
  const auto it = positions.find(f);
  return (it != positions.end()) ? &it->second : nullptr;
}

NegotiationStance deriveStance(const TraitVector& traits, AllianceType /*type*/, const NegotiationParams& params) {
  if (traits.ambition >= params.eagerAmbitionMin && traits.pragmatism >= params.eagerPragmatismMin) {
    return NegotiationStance::Eager;
  }
  if (traits.pragmatism >= params.interestedPragmatismMin) return NegotiationStance::Interested;
  if (traits.pragmatism >= params.cautiousPragmatismMin) return NegotiationStance::Cautious;
  if (traits.ambition <= params.reluctantAmbitionMax) return NegotiationStance::Reluctant;
  return NegotiationStance::Hostile;
}

NegotiationPosition buildNegotiationPosition(const FactionSnapshot& faction, AllianceType type,
                                             const NegotiationParams& params) {
  const TraitVector& t = faction.traits;

  NegotiationPosition p;
  p.faction = faction.id;
  p.name = faction.name;
  p.stance = deriveStance(t, type, params);

  if (t.ambition >= params.offensivePriorityAmbitionMin) p.priorityTerms.push_back(TermKey::OffensiveCoordination);
  if (t.discipline >= params.defensePriorityDisciplineMin) p.priorityTerms.push_back(TermKey::MutualDefense);
  if (t.integrity >= params.offensiveDealBreakerIntegrityMin) p.dealBreakers.push_back(TermKey::OffensiveCoordination);

  p.trustRequirement = params.trustRequirementBase + static_cast<double>(t.integrity) / params.trustRequirementIntegrityDiv;
  p.flexibility = core::clamp01(static_cast<double>(t.pragmatism + (kTraitMax - t.discipline)) / 20.0);
  p.benefitThreshold = params.benefitThresholdBase + static_cast<double>(t.ambition) / params.benefitThresholdAmbitionDiv;
  p.initialResponse = defaultResponse(p.stance);
  return p;
}

double negotiationSuccessProbability(const NegotiationSession& s) {
  if (s.positions.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& kv : s.positions) sum += stanceScore(kv.second.stance);
  return core::clamp01(sum / static_cast<double>(s.positions.size()));
}

static bool violatesDealBreaker(const NegotiationPosition& p, const AllianceTerms& terms) {
  for (const TermKey k : p.dealBreakers) {
    if (termEnabled(terms, k)) return true;
  }
  return false;
}

std::vector<FactionId> dealBreakerViolations(const NegotiationSession& s) {
  std::vector<FactionId> out;
  for (const FactionId f : s.participants) {
    const NegotiationPosition* p = s.position(f);
    if (p && violatesDealBreaker(*p, s.terms)) out.push_back(f);
  }
  return out;
}

double agreeingFraction(const NegotiationSession& s) {
  if (s.participants.empty()) return 0.0;
  int agreeing = 0;
  for (const FactionId f : s.participants) {
    const NegotiationPosition* p = s.position(f);
    if (p && isAgreeableStance(p->stance) && !violatesDealBreaker(*p, s.terms)) ++agreeing;
  }
  return static_cast<double>(agreeing) / static_cast<double>(s.participants.size());
}

// -----------------------------------------------------------------------------
// Session mutation helpers (called with the session mutex held)
// -----------------------------------------------------------------------------

static void appendEvent(NegotiationSession& s, double nowDays, NegotiationEventKind kind, FactionId actor,
                        std::optional<NegotiationAction> action, NegotiationPhase from, NegotiationPhase to,
                        std::string detail) {
  NegotiationEvent e;
  e.timeDays = nowDays;
  e.round = s.roundsCompleted;
  e.kind = kind;
  e.actor = actor;
  e.action = action;
  e.from = from;
  e.to = to;
  e.detail = std::move(detail);
  s.events.push_back(std::move(e));
}

static bool transition(NegotiationSession& s, NegotiationPhase to, double nowDays, FactionId actor,
                       const char* reason) {
  if (s.phase == to) return true;
  if (!isAllowedTransition(s.phase, to)) return false;

  const NegotiationPhase from = s.phase;
  s.phase = to;
  appendEvent(s, nowDays,
              (to == NegotiationPhase::Expired) ? NegotiationEventKind::Expired : NegotiationEventKind::PhaseChanged,
              actor, std::nullopt, from, to, reason);

  ENTENTE_LOG_DEBUG("negotiation " + std::to_string(s.id) + ": " + negotiationPhaseName(from) + " -> " +
                    negotiationPhaseName(to) + " (" + reason + ")");
  return true;
}

static bool expireIfDue(NegotiationSession& s, double nowDays) {
  if (isTerminalPhase(s.phase) || !(nowDays > s.deadlineDays)) return false;
  return transition(s, NegotiationPhase::Expired, nowDays, 0, "deadline passed");
}

static bool allAccepted(const NegotiationSession& s) {
  for (const FactionId f : s.participants) {
    const NegotiationPosition* p = s.position(f);
    if (!p || p->acceptedVersion != s.terms.version) return false;
  }
  return true;
}

static SessionSummary summarize(const NegotiationSession& s) {
  SessionSummary out;
  out.id = s.id;
  out.phase = s.phase;
  out.participants = s.participants;
  out.type = s.terms.type;
  out.deadlineDays = s.deadlineDays;
  out.roundsCompleted = s.roundsCompleted;
  out.successProbability = s.successProbability;
  return out;
}

// -----------------------------------------------------------------------------
// NegotiationEngine
// -----------------------------------------------------------------------------

NegotiationEngine::NegotiationEngine(const AttributeProvider& attributes, NegotiationParams params)
  : attributes_(attributes), params_(std::move(params)) {}

std::shared_ptr<NegotiationEngine::Slot> NegotiationEngine::findSlot(SessionId id) const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  const auto it = sessions_.find(id);
  return (it != sessions_.end()) ? it->second : nullptr;
}

std::size_t NegotiationEngine::sessionCount() const {
  std::lock_guard<std::mutex> lock(registryMutex_);
  return sessions_.size();
}

Result<NegotiationSession> NegotiationEngine::initiate(FactionId initiator,
                                                       const std::vector<FactionId>& targets,
                                                       AllianceType type,
                                                       const TermOverrides& proposed,
                                                       double nowDays) {
  using R = Result<NegotiationSession>;

  std::vector<FactionId> participants;
  participants.reserve(targets.size() + 1);
  participants.push_back(initiator);
  participants.insert(participants.end(), targets.begin(), targets.end());

  const int count = static_cast<int>(participants.size());
  if (count < params_.minParticipants) {
    ENTENTE_LOG_DEBUG("negotiation: refused, " + std::to_string(count) + " participant(s)");
    return R::failure(DiploError::InsufficientParticipants,
                      "need at least " + std::to_string(params_.minParticipants) + " participants");
  }
  if (count > params_.maxParticipants) {
    ENTENTE_LOG_DEBUG("negotiation: refused, " + std::to_string(count) + " participants");
    return R::failure(DiploError::TooManyParticipants,
                      "at most " + std::to_string(params_.maxParticipants) + " participants allowed");
  }

  {
    std::vector<FactionId> sorted = participants;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
      return R::failure(DiploError::ValidationError, "participants must be distinct (no self-targeting)");
    }
  }

  std::string err;
  AllianceTerms terms;
  if (!applyTermOverrides(defaultAllianceTerms(type), proposed, terms, &err)) {
    return R::failure(DiploError::ValidationError, "proposed terms: " + err);
  }
  terms.version = 1;

  std::vector<FactionSnapshot> snapshots;
  snapshots.reserve(participants.size());
  for (const FactionId f : participants) {
    auto snap = attributes_.getFaction(f);
    if (!snap) {
      ENTENTE_LOG_DEBUG("negotiation: unknown faction " + std::to_string(f));
      return R::failure(DiploError::NotFound, "faction " + std::to_string(f) + " not found");
    }
    if (!validateTraits(snap->traits, &err)) {
      return R::failure(DiploError::ValidationError, "faction " + std::to_string(f) + ": " + err);
    }
    snapshots.push_back(std::move(*snap));
  }

  NegotiationSession s;
  s.initiator = initiator;
  s.participants = participants;
  s.phase = NegotiationPhase::Proposal;
  s.terms = std::move(terms);
  s.maxRounds = params_.maxRounds;
  s.createdDays = nowDays;
  s.deadlineDays = nowDays + params_.durationDays;
  s.consensusThreshold = params_.consensusThreshold;

  for (const auto& snap : snapshots) {
    s.positions[snap.id] = buildNegotiationPosition(snap, type, params_);
  }
  s.successProbability = negotiationSuccessProbability(s);

  auto slot = std::make_shared<Slot>();
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    s.id = nextId_++;

    std::ostringstream detail;
    detail << allianceTypeName(type) << " alliance, " << count << " participants";
    appendEvent(s, nowDays, NegotiationEventKind::Initiated, initiator, std::nullopt,
                NegotiationPhase::Proposal, NegotiationPhase::Proposal, detail.str());

    slot->session = s;
    sessions_[s.id] = slot;
  }

  ENTENTE_LOG_INFO("negotiation " + std::to_string(s.id) + ": initiated by " + std::to_string(initiator) + " (" +
                   allianceTypeName(type) + ", " + std::to_string(count) + " participants)");
  return R::success(std::move(s));
}

Result<ActionResult> NegotiationEngine::advance(SessionId id, FactionId actor, NegotiationAction action,
                                                const ActionParams& params, double nowDays) {
  using R = Result<ActionResult>;

  const auto slot = findSlot(id);
  if (!slot) return R::failure(DiploError::NotFound, "negotiation " + std::to_string(id) + " not found");

  std::lock_guard<std::mutex> lock(slot->mutex);
  NegotiationSession& live = slot->session;

  if (!live.isParticipant(actor)) {
    return R::failure(DiploError::NotAParticipant,
                      "faction " + std::to_string(actor) + " is not part of negotiation " + std::to_string(id));
  }
  if (isTerminalPhase(live.phase)) {
    return R::failure(DiploError::SessionClosed,
                      std::string("negotiation is ") + negotiationPhaseName(live.phase));
  }
  if (expireIfDue(live, nowDays)) {
    ENTENTE_LOG_INFO("negotiation " + std::to_string(id) + ": expired");
    return R::failure(DiploError::SessionClosed, "negotiation expired");
  }

  const auto allowed = availableActions(live.phase);
  if (std::find(allowed.begin(), allowed.end(), action) == allowed.end()) {
    return R::failure(DiploError::ValidationError,
                      std::string(negotiationActionName(action)) + " is not available during " +
                        negotiationPhaseName(live.phase));
  }

  // Work on a copy; commit only if every step succeeded.
  NegotiationSession s = live;
  const NegotiationPhase before = s.phase;
  NegotiationPosition& pos = s.positions[actor];
  bool ok = true;
  std::string err;

  switch (action) {
    case NegotiationAction::ProposeTerms:
    case NegotiationAction::OfferConcession: {
      AllianceTerms next;
      if (!applyTermOverrides(s.terms, params.overrides, next, &err)) {
        return R::failure(DiploError::ValidationError, "terms: " + err);
      }
      next.version = s.terms.version + 1;
      s.terms = std::move(next);

      for (auto& kv : s.positions) {
        kv.second.acceptedVersion = (kv.first == actor) ? s.terms.version : 0u;
      }

      if (action == NegotiationAction::OfferConcession) {
        for (auto& kv : s.positions) {
          if (kv.first != actor) kv.second.stance = improveStance(kv.second.stance);
        }
        pos.flexibility = std::max(0.0, pos.flexibility - params_.concessionFlexibilityCost);
        ok = transition(s, NegotiationPhase::TermsDiscussion, nowDays, actor, "concession offered");
      } else if (s.phase == NegotiationPhase::Proposal && actor != s.initiator) {
        ok = transition(s, NegotiationPhase::CounterProposal, nowDays, actor, "counter-proposal");
      } else if (s.phase != NegotiationPhase::TermsDiscussion) {
        ok = transition(s, NegotiationPhase::TermsDiscussion, nowDays, actor, "terms proposed");
      }
      break;
    }
    case NegotiationAction::RequestModification:
      for (const TermKey k : params.requestedTerms) {
        if (std::find(pos.requestedTerms.begin(), pos.requestedTerms.end(), k) == pos.requestedTerms.end()) {
          pos.requestedTerms.push_back(k);
        }
      }
      ok = transition(s, NegotiationPhase::TermsDiscussion, nowDays, actor, "modification requested");
      break;
    case NegotiationAction::AcceptTerms:
      pos.acceptedVersion = s.terms.version;
      if (!isAgreeableStance(pos.stance)) pos.stance = NegotiationStance::Interested;
      if (s.phase == NegotiationPhase::TermsDiscussion) {
        ok = transition(s, NegotiationPhase::FinalReview, nowDays, actor, "terms accepted");
      } else if (s.phase == NegotiationPhase::Ratification && allAccepted(s)) {
        ok = transition(s, NegotiationPhase::Completed, nowDays, actor, "ratified by all participants");
      }
      break;
    case NegotiationAction::RejectTerms:
      pos.stance = NegotiationStance::Hostile;
      pos.acceptedVersion = 0;
      if (s.phase == NegotiationPhase::Ratification) {
        ok = transition(s, NegotiationPhase::Rejected, nowDays, actor, "ratification vote failed");
      }
      break;
    case NegotiationAction::Withdraw:
      ok = transition(s, NegotiationPhase::Rejected, nowDays, actor, "participant withdrew");
      break;
  }
  pos.hasActed = true;

  {
    std::string detail = params.note;
    if (action == NegotiationAction::ProposeTerms || action == NegotiationAction::OfferConcession) {
      if (!detail.empty()) detail += "; ";
      detail += "terms v" + std::to_string(s.terms.version);
    }
    appendEvent(s, nowDays, NegotiationEventKind::Action, actor, action, before, s.phase, detail);
  }

  if (ok && !isTerminalPhase(s.phase)) {
    if (!dealBreakerViolations(s).empty()) {
      ok = transition(s, NegotiationPhase::Rejected, nowDays, actor, "deal-breaker violated");
    } else if (s.phase != NegotiationPhase::Ratification && agreeingFraction(s) >= s.consensusThreshold) {
      ok = transition(s, NegotiationPhase::Ratification, nowDays, actor, "consensus reached");
    }
  }

  if (!ok) {
    // Unreachable while the rules above only use declared edges.
    ENTENTE_LOG_ERROR("negotiation " + std::to_string(id) + ": undeclared phase transition refused");
    return R::failure(DiploError::ValidationError, "action would leave the declared phase graph");
  }

  s.roundsCompleted = std::min(s.roundsCompleted + 1, s.maxRounds);

  if (!isTerminalPhase(s.phase)) {
    if (nowDays > s.deadlineDays) {
      transition(s, NegotiationPhase::Expired, nowDays, actor, "deadline passed");
    } else if (s.roundsCompleted >= s.maxRounds && s.phase != NegotiationPhase::Ratification) {
      // Consensus already reached; ratification votes may run past the round limit.
      transition(s, NegotiationPhase::Expired, nowDays, actor, "round limit reached");
    }
  }

  s.successProbability = negotiationSuccessProbability(s);

  ActionResult out;
  out.sessionId = id;
  out.actor = actor;
  out.action = action;
  out.phaseBefore = before;
  out.phase = s.phase;
  out.roundsCompleted = s.roundsCompleted;
  out.successProbability = s.successProbability;
  out.termsVersion = s.terms.version;
  out.availableActions = availableActions(s.phase);

  live = std::move(s);

  if (isTerminalPhase(out.phase)) {
    ENTENTE_LOG_INFO("negotiation " + std::to_string(id) + ": " + negotiationPhaseName(out.phase));
  }
  return R::success(std::move(out));
}

Result<NegotiationSession> NegotiationEngine::status(SessionId id, double nowDays) {
  using R = Result<NegotiationSession>;
  const auto slot = findSlot(id);
  if (!slot) return R::failure(DiploError::NotFound, "negotiation " + std::to_string(id) + " not found");

  std::lock_guard<std::mutex> lock(slot->mutex);
  if (expireIfDue(slot->session, nowDays)) {
    slot->session.successProbability = negotiationSuccessProbability(slot->session);
    ENTENTE_LOG_INFO("negotiation " + std::to_string(id) + ": expired");
  }
  return R::success(slot->session);
}

std::vector<SessionSummary> NegotiationEngine::listActive(double nowDays, std::optional<FactionId> faction) {
  std::vector<std::shared_ptr<Slot>> slots;
  {
    std::lock_guard<std::mutex> lock(registryMutex_);
    slots.reserve(sessions_.size());
    for (const auto& kv : sessions_) slots.push_back(kv.second);
  }

  std::vector<SessionSummary> out;
  for (const auto& slot : slots) {
    std::lock_guard<std::mutex> lock(slot->mutex);
    NegotiationSession& s = slot->session;
    expireIfDue(s, nowDays);
    if (isTerminalPhase(s.phase)) continue;
    if (faction && !s.isParticipant(*faction)) continue;
    out.push_back(summarize(s));
  }
  return out;
}

} // namespace entente::diplo
