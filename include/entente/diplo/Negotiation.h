#pragma once

#include "entente/diplo/AllianceTerms.h"
#include "entente/diplo/Errors.h"
#include "entente/diplo/Providers.h"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace entente::diplo {

// -----------------------------------------------------------------------------
// Multi-party alliance negotiation
// -----------------------------------------------------------------------------
//
// Phases:
//   Proposal -> CounterProposal -> TermsDiscussion -> FinalReview -> Ratification
//   -> {Completed | Rejected | Expired}
//
// Declared edges (anything else is refused):
//   Proposal        -> CounterProposal, TermsDiscussion, Ratification
//   CounterProposal -> TermsDiscussion, Ratification
//   TermsDiscussion -> FinalReview, Ratification
//   FinalReview     -> TermsDiscussion, Ratification
//   Ratification    -> Completed
//   non-terminal    -> Rejected, Expired
//
// Sessions live in NegotiationEngine's store keyed by id. A session is only
// mutated by advance() and by lazy expiry (advance/status/listActive notice a
// passed deadline); terminal sessions never change again.

using SessionId = core::u64;

enum class NegotiationPhase : core::u8 {
  Proposal        = 0,
  CounterProposal = 1,
  TermsDiscussion = 2,
  FinalReview     = 3,
  Ratification    = 4,
  Completed       = 5,
  Rejected        = 6,
  Expired         = 7,
};

inline constexpr int kNegotiationPhaseCount = 8;

const char* negotiationPhaseName(NegotiationPhase p);
bool isTerminalPhase(NegotiationPhase p);
bool isAllowedTransition(NegotiationPhase from, NegotiationPhase to);

// Ordered from least to most favourable; "improving" a stance moves one step up.
enum class NegotiationStance : core::u8 {
  Hostile    = 0,
  Reluctant  = 1,
  Cautious   = 2,
  Interested = 3,
  Eager      = 4,
};

const char* negotiationStanceName(NegotiationStance s);

// Eager 1.0, Interested 0.8, Cautious 0.5, Reluctant 0.2, Hostile 0.0.
double stanceScore(NegotiationStance s);
NegotiationStance improveStance(NegotiationStance s);

// Interested or Eager.
inline bool isAgreeableStance(NegotiationStance s) {
  return s == NegotiationStance::Interested || s == NegotiationStance::Eager;
}

// Automatic reply of a faction that has not acted yet.
enum class FactionResponse : core::u8 {
  Accept              = 0,
  CounterProposal     = 1,
  RequestDetails      = 2,
  ConditionalInterest = 3,
  Reject              = 4,
};

const char* factionResponseName(FactionResponse r);
const char* factionResponseMessage(FactionResponse r);
FactionResponse defaultResponse(NegotiationStance s);

enum class NegotiationAction : core::u8 {
  ProposeTerms        = 0,
  OfferConcession     = 1,
  RequestModification = 2,
  AcceptTerms         = 3,
  RejectTerms         = 4,
  Withdraw            = 5,
};

inline constexpr int kNegotiationActionCount = 6;

const char* negotiationActionName(NegotiationAction a);
bool tryParseNegotiationAction(std::string_view text, NegotiationAction& out);

// Actions a participant may take while the session is in `phase`.
// Ratification only admits the vote (accept/reject) and withdrawal; terminal
// phases admit nothing.
std::vector<NegotiationAction> availableActions(NegotiationPhase phase);

struct NegotiationPosition {
  FactionId faction{0};
  std::string name;

  NegotiationStance stance{NegotiationStance::Cautious};
  std::vector<TermKey> priorityTerms;
  std::vector<TermKey> dealBreakers; // violated while the provision is enabled
  std::vector<TermKey> requestedTerms;

  double trustRequirement{0.5};
  double benefitThreshold{0.3};
  double flexibility{0.5}; // [0,1]
  double timePressure{0.0};

  FactionResponse initialResponse{FactionResponse::RequestDetails};
  bool hasActed{false};

  // Terms version this faction accepted; 0 = none.
  core::u32 acceptedVersion{0};
};

enum class NegotiationEventKind : core::u8 {
  Initiated    = 0,
  Action       = 1,
  PhaseChanged = 2,
  Expired      = 3,
};

const char* negotiationEventKindName(NegotiationEventKind k);

struct NegotiationEvent {
  double timeDays{0.0};
  int round{0};
  NegotiationEventKind kind{NegotiationEventKind::Action};
  FactionId actor{0};
  std::optional<NegotiationAction> action;
  NegotiationPhase from{NegotiationPhase::Proposal};
  NegotiationPhase to{NegotiationPhase::Proposal};
  std::string detail;
};

struct NegotiationSession {
  SessionId id{0};
  FactionId initiator{0};
  std::vector<FactionId> participants; // initiator first, then targets in request order

  NegotiationPhase phase{NegotiationPhase::Proposal};
  AllianceTerms terms;
  std::map<FactionId, NegotiationPosition> positions;
  std::vector<NegotiationEvent> events; // append-only

  int roundsCompleted{0};
  int maxRounds{10};
  double createdDays{0.0};
  double deadlineDays{0.0};
  double consensusThreshold{0.75};

  double successProbability{0.0};

  bool isParticipant(FactionId f) const;
  const NegotiationPosition* position(FactionId f) const;
};

struct NegotiationParams {
  int minParticipants{2};
  int maxParticipants{8};
  double durationDays{30.0};
  int maxRounds{10};
  double consensusThreshold{0.75};

  // Stance derivation (raw trait values).
  int eagerAmbitionMin{8};
  int eagerPragmatismMin{6};
  int interestedPragmatismMin{7};
  int cautiousPragmatismMin{4};
  int reluctantAmbitionMax{3};

  // Priorities / deal-breakers.
  int offensivePriorityAmbitionMin{7};
  int defensePriorityDisciplineMin{6};
  int offensiveDealBreakerIntegrityMin{8};

  // trust = base + integrity/div, benefit = base + ambition/div.
  double trustRequirementBase{0.3};
  double trustRequirementIntegrityDiv{20.0};
  double benefitThresholdBase{0.1};
  double benefitThresholdAmbitionDiv{25.0};

  // Flexibility lost by the faction offering a concession.
  double concessionFlexibilityCost{0.1};
};

NegotiationStance deriveStance(const TraitVector& traits, AllianceType type,
                               const NegotiationParams& params = NegotiationParams{});

NegotiationPosition buildNegotiationPosition(const FactionSnapshot& faction, AllianceType type,
                                             const NegotiationParams& params = NegotiationParams{});

// Mean stance score over participants; 0 for an empty session.
double negotiationSuccessProbability(const NegotiationSession& s);

// Participants whose deal-breakers the current terms violate.
std::vector<FactionId> dealBreakerViolations(const NegotiationSession& s);

// Share of participants with an agreeable stance and no violated deal-breaker.
double agreeingFraction(const NegotiationSession& s);

// Optional payload of advance().
struct ActionParams {
  TermOverrides overrides;             // ProposeTerms / OfferConcession
  std::vector<TermKey> requestedTerms; // RequestModification
  std::string note;
};

struct InitialResponse {
  FactionId faction{0};
  FactionResponse response{FactionResponse::RequestDetails};
};

struct ActionResult {
  SessionId sessionId{0};
  FactionId actor{0};
  NegotiationAction action{NegotiationAction::AcceptTerms};

  NegotiationPhase phaseBefore{NegotiationPhase::Proposal};
  NegotiationPhase phase{NegotiationPhase::Proposal};

  int roundsCompleted{0};
  double successProbability{0.0};
  core::u32 termsVersion{1};

  // What the actor may do next (empty once terminal).
  std::vector<NegotiationAction> availableActions;
};

struct SessionSummary {
  SessionId id{0};
  NegotiationPhase phase{NegotiationPhase::Proposal};
  std::vector<FactionId> participants;
  AllianceType type{AllianceType::Cooperation};
  double deadlineDays{0.0};
  int roundsCompleted{0};
  double successProbability{0.0};
};

// Owns the session store.
//
// Concurrency: one mutex per session serializes writers on that session;
// different sessions proceed in parallel. Readers (status, listActive) get
// copies taken under the session mutex.
class NegotiationEngine {
public:
  explicit NegotiationEngine(const AttributeProvider& attributes,
                             NegotiationParams params = NegotiationParams{});

  NegotiationEngine(const NegotiationEngine&) = delete;
  NegotiationEngine& operator=(const NegotiationEngine&) = delete;

  const NegotiationParams& params() const { return params_; }

  // Errors: InsufficientParticipants / TooManyParticipants, ValidationError
  // (duplicate or self-targeted ids, invalid overrides), NotFound.
  Result<NegotiationSession> initiate(FactionId initiator,
                                      const std::vector<FactionId>& targets,
                                      AllianceType type,
                                      const TermOverrides& proposed,
                                      double nowDays);

  // Errors: NotFound, NotAParticipant, SessionClosed (terminal, or expired by
  // this very call), ValidationError (action not available in the current
  // phase, invalid overrides). Failed calls leave the session untouched apart
  // from lazy expiry.
  Result<ActionResult> advance(SessionId id, FactionId actor, NegotiationAction action,
                               const ActionParams& params, double nowDays);

  // Snapshot after lazy expiry. Two calls without an intervening advance
  // return identical data.
  Result<NegotiationSession> status(SessionId id, double nowDays);

  // Non-terminal sessions only, ordered by id. With `faction`, only sessions
  // it participates in.
  std::vector<SessionSummary> listActive(double nowDays, std::optional<FactionId> faction = std::nullopt);

  std::size_t sessionCount() const;

private:
  struct Slot {
    std::mutex mutex;
    NegotiationSession session;
  };

  std::shared_ptr<Slot> findSlot(SessionId id) const;

  const AttributeProvider& attributes_;
  NegotiationParams params_;

  mutable std::mutex registryMutex_;
  std::map<SessionId, std::shared_ptr<Slot>> sessions_;
  SessionId nextId_{1};
};

} // namespace entente::diplo
