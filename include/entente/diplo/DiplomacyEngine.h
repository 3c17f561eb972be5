#pragma once

#include "entente/core/Random.h"
#include "entente/diplo/AllianceFormation.h"
#include "entente/diplo/BetrayalRisk.h"
#include "entente/diplo/DiplomacyConfig.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/NetworkAnalyzer.h"
#include "entente/diplo/RelationshipAnalyzer.h"
#include "entente/diplo/TrustLedger.h"

#include <optional>
#include <string>
#include <vector>

namespace entente::diplo {

struct RecordedBetrayal {
  BetrayalEvent event;
  // One Betrayal interaction per victim, in the order given.
  std::vector<RecordedInteraction> interactions;
};

// Facade bundling every exposed operation over one set of capabilities.
//
// The engine borrows the providers and the store; they must outlive it.
// Stochastic operations take the caller's generator.
class DiplomacyEngine {
public:
  DiplomacyEngine(const AttributeProvider& attributes, const DiplomacyStatusProvider& status,
                  RelationshipStore& store, DiplomacyParams params = DiplomacyParams{});

  DiplomacyEngine(const DiplomacyEngine&) = delete;
  DiplomacyEngine& operator=(const DiplomacyEngine&) = delete;

  const DiplomacyParams& params() const { return params_; }

  // --- alliance formation / risk ---
  Result<AllianceOpportunity> evaluateAlliance(FactionId a, FactionId b,
                                               const std::vector<FactionId>& commonThreats,
                                               std::optional<AllianceType> requestedType,
                                               core::SplitMix64& rng) const;

  Result<BetrayalAssessment> evaluateBetrayal(FactionId faction, const ExternalFactors& factors,
                                              const std::vector<FactionId>& otherMembers) const;

  // Builds the event from the betrayer's traits and records a Betrayal
  // interaction (impact = -trustDamage) against every victim. Victims are
  // checked before anything is recorded.
  Result<RecordedBetrayal> recordBetrayal(FactionId betrayer, BetrayalKind kind, BetrayalMotivation motivation,
                                          std::string description, const std::vector<FactionId>& victims,
                                          double nowDays);

  // --- negotiation ---
  Result<NegotiationSession> initiateNegotiation(FactionId initiator, const std::vector<FactionId>& targets,
                                                 AllianceType type, const TermOverrides& proposed, double nowDays);
  Result<ActionResult> advanceNegotiation(SessionId id, FactionId actor, NegotiationAction action,
                                          const ActionParams& params, double nowDays);
  Result<NegotiationSession> negotiationStatus(SessionId id, double nowDays);
  std::vector<SessionSummary> activeNegotiations(double nowDays, std::optional<FactionId> faction = std::nullopt);

  // --- trust / relationships ---
  Result<RecordedInteraction> recordInteraction(const InteractionInput& input);

  // Records a logged history oldest first (stable for equal days) and returns
  // the latest day seen. Stops at the first rejected record; records before it
  // stay applied and the message names the 1-based record.
  Result<double> replayInteractions(std::vector<InteractionInput> log);

  Result<TrustEvolution> initializeTrust(FactionId a, FactionId b, double nowDays);
  Result<RelationshipSummary> relationshipSummary(FactionId a, FactionId b, double nowDays) const;
  Result<FactionReputation> factionReputation(FactionId faction, const std::vector<FactionId>& counterparts,
                                              double nowDays) const;
  Result<NetworkAnalysis> analyzeNetwork(const std::vector<FactionId>& factions) const;

  NegotiationEngine& negotiations() { return negotiations_; }
  TrustLedger& ledger() { return ledger_; }

private:
  const AttributeProvider& attributes_;
  RelationshipStore& store_;
  DiplomacyParams params_;

  NegotiationEngine negotiations_;
  TrustLedger ledger_;
  RelationshipAnalyzer analyzer_;
};

} // namespace entente::diplo
