#pragma once

#include "entente/core/StableHash.h"
#include "entente/diplo/AllianceTerms.h"
#include "entente/diplo/Negotiation.h"
#include "entente/diplo/Relationship.h"

namespace entente::diplo {

// Stable 64-bit signatures of engine state.
//
// Used by tests and by the tool's --signature output to compare snapshots
// (status idempotence, regression checks) without field-by-field equality.

inline void signatureStrings(core::StableHash64& h, const std::vector<std::string>& v) {
  h.addU64(static_cast<core::u64>(v.size()));
  for (const auto& s : v) h.addString(s);
}

inline void signatureAllianceTerms(core::StableHash64& h, const AllianceTerms& t) {
  h.addString(t.name);
  h.addU8(static_cast<core::u8>(t.type));
  h.addBool(t.durationMonths.has_value());
  h.addInt(t.durationMonths.value_or(0));
  h.addBool(t.autoRenew);

  for (int i = 0; i < kTermKeyCount; ++i) h.addBool(termEnabled(t, static_cast<TermKey>(i)));
  h.addDoubleQ(t.military.supportLevel);
  h.addDoubleQ(t.economic.supportLevel);
  h.addU64(static_cast<core::u64>(t.economic.resourceSharing.size()));
  for (const auto& kv : t.economic.resourceSharing) {
    h.addString(kv.first);
    h.addDoubleQ(kv.second);
  }
  signatureStrings(h, t.territorial.accessRegions);

  signatureStrings(h, t.exitClauses);
  h.addBool(t.reviewSchedule.has_value());
  h.addString(t.reviewSchedule.value_or(std::string{}));
  h.addString(t.disputeResolution);
  signatureStrings(h, t.activationTriggers);
  signatureStrings(h, t.suspensionConditions);
  h.addU32(t.version);
}

inline core::u64 signatureAllianceTerms(const AllianceTerms& t) {
  core::StableHash64 h;
  signatureAllianceTerms(h, t);
  return h.value();
}

inline void signatureNegotiationPosition(core::StableHash64& h, const NegotiationPosition& p) {
  h.addU64(p.faction);
  h.addString(p.name);
  h.addU8(static_cast<core::u8>(p.stance));
  h.addU64(static_cast<core::u64>(p.priorityTerms.size()));
  for (const TermKey k : p.priorityTerms) h.addU8(static_cast<core::u8>(k));
  h.addU64(static_cast<core::u64>(p.dealBreakers.size()));
  for (const TermKey k : p.dealBreakers) h.addU8(static_cast<core::u8>(k));
  h.addU64(static_cast<core::u64>(p.requestedTerms.size()));
  for (const TermKey k : p.requestedTerms) h.addU8(static_cast<core::u8>(k));
  h.addDoubleQ(p.trustRequirement);
  h.addDoubleQ(p.benefitThreshold);
  h.addDoubleQ(p.flexibility);
  h.addDoubleQ(p.timePressure);
  h.addU8(static_cast<core::u8>(p.initialResponse));
  h.addBool(p.hasActed);
  h.addU32(p.acceptedVersion);
}

inline core::u64 signatureNegotiationSession(const NegotiationSession& s) {
  core::StableHash64 h;
  h.addU64(s.id);
  h.addU64(s.initiator);
  h.addU64(static_cast<core::u64>(s.participants.size()));
  for (const FactionId f : s.participants) h.addU64(f);
  h.addU8(static_cast<core::u8>(s.phase));
  signatureAllianceTerms(h, s.terms);

  h.addU64(static_cast<core::u64>(s.positions.size()));
  for (const auto& kv : s.positions) signatureNegotiationPosition(h, kv.second);

  h.addU64(static_cast<core::u64>(s.events.size()));
  for (const auto& e : s.events) {
    h.addDoubleQ(e.timeDays);
    h.addInt(e.round);
    h.addU8(static_cast<core::u8>(e.kind));
    h.addU64(e.actor);
    h.addBool(e.action.has_value());
    h.addU8(e.action ? static_cast<core::u8>(*e.action) : 0u);
    h.addU8(static_cast<core::u8>(e.from));
    h.addU8(static_cast<core::u8>(e.to));
    h.addString(e.detail);
  }

  h.addInt(s.roundsCompleted);
  h.addInt(s.maxRounds);
  h.addDoubleQ(s.createdDays);
  h.addDoubleQ(s.deadlineDays);
  h.addDoubleQ(s.consensusThreshold);
  h.addDoubleQ(s.successProbability);
  return h.value();
}

inline core::u64 signatureTrustEvolution(const TrustEvolution& t) {
  core::StableHash64 h;
  h.addU64(t.key.low);
  h.addU64(t.key.high);
  h.addDoubleQ(t.aTrustsB);
  h.addDoubleQ(t.bTrustsA);
  h.addU64(static_cast<core::u64>(t.history.size()));
  for (const auto& s : t.history) {
    h.addDoubleQ(s.timeDays);
    h.addDoubleQ(s.aTrustsB);
    h.addDoubleQ(s.bTrustsA);
  }
  h.addDoubleQ(t.volatility);
  h.addDoubleQ(t.peakTrust);
  h.addDoubleQ(t.lowestTrust);
  h.addDoubleQ(t.baselineCompatibility);
  return h.value();
}

} // namespace entente::diplo
