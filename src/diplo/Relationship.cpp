#include "entente/diplo/Relationship.h"

#include <cctype>
#include <cmath>

namespace entente::diplo {

static std::string lowerAscii(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (const char c : s) out.push_back((char)std::tolower((unsigned char)c));
  return out;
}

const char* interactionKindName(InteractionKind k) {
  switch (k) {
    case InteractionKind::AllianceProposal: return "alliance_proposal";
    case InteractionKind::AllianceAcceptance: return "alliance_acceptance";
    case InteractionKind::AllianceRejection: return "alliance_rejection";
    case InteractionKind::TreatySigned: return "treaty_signed";
    case InteractionKind::TreatyViolated: return "treaty_violated";
    case InteractionKind::TradeAgreement: return "trade_agreement";
    case InteractionKind::MilitarySupport: return "military_support";
    case InteractionKind::Betrayal: return "betrayal";
    case InteractionKind::DiplomaticInsult: return "diplomatic_insult";
    case InteractionKind::TerritorialDispute: return "territorial_dispute";
    case InteractionKind::ResourceConflict: return "resource_conflict";
    case InteractionKind::CulturalExchange: return "cultural_exchange";
    case InteractionKind::HumanitarianAid: return "humanitarian_aid";
    case InteractionKind::EspionageDetected: return "espionage_detected";
    case InteractionKind::BorderIncident: return "border_incident";
    case InteractionKind::SuccessionSupport: return "succession_support";
    case InteractionKind::MediationAttempt: return "mediation_attempt";
  }
  return "unknown";
}

bool tryParseInteractionKind(std::string_view text, InteractionKind& out) {
  const std::string k = lowerAscii(text);
  for (int i = 0; i < kInteractionKindCount; ++i) {
    const InteractionKind kind = static_cast<InteractionKind>(i);
    if (k == interactionKindName(kind)) {
      out = kind;
      return true;
    }
  }
  return false;
}

double tensionMultiplier(InteractionKind k) {
  switch (k) {
    case InteractionKind::Betrayal: return 2.0;
    case InteractionKind::TreatyViolated: return 1.8;
    case InteractionKind::DiplomaticInsult: return 1.5;
    case InteractionKind::TerritorialDispute: return 1.7;
    case InteractionKind::ResourceConflict: return 1.4;
    case InteractionKind::EspionageDetected: return 1.6;
    case InteractionKind::BorderIncident: return 1.3;
    case InteractionKind::MilitarySupport: return -0.8;
    case InteractionKind::HumanitarianAid: return -0.5;
    case InteractionKind::CulturalExchange: return -0.3;
    case InteractionKind::TradeAgreement: return -0.4;
    case InteractionKind::AllianceProposal:
    case InteractionKind::AllianceAcceptance:
    case InteractionKind::AllianceRejection:
    case InteractionKind::TreatySigned:
    case InteractionKind::SuccessionSupport:
    case InteractionKind::MediationAttempt:
      return 1.0;
  }
  return 1.0;
}

static bool inRange(double v, double lo, double hi) {
  return std::isfinite(v) && v >= lo && v <= hi;
}

bool buildInteractionRecord(const InteractionInput& in, core::u64 id,
                            InteractionRecord& out, std::string* outError) {
  if (in.initiator == in.target) {
    if (outError) *outError = "interaction initiator and target must differ";
    return false;
  }
  if (!inRange(in.trustImpact, -1.0, 1.0)) {
    if (outError) *outError = "trust impact must be within [-1, 1]";
    return false;
  }
  if (!inRange(in.reputationImpact, -1.0, 1.0)) {
    if (outError) *outError = "reputation impact must be within [-1, 1]";
    return false;
  }
  if (!inRange(in.severity, 0.0, 1.0)) {
    if (outError) *outError = "severity must be within [0, 1]";
    return false;
  }
  if (!std::isfinite(in.timeDays)) {
    if (outError) *outError = "interaction timestamp must be finite";
    return false;
  }

  InteractionRecord r;
  r.id = id;
  r.timeDays = in.timeDays;
  r.kind = in.kind;
  r.initiator = in.initiator;
  r.target = in.target;
  r.description = in.description;
  r.trustImpact = in.trustImpact;
  r.reputationImpact = in.reputationImpact;
  r.severity = in.severity;
  r.tensionImpact = in.trustImpact * tensionMultiplier(in.kind);

  if (r.trustImpact > 0.3) {
    r.consequences.push_back("Strengthened diplomatic ties");
  } else if (r.trustImpact < -0.3) {
    r.consequences.push_back("Damaged diplomatic relations");
  }
  if (r.severity > 0.7) r.consequences.push_back("Regional diplomatic impact");

  switch (r.kind) {
    case InteractionKind::Betrayal:
      r.consequences.push_back("Trust penalty with other factions");
      r.consequences.push_back("Reputation damage");
      break;
    case InteractionKind::AllianceProposal:
      r.consequences.push_back("Formal diplomatic process initiated");
      break;
    default:
      break;
  }

  out = std::move(r);
  return true;
}

const char* trustCategoryName(TrustCategory c) {
  switch (c) {
    case TrustCategory::DeepMistrust: return "deep_mistrust";
    case TrustCategory::Distrust: return "distrust";
    case TrustCategory::LowTrust: return "low_trust";
    case TrustCategory::ModerateTrust: return "moderate_trust";
    case TrustCategory::HighTrust: return "high_trust";
    case TrustCategory::AbsoluteTrust: return "absolute_trust";
  }
  return "unknown";
}

const char* diplomaticStatusName(DiplomaticStatus s) {
  switch (s) {
    case DiplomaticStatus::Allied: return "allied";
    case DiplomaticStatus::Friendly: return "friendly";
    case DiplomaticStatus::Neutral: return "neutral";
    case DiplomaticStatus::Hostile: return "hostile";
    case DiplomaticStatus::AtWar: return "at_war";
  }
  return "unknown";
}

bool tryParseDiplomaticStatus(std::string_view text, DiplomaticStatus& out) {
  const std::string k = lowerAscii(text);
  for (int i = 0; i <= static_cast<int>(DiplomaticStatus::AtWar); ++i) {
    const DiplomaticStatus s = static_cast<DiplomaticStatus>(i);
    if (k == diplomaticStatusName(s)) {
      out = s;
      return true;
    }
  }
  if (k == "war") {
    out = DiplomaticStatus::AtWar;
    return true;
  }
  return false;
}

} // namespace entente::diplo
