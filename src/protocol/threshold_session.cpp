#include "guardsig/protocol/threshold_session.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "guardsig/common/log.hpp"
#include "guardsig/crypto/encoding.hpp"
#include "guardsig/crypto/random.hpp"

namespace guardsig {
namespace {

bool Contains(const std::vector<GuardianId>& ids, const GuardianId& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool IsPastExpiry(const SigningSession& session, TimePoint now) {
  return !IsTerminal(session.status) && now >= session.expires_at;
}

TimePoint LastTransitionAt(const SigningSession& session) {
  if (session.completed_at.has_value()) {
    return *session.completed_at;
  }
  if (session.failed_at.has_value()) {
    return *session.failed_at;
  }
  return session.updated_at;
}

}  // namespace

ThresholdSessionManager::ThresholdSessionManager(ISigningStore& store,
                                                 const IThresholdScheme& scheme,
                                                 IEventPublisher& publisher,
                                                 IGuardianNotifier& guardian_notifier,
                                                 ThresholdSessionConfig config,
                                                 std::shared_ptr<spdlog::logger> logger)
    : store_(store),
      scheme_(scheme),
      publisher_(publisher),
      guardian_notifier_(guardian_notifier),
      config_(config),
      logger_(LoggerOrDefault(std::move(logger))) {
  if (config_.default_expiry.count() <= 0) {
    throw std::invalid_argument("session expiry must be positive");
  }
  if (config_.min_threshold == 0 || config_.min_threshold > config_.max_threshold) {
    throw std::invalid_argument("invalid threshold bounds");
  }
  if (config_.max_update_attempts <= 0) {
    throw std::invalid_argument("max_update_attempts must be positive");
  }
}

const ThresholdSessionConfig& ThresholdSessionManager::config() const {
  return config_;
}

Result<SigningSession> ThresholdSessionManager::CreateSession(const CreateSessionParams& params, TimePoint now) {
  if (params.family_id.empty()) {
    return MakeError(ErrorCode::kValidation, "family_id is required");
  }
  if (params.message_digest.size() != 32) {
    return MakeError(ErrorCode::kValidation, "message digest must be 32 bytes");
  }
  const std::set<GuardianId> unique(params.participants.begin(), params.participants.end());
  if (unique.size() != params.participants.size()) {
    return MakeError(ErrorCode::kValidation, "participants must be unique");
  }
  if (params.expires_in.has_value() && params.expires_in->count() <= 0) {
    return MakeError(ErrorCode::kValidation, "expiry must be positive");
  }

  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(params.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }
  const uint32_t threshold = params.threshold == 0 ? key.threshold : params.threshold;
  if (threshold < config_.min_threshold || threshold > config_.max_threshold) {
    return MakeError(ErrorCode::kValidation,
                     "threshold must be between " + std::to_string(config_.min_threshold) + " and " +
                         std::to_string(config_.max_threshold));
  }
  if (threshold > params.participants.size()) {
    return MakeError(ErrorCode::kValidation, "threshold exceeds number of participants");
  }
  if (threshold < key.threshold) {
    return MakeError(ErrorCode::kValidation,
                     "threshold is below the family key threshold of " + std::to_string(key.threshold));
  }
  for (const GuardianId& participant : params.participants) {
    if (key.guardians.count(participant) == 0) {
      return MakeError(ErrorCode::kValidation, "participant is not a guardian of this family");
    }
  }

  SigningSession session;
  session.session_id = Csprng::RandomId();
  session.family_id = params.family_id;
  std::copy(params.message_digest.begin(), params.message_digest.end(), session.message_digest.begin());
  session.participants = params.participants;
  session.threshold = threshold;
  session.status = SigningSessionStatus::kPending;
  session.created_by = params.created_by;
  session.event_type = params.event_type;
  session.created_at = now;
  session.updated_at = now;
  session.expires_at = now + params.expires_in.value_or(config_.default_expiry);
  session.version = 1;

  const StoreStatus status = store_.InsertSession(session);
  if (status != StoreStatus::kOk) {
    logger_->error("failed to persist signing session {}: {}", session.session_id, ToString(status));
    return StoreFailure(status, "signing session");
  }

  logger_->info("signing session {} created for family {} ({}-of-{})",
                session.session_id, session.family_id, session.threshold, session.participants.size());
  NotifyParticipants(session);
  return session;
}

Result<SigningSession> ThresholdSessionManager::GetSession(const std::string& session_id) {
  SigningSession session;
  const StoreStatus status = store_.GetSession(session_id, &session);
  if (status != StoreStatus::kOk) {
    return StoreFailure(status, "signing session");
  }
  return session;
}

Result<SigningSession> ThresholdSessionManager::SubmitNonceCommitment(const std::string& session_id,
                                                                      const GuardianId& participant_id,
                                                                      const std::string& commitment,
                                                                      TimePoint now) {
  Result<SigningSession> loaded = LoadLive(session_id, now);
  if (!loaded.ok()) {
    return loaded.error();
  }
  if (Result<void> admissible = CheckCommitmentAdmissible(loaded.value(), participant_id); !admissible.ok()) {
    logger_->warn("rejected commitment for session {}: {}", session_id, admissible.error().message);
    return admissible.error();
  }

  std::string normalized;
  try {
    normalized = scheme_.ParseCommitment(commitment).ToHex();
  } catch (const std::invalid_argument& ex) {
    logger_->warn("rejected malformed commitment for session {}", session_id);
    return MakeError(ErrorCode::kValidation, std::string("malformed commitment: ") + ex.what());
  }

  const NonceCommitment row{
      .session_id = session_id,
      .participant_id = participant_id,
      .commitment_value = normalized,
      .used = false,
      .created_at = now,
  };
  const StoreStatus inserted = store_.InsertCommitment(row);
  if (inserted == StoreStatus::kDuplicate) {
    // A row for this participant holding the same value means an earlier
    // attempt stored it but lost the session update; finish that attempt.
    NonceCommitment existing;
    const bool resumable = store_.GetCommitment(session_id, participant_id, &existing) == StoreStatus::kOk &&
                           existing.commitment_value == normalized && !existing.used;
    if (!resumable) {
      logger_->warn("rejected reused commitment for session {}", session_id);
      return MakeError(ErrorCode::kReplay, "commitment value has already been used");
    }
  } else if (inserted != StoreStatus::kOk) {
    logger_->error("failed to store commitment for session {}: {}", session_id, ToString(inserted));
    return StoreFailure(inserted, "nonce commitment");
  }

  Result<SigningSession> updated = Transition(session_id, now, [&](SigningSession* session) -> Result<bool> {
    if (Result<void> admissible = CheckCommitmentAdmissible(*session, participant_id); !admissible.ok()) {
      return admissible.error();
    }
    session->nonce_commitments[participant_id] = normalized;
    session->status = SigningSessionStatus::kCollectingCommitments;
    if (!session->round1_started_at.has_value()) {
      session->round1_started_at = now;
    }
    if (session->nonce_commitments.size() >= session->threshold) {
      session->status = SigningSessionStatus::kSigning;
      session->round2_started_at = now;
    }
    session->updated_at = now;
    return true;
  });
  if (!updated.ok()) {
    return updated;
  }

  const SigningSession& session = updated.value();
  logger_->info("session {} accepted commitment {}/{}", session_id, session.nonce_commitments.size(),
                session.threshold);
  if (session.status == SigningSessionStatus::kSigning) {
    logger_->info("session {} moved to {}", session_id, ToString(session.status));
  }
  return updated;
}

Result<SigningPackage> ThresholdSessionManager::GetSigningPackage(const std::string& session_id, TimePoint now) {
  Result<SigningSession> loaded = LoadLive(session_id, now);
  if (!loaded.ok()) {
    return loaded.error();
  }
  const SigningSession& session = loaded.value();
  if (session.status != SigningSessionStatus::kSigning && session.status != SigningSessionStatus::kAggregating) {
    return MakeError(ErrorCode::kState,
                     std::string("signing package unavailable in status ") + ToString(session.status));
  }
  return BuildPackage(session);
}

Result<SigningSession> ThresholdSessionManager::SubmitPartialSignature(const std::string& session_id,
                                                                       const GuardianId& participant_id,
                                                                       const std::string& partial_signature,
                                                                       TimePoint now) {
  Result<SigningSession> loaded = LoadLive(session_id, now);
  if (!loaded.ok()) {
    return loaded.error();
  }
  const SigningSession& session = loaded.value();
  if (session.status != SigningSessionStatus::kSigning) {
    logger_->warn("rejected partial signature for session {} in status {}", session_id, ToString(session.status));
    return MakeError(ErrorCode::kState,
                     std::string("partial signatures are not accepted in status ") + ToString(session.status));
  }
  if (!Contains(session.participants, participant_id)) {
    return MakeError(ErrorCode::kValidation, "participant is not authorized for this session");
  }
  if (session.partial_signatures.count(participant_id) != 0) {
    return MakeError(ErrorCode::kReplay, "participant has already submitted a partial signature");
  }

  NonceCommitment commitment;
  const StoreStatus commitment_status = store_.GetCommitment(session_id, participant_id, &commitment);
  if (commitment_status == StoreStatus::kNotFound || session.nonce_commitments.count(participant_id) == 0) {
    return MakeError(ErrorCode::kState, "participant has no nonce commitment in this session");
  }
  if (commitment_status != StoreStatus::kOk) {
    return StoreFailure(commitment_status, "nonce commitment");
  }
  if (commitment.used) {
    logger_->warn("rejected partial signature for session {}: nonce already used", session_id);
    return MakeError(ErrorCode::kReplay, "nonce commitment has already been used");
  }

  Scalar partial;
  try {
    partial = Scalar::FromCanonicalHex(partial_signature);
  } catch (const std::invalid_argument& ex) {
    return MakeError(ErrorCode::kValidation, std::string("malformed partial signature: ") + ex.what());
  }

  Result<SigningPackage> package = BuildPackage(session);
  if (!package.ok()) {
    return package.error();
  }
  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(session.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }
  const uint32_t share_index = key.guardians.at(participant_id).share_index;
  if (!scheme_.VerifyPartial(package.value(), share_index, partial)) {
    logger_->warn("rejected invalid partial signature for session {}", session_id);
    return MakeError(ErrorCode::kValidation, "partial signature failed verification");
  }

  const StoreStatus marked = store_.MarkCommitmentUsed(session_id, participant_id, now);
  if (marked == StoreStatus::kConflict) {
    logger_->warn("rejected partial signature for session {}: nonce already used", session_id);
    return MakeError(ErrorCode::kReplay, "nonce commitment has already been used");
  }
  if (marked != StoreStatus::kOk) {
    logger_->error("failed to mark commitment used for session {}: {}", session_id, ToString(marked));
    return StoreFailure(marked, "nonce commitment");
  }

  const std::string normalized = partial.ToCanonicalHex();
  Result<SigningSession> updated = Transition(session_id, now, [&](SigningSession* s) -> Result<bool> {
    if (s->status != SigningSessionStatus::kSigning) {
      return MakeError(ErrorCode::kState,
                       std::string("partial signatures are not accepted in status ") + ToString(s->status));
    }
    if (s->partial_signatures.count(participant_id) != 0) {
      return MakeError(ErrorCode::kReplay, "participant has already submitted a partial signature");
    }
    s->partial_signatures[participant_id] = normalized;
    if (s->partial_signatures.size() >= s->threshold) {
      s->status = SigningSessionStatus::kAggregating;
    }
    s->updated_at = now;
    return true;
  });
  if (!updated.ok()) {
    return updated;
  }

  logger_->info("session {} accepted partial signature {}/{}", session_id,
                updated.value().partial_signatures.size(), updated.value().threshold);
  return updated;
}

Result<std::string> ThresholdSessionManager::AggregateSignatures(const std::string& session_id, TimePoint now) {
  Result<SigningSession> loaded = LoadLive(session_id, now);
  if (!loaded.ok()) {
    return loaded.error();
  }
  SigningSession session = std::move(loaded).value();

  if (session.status == SigningSessionStatus::kCompleted && session.final_signature.has_value()) {
    if (!session.final_event_id.has_value()) {
      Result<std::string> published = Publish(session, now);
      if (!published.ok()) {
        return published.error();
      }
    }
    return *session.final_signature;
  }
  if (session.status != SigningSessionStatus::kSigning && session.status != SigningSessionStatus::kAggregating) {
    return MakeError(ErrorCode::kState,
                     std::string("cannot aggregate in status ") + ToString(session.status));
  }

  if (session.partial_signatures.size() < session.threshold) {
    const std::string reason = "insufficient partial signatures: have " +
                               std::to_string(session.partial_signatures.size()) + ", need " +
                               std::to_string(session.threshold);
    Result<SigningSession> failed = FailInternal(session_id, reason, now);
    if (!failed.ok() && failed.code() != ErrorCode::kState) {
      return failed.error();
    }
    return MakeError(ErrorCode::kAggregation, reason);
  }

  Result<SigningPackage> package = BuildPackage(session);
  if (!package.ok()) {
    (void)FailInternal(session_id, package.error().message, now);
    return MakeError(ErrorCode::kAggregation, package.error().message);
  }

  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(session.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }

  std::string signature_hex;
  try {
    std::unordered_map<uint32_t, Scalar> partials;
    for (const auto& [participant, value] : session.partial_signatures) {
      partials.emplace(key.guardians.at(participant).share_index, Scalar::FromCanonicalHex(value));
    }
    const SchnorrSignature signature = scheme_.Aggregate(package.value(), partials);
    signature_hex = HexEncode(signature);
  } catch (const std::exception& ex) {
    const std::string reason = std::string("aggregation failed: ") + ex.what();
    logger_->error("session {}: {}", session_id, reason);
    (void)FailInternal(session_id, reason, now);
    return MakeError(ErrorCode::kAggregation, reason);
  }

  Result<SigningSession> completed = Transition(session_id, now, [&](SigningSession* s) -> Result<bool> {
    if (s->status == SigningSessionStatus::kCompleted) {
      return false;
    }
    if (s->status != SigningSessionStatus::kSigning && s->status != SigningSessionStatus::kAggregating) {
      return MakeError(ErrorCode::kState, std::string("cannot complete in status ") + ToString(s->status));
    }
    s->status = SigningSessionStatus::kCompleted;
    s->final_signature = signature_hex;
    s->completed_at = now;
    s->updated_at = now;
    return true;
  });
  if (!completed.ok()) {
    return completed.error();
  }

  const SigningSession& done = completed.value();
  if (done.final_signature != signature_hex) {
    // Another aggregator finished first.
    return *done.final_signature;
  }
  logger_->info("session {} completed", session_id);

  Result<std::string> published = Publish(done, now);
  if (!published.ok()) {
    return published.error();
  }
  return signature_hex;
}

Result<SigningSession> ThresholdSessionManager::FailSession(const std::string& session_id,
                                                            const std::string& reason,
                                                            TimePoint now) {
  return FailInternal(session_id, reason, now);
}

Result<SigningSession> ThresholdSessionManager::RejectSession(const std::string& session_id,
                                                              const GuardianId& guardian_id,
                                                              const std::string& reason,
                                                              TimePoint now) {
  Result<SigningSession> loaded = LoadLive(session_id, now);
  if (!loaded.ok()) {
    return loaded.error();
  }

  Result<SigningSession> updated = Transition(session_id, now, [&](SigningSession* s) -> Result<bool> {
    if (IsTerminal(s->status)) {
      return MakeError(ErrorCode::kState, std::string("session is already ") + ToString(s->status));
    }
    if (!Contains(s->participants, guardian_id)) {
      return MakeError(ErrorCode::kValidation, "participant is not authorized for this session");
    }
    if (s->rejections.count(guardian_id) != 0) {
      return MakeError(ErrorCode::kReplay, "participant has already rejected this session");
    }
    if (s->partial_signatures.count(guardian_id) != 0) {
      return MakeError(ErrorCode::kState, "participant has already signed");
    }

    s->rejections[guardian_id] = reason.empty() ? "declined" : reason;
    // Round 2 is bound to the committed signer set; losing one of them is final.
    const bool signer_lost = s->status == SigningSessionStatus::kSigning && s->nonce_commitments.count(guardian_id) != 0;
    if (!signer_lost) {
      s->nonce_commitments.erase(guardian_id);
    }
    const size_t remaining = s->participants.size() - s->rejections.size();
    if (signer_lost || remaining < s->threshold) {
      s->status = SigningSessionStatus::kFailed;
      s->error_message = "threshold unreachable: " + std::to_string(s->rejections.size()) + " of " +
                         std::to_string(s->participants.size()) + " participants rejected";
      s->failed_at = now;
    } else if (s->nonce_commitments.empty()) {
      s->status = SigningSessionStatus::kPending;
    }
    s->updated_at = now;
    return true;
  });
  if (!updated.ok()) {
    return updated;
  }

  const SigningSession& session = updated.value();
  logger_->info("session {} rejected by a participant ({}/{} declined)", session_id, session.rejections.size(),
                session.participants.size());
  if (session.status == SigningSessionStatus::kFailed) {
    logger_->info("session {} failed: {}", session_id, *session.error_message);
  }
  return updated;
}

size_t ThresholdSessionManager::ExpireOldSessions(TimePoint now) {
  size_t expired = 0;
  for (const SigningSession& session : store_.ListSessions()) {
    if (!IsPastExpiry(session, now)) {
      continue;
    }
    Result<SigningSession> loaded = LoadLive(session.session_id, now);
    if (loaded.code() == ErrorCode::kTimeout) {
      ++expired;
    }
  }
  if (expired > 0) {
    logger_->info("expired {} signing sessions", expired);
  }
  return expired;
}

size_t ThresholdSessionManager::CleanupOldSessions(TimePoint now) {
  return CleanupOldSessions(now, config_.retention);
}

size_t ThresholdSessionManager::CleanupOldSessions(TimePoint now, std::chrono::days retention) {
  const TimePoint cutoff = now - retention;
  size_t deleted = 0;
  for (const SigningSession& session : store_.ListSessions()) {
    if (!IsTerminal(session.status) || LastTransitionAt(session) >= cutoff) {
      continue;
    }
    const StoreStatus status = store_.DeleteSession(session.session_id);
    if (status == StoreStatus::kOk) {
      ++deleted;
    } else if (status != StoreStatus::kNotFound) {
      logger_->error("failed to delete signing session {}: {}", session.session_id, ToString(status));
    }
  }
  if (deleted > 0) {
    logger_->info("deleted {} signing sessions older than {} days", deleted, retention.count());
  }
  return deleted;
}

std::vector<SigningSession> ThresholdSessionManager::GetActiveSessions(const std::string& family_id, TimePoint now) {
  std::vector<SigningSession> out;
  for (SigningSession& session : store_.ListSessions()) {
    if (session.family_id == family_id && !IsTerminal(session.status) && !IsPastExpiry(session, now)) {
      out.push_back(std::move(session));
    }
  }
  std::sort(out.begin(), out.end(), [](const SigningSession& a, const SigningSession& b) {
    return a.created_at > b.created_at;
  });
  return out;
}

std::vector<SigningSession> ThresholdSessionManager::GetPendingSessions(const GuardianId& guardian_id, TimePoint now) {
  std::vector<SigningSession> out;
  for (SigningSession& session : store_.ListSessions()) {
    if (IsTerminal(session.status) || IsPastExpiry(session, now) || !Contains(session.participants, guardian_id) ||
        session.rejections.count(guardian_id) != 0) {
      continue;
    }
    const bool committed = session.nonce_commitments.count(guardian_id) != 0;
    const bool signed_partial = session.partial_signatures.count(guardian_id) != 0;
    const bool awaiting_commitment = (session.status == SigningSessionStatus::kPending ||
                                      session.status == SigningSessionStatus::kCollectingCommitments) &&
                                     !committed;
    const bool awaiting_partial = session.status == SigningSessionStatus::kSigning && committed && !signed_partial;
    if (awaiting_commitment || awaiting_partial) {
      out.push_back(std::move(session));
    }
  }
  std::sort(out.begin(), out.end(), [](const SigningSession& a, const SigningSession& b) {
    return a.expires_at < b.expires_at;
  });
  return out;
}

Result<SessionRecoveryInfo> ThresholdSessionManager::RecoverSession(const std::string& session_id, TimePoint now) {
  Result<SigningSession> loaded = GetSession(session_id);
  if (!loaded.ok()) {
    return loaded.error();
  }

  SessionRecoveryInfo info;
  info.session = std::move(loaded).value();
  const SigningSession& session = info.session;
  info.expired = session.status == SigningSessionStatus::kExpired || IsPastExpiry(session, now);

  if (session.status == SigningSessionStatus::kPending ||
      session.status == SigningSessionStatus::kCollectingCommitments) {
    for (const GuardianId& participant : session.participants) {
      if (session.nonce_commitments.count(participant) == 0 && session.rejections.count(participant) == 0) {
        info.missing_commitments.push_back(participant);
      }
    }
  }
  for (const auto& [participant, commitment] : session.nonce_commitments) {
    (void)commitment;
    if (session.partial_signatures.count(participant) == 0) {
      info.missing_signatures.push_back(participant);
    }
  }
  info.can_aggregate = !info.expired &&
                       (session.status == SigningSessionStatus::kSigning ||
                        session.status == SigningSessionStatus::kAggregating) &&
                       session.partial_signatures.size() >= session.threshold;
  return info;
}

Result<bool> ThresholdSessionManager::VerifyAggregatedSignature(const std::string& session_id) {
  Result<SigningSession> loaded = GetSession(session_id);
  if (!loaded.ok()) {
    return loaded.error();
  }
  const SigningSession& session = loaded.value();
  if (session.status != SigningSessionStatus::kCompleted || !session.final_signature.has_value()) {
    return MakeError(ErrorCode::kState, "session has no aggregated signature");
  }

  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(session.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }
  try {
    const Bytes signature = HexDecode(*session.final_signature);
    return scheme_.VerifySignature(key.group_public_key, session.message_digest, signature);
  } catch (const std::invalid_argument&) {
    return false;
  }
}

Result<SigningSession> ThresholdSessionManager::Transition(const std::string& session_id,
                                                           TimePoint now,
                                                           const SessionMutator& mutate) {
  for (int attempt = 0; attempt < config_.max_update_attempts; ++attempt) {
    SigningSession session;
    const StoreStatus read = store_.GetSession(session_id, &session);
    if (read != StoreStatus::kOk) {
      return StoreFailure(read, "signing session");
    }

    bool expiring = false;
    if (IsPastExpiry(session, now)) {
      session.status = SigningSessionStatus::kExpired;
      session.updated_at = now;
      expiring = true;
    } else {
      Result<bool> changed = mutate(&session);
      if (!changed.ok()) {
        return changed.error();
      }
      if (!changed.value()) {
        return session;
      }
    }

    const StoreStatus written = store_.UpdateSession(&session);
    if (written == StoreStatus::kConflict) {
      logger_->debug("version conflict on session {}, attempt {}", session_id, attempt + 1);
      continue;
    }
    if (written != StoreStatus::kOk) {
      logger_->error("failed to update signing session {}: {}", session_id, ToString(written));
      return StoreFailure(written, "signing session");
    }
    if (expiring) {
      logger_->info("session {} expired", session_id);
      return MakeError(ErrorCode::kTimeout, "signing session has expired");
    }
    return session;
  }
  return MakeError(ErrorCode::kConflict, "signing session was modified concurrently");
}

Result<SigningSession> ThresholdSessionManager::LoadLive(const std::string& session_id, TimePoint now) {
  Result<SigningSession> loaded = GetSession(session_id);
  if (!loaded.ok()) {
    return loaded;
  }
  if (loaded.value().status == SigningSessionStatus::kExpired) {
    return MakeError(ErrorCode::kTimeout, "signing session has expired");
  }
  if (!IsPastExpiry(loaded.value(), now)) {
    return loaded;
  }
  // Persist the expiry, then report it.
  Result<SigningSession> expired = Transition(session_id, now, [](SigningSession*) -> Result<bool> {
    return false;
  });
  if (expired.ok()) {
    // Another writer moved it to a terminal status first.
    return expired;
  }
  return expired.error();
}

Result<SigningPackage> ThresholdSessionManager::BuildPackage(const SigningSession& session) {
  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(session.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }

  std::vector<SignerCommitment> signers;
  signers.reserve(session.nonce_commitments.size());
  try {
    for (const auto& [participant, commitment] : session.nonce_commitments) {
      const auto it = key.guardians.find(participant);
      if (it == key.guardians.end()) {
        return MakeError(ErrorCode::kValidation, "committed participant is no longer a guardian");
      }
      signers.push_back(SignerCommitment{
          .participant_id = participant,
          .share_index = it->second.share_index,
          .verification_share = it->second.verification_share,
          .nonce_commitment = scheme_.ParseCommitment(commitment),
      });
    }
    return scheme_.BuildSigningPackage(key.group_public_key, session.message_digest, std::move(signers));
  } catch (const std::invalid_argument& ex) {
    return MakeError(ErrorCode::kValidation, std::string("cannot build signing package: ") + ex.what());
  }
}

Result<void> ThresholdSessionManager::CheckCommitmentAdmissible(const SigningSession& session,
                                                                const GuardianId& participant_id) const {
  if (session.status != SigningSessionStatus::kPending &&
      session.status != SigningSessionStatus::kCollectingCommitments) {
    return MakeError(ErrorCode::kState,
                     std::string("commitments are not accepted in status ") + ToString(session.status));
  }
  if (!Contains(session.participants, participant_id)) {
    return MakeError(ErrorCode::kValidation, "participant is not authorized for this session");
  }
  if (session.rejections.count(participant_id) != 0) {
    return MakeError(ErrorCode::kState, "participant has rejected this session");
  }
  if (session.nonce_commitments.count(participant_id) != 0) {
    return MakeError(ErrorCode::kReplay, "participant has already submitted a commitment");
  }
  return Result<void>::Ok();
}

Result<std::string> ThresholdSessionManager::Publish(const SigningSession& session, TimePoint now) {
  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(session.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }

  const SignedEvent event{
      .event_id = HexEncode(session.message_digest),
      .origin_id = session.session_id,
      .family_id = session.family_id,
      .event_type = session.event_type,
      .pubkey = HexEncode(key.group_public_key.XOnlyBytes()),
      .signature = session.final_signature.value_or(""),
      .signed_at = now,
  };

  std::string event_id;
  try {
    event_id = publisher_.Publish(event);
  } catch (const std::exception& ex) {
    logger_->error("session {}: publishing signed event failed: {}", session.session_id, ex.what());
    return MakeError(ErrorCode::kPersistence, "signature stored but publication failed");
  }

  Result<SigningSession> recorded = Transition(session.session_id, now, [&](SigningSession* s) -> Result<bool> {
    if (s->final_event_id == event_id) {
      return false;
    }
    s->final_event_id = event_id;
    s->updated_at = now;
    return true;
  });
  if (!recorded.ok()) {
    return recorded.error();
  }
  logger_->info("session {} published event {}", session.session_id, event_id);
  return event_id;
}

Result<SigningSession> ThresholdSessionManager::FailInternal(const std::string& session_id,
                                                             const std::string& reason,
                                                             TimePoint now) {
  Result<SigningSession> failed = Transition(session_id, now, [&](SigningSession* s) -> Result<bool> {
    if (IsTerminal(s->status)) {
      return MakeError(ErrorCode::kState,
                       std::string("session is already ") + ToString(s->status));
    }
    s->status = SigningSessionStatus::kFailed;
    s->error_message = reason;
    s->failed_at = now;
    s->updated_at = now;
    return true;
  });
  if (failed.ok()) {
    logger_->info("session {} failed: {}", session_id, reason);
  }
  return failed;
}

void ThresholdSessionManager::NotifyParticipants(const SigningSession& session) {
  size_t notified = 0;
  for (const GuardianId& participant : session.participants) {
    try {
      guardian_notifier_.NotifySigningRequest(GuardianSigningRequest{
          .guardian_id = participant,
          .family_id = session.family_id,
          .operation_id = session.session_id,
          .method = SigningMethod::kThresholdSignature,
          .message_digest = HexEncode(session.message_digest),
          .event_type = session.event_type,
          .requested_by = session.created_by,
          .expires_at = session.expires_at,
      });
      ++notified;
    } catch (const std::exception& ex) {
      logger_->warn("session {}: signing request to a participant was not delivered: {}", session.session_id,
                    ex.what());
    }
  }
  logger_->info("session {} notified {}/{} participants", session.session_id, notified,
                session.participants.size());
}

}  // namespace guardsig
