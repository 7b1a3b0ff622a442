#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/bytes.hpp"
#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/crypto/threshold_scheme.hpp"
#include "guardsig/net/notifier.hpp"
#include "guardsig/net/publisher.hpp"
#include "guardsig/protocol/types.hpp"
#include "guardsig/store/signing_store.hpp"

namespace guardsig {

struct ThresholdSessionConfig {
  std::chrono::seconds default_expiry{600};
  uint32_t min_threshold = 1;
  uint32_t max_threshold = 7;
  int max_update_attempts = 3;
  std::chrono::days retention{90};
};

struct CreateSessionParams {
  std::string family_id;
  Bytes message_digest;
  std::vector<GuardianId> participants;
  // 0 uses the family key threshold.
  uint32_t threshold = 0;
  std::string created_by;
  std::string event_type;
  std::optional<std::chrono::seconds> expires_in;
};

struct SessionRecoveryInfo {
  SigningSession session;
  std::vector<GuardianId> missing_commitments;
  std::vector<GuardianId> missing_signatures;
  bool can_aggregate = false;
  bool expired = false;
};

// Multi-round threshold signing: round 1 collects nonce commitments, round 2
// collects partial signatures, and aggregation yields one BIP-340 signature
// for the family key. The private key is never reconstructed.
class ThresholdSessionManager {
 public:
  ThresholdSessionManager(ISigningStore& store,
                          const IThresholdScheme& scheme,
                          IEventPublisher& publisher,
                          IGuardianNotifier& guardian_notifier,
                          ThresholdSessionConfig config = {},
                          std::shared_ptr<spdlog::logger> logger = nullptr);

  Result<SigningSession> CreateSession(const CreateSessionParams& params, TimePoint now = Clock::now());
  Result<SigningSession> GetSession(const std::string& session_id);

  Result<SigningSession> SubmitNonceCommitment(const std::string& session_id,
                                               const GuardianId& participant_id,
                                               const std::string& commitment,
                                               TimePoint now = Clock::now());

  // Available once round 1 is complete.
  Result<SigningPackage> GetSigningPackage(const std::string& session_id, TimePoint now = Clock::now());

  Result<SigningSession> SubmitPartialSignature(const std::string& session_id,
                                                const GuardianId& participant_id,
                                                const std::string& partial_signature,
                                                TimePoint now = Clock::now());

  // Returns the 64-byte signature in hex.
  Result<std::string> AggregateSignatures(const std::string& session_id, TimePoint now = Clock::now());

  Result<SigningSession> FailSession(const std::string& session_id,
                                     const std::string& reason,
                                     TimePoint now = Clock::now());

  // Records `guardian_id` declining to sign. A declining guardian's round-1
  // commitment is withdrawn; the session fails once the remaining
  // participants can no longer produce a signature.
  Result<SigningSession> RejectSession(const std::string& session_id,
                                       const GuardianId& guardian_id,
                                       const std::string& reason,
                                       TimePoint now = Clock::now());

  size_t ExpireOldSessions(TimePoint now = Clock::now());
  size_t CleanupOldSessions(TimePoint now = Clock::now());
  size_t CleanupOldSessions(TimePoint now, std::chrono::days retention);

  std::vector<SigningSession> GetActiveSessions(const std::string& family_id, TimePoint now = Clock::now());
  // Sessions waiting on an action from `guardian_id`.
  std::vector<SigningSession> GetPendingSessions(const GuardianId& guardian_id, TimePoint now = Clock::now());

  Result<SessionRecoveryInfo> RecoverSession(const std::string& session_id, TimePoint now = Clock::now());
  Result<bool> VerifyAggregatedSignature(const std::string& session_id);

  const ThresholdSessionConfig& config() const;

 private:
  // Returns false when nothing needs to be written.
  using SessionMutator = std::function<Result<bool>(SigningSession* session)>;

  // Re-reads, lazily expires, applies `mutate` and writes conditionally,
  // retrying on version conflicts.
  Result<SigningSession> Transition(const std::string& session_id, TimePoint now, const SessionMutator& mutate);
  Result<SigningSession> LoadLive(const std::string& session_id, TimePoint now);

  Result<SigningPackage> BuildPackage(const SigningSession& session);
  Result<void> CheckCommitmentAdmissible(const SigningSession& session, const GuardianId& participant_id) const;
  Result<std::string> Publish(const SigningSession& session, TimePoint now);
  Result<SigningSession> FailInternal(const std::string& session_id, const std::string& reason, TimePoint now);
  void NotifyParticipants(const SigningSession& session);

  ISigningStore& store_;
  const IThresholdScheme& scheme_;
  IEventPublisher& publisher_;
  IGuardianNotifier& guardian_notifier_;
  ThresholdSessionConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guardsig
