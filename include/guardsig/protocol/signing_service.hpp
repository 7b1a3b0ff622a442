#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/bytes.hpp"
#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/protocol/method_policy.hpp"
#include "guardsig/protocol/reconstruction_request.hpp"
#include "guardsig/protocol/threshold_session.hpp"

namespace guardsig {

struct SigningRequest {
  std::string family_id;
  Bytes message_digest;
  std::string event_type;
  std::vector<GuardianId> participants;
  // 0 uses the family key threshold.
  uint32_t threshold = 0;
  std::string created_by;
  std::optional<UseCase> use_case;
  std::optional<SigningMethod> preferred_method;
  std::optional<std::chrono::seconds> expires_in;
};

// Method-independent view of one signing operation.
struct SigningOperation {
  std::string id;
  SigningMethod method = SigningMethod::kThresholdSignature;
  std::string status;
  TimePoint created_at;
  TimePoint updated_at;
  TimePoint expires_at;
  std::optional<TimePoint> completed_at;
  std::optional<std::string> signature;
  std::optional<std::string> final_event_id;
  std::optional<std::string> error_message;
};

struct ExpirySweepResult {
  size_t sessions_expired = 0;
  size_t requests_expired = 0;
};

// Front door for signing: picks a method per use case and routes the
// operation to the matching engine.
class GuardianSigningService {
 public:
  GuardianSigningService(ThresholdSessionManager& sessions,
                         ReconstructionCoordinator& reconstructions,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

  Result<SigningOperation> CreateSigningRequest(const SigningRequest& request, TimePoint now = Clock::now());

  Result<SigningSession> SubmitNonceCommitment(const std::string& session_id,
                                               const GuardianId& participant_id,
                                               const std::string& commitment,
                                               TimePoint now = Clock::now());
  Result<SigningSession> SubmitPartialSignature(const std::string& session_id,
                                                const GuardianId& participant_id,
                                                const std::string& partial_signature,
                                                TimePoint now = Clock::now());
  Result<std::string> AggregateSignatures(const std::string& session_id, TimePoint now = Clock::now());
  Result<ReconstructionRequest> SubmitShare(const std::string& request_id,
                                            const GuardianId& guardian_id,
                                            const std::string& encoded_share,
                                            TimePoint now = Clock::now());

  // Without a method both engines are consulted, threshold sessions first.
  Result<SigningOperation> GetSessionStatus(const std::string& id,
                                            std::optional<SigningMethod> method = std::nullopt);
  Result<SigningOperation> FailSession(const std::string& id,
                                       const std::string& reason,
                                       std::optional<SigningMethod> method = std::nullopt,
                                       TimePoint now = Clock::now());
  // A guardian declines to take part in the operation.
  Result<SigningOperation> RejectSigningRequest(const std::string& id,
                                                const GuardianId& guardian_id,
                                                const std::string& reason,
                                                std::optional<SigningMethod> method = std::nullopt,
                                                TimePoint now = Clock::now());

  ExpirySweepResult CleanupExpiredSessions(TimePoint now = Clock::now());

 private:
  ThresholdSessionManager& sessions_;
  ReconstructionCoordinator& reconstructions_;
  std::shared_ptr<spdlog::logger> logger_;
};

SigningOperation ToOperation(const SigningSession& session);
SigningOperation ToOperation(const ReconstructionRequest& request);

}  // namespace guardsig
