#include "guardsig/protocol/signing_service.hpp"

#include <utility>

#include "guardsig/common/log.hpp"

namespace guardsig {

SigningOperation ToOperation(const SigningSession& session) {
  return SigningOperation{
      .id = session.session_id,
      .method = SigningMethod::kThresholdSignature,
      .status = ToString(session.status),
      .created_at = session.created_at,
      .updated_at = session.updated_at,
      .expires_at = session.expires_at,
      .completed_at = session.completed_at,
      .signature = session.final_signature,
      .final_event_id = session.final_event_id,
      .error_message = session.error_message,
  };
}

SigningOperation ToOperation(const ReconstructionRequest& request) {
  return SigningOperation{
      .id = request.request_id,
      .method = SigningMethod::kKeyReconstruction,
      .status = ToString(request.status),
      .created_at = request.created_at,
      .updated_at = request.updated_at,
      .expires_at = request.expires_at,
      .completed_at = request.completed_at,
      .signature = request.signature,
      .final_event_id = request.final_event_id,
      .error_message = request.error_message,
  };
}

GuardianSigningService::GuardianSigningService(ThresholdSessionManager& sessions,
                                               ReconstructionCoordinator& reconstructions,
                                               std::shared_ptr<spdlog::logger> logger)
    : sessions_(sessions), reconstructions_(reconstructions), logger_(LoggerOrDefault(std::move(logger))) {}

Result<SigningOperation> GuardianSigningService::CreateSigningRequest(const SigningRequest& request, TimePoint now) {
  const SigningMethod method = SelectMethod(request.use_case, request.preferred_method);
  logger_->info("signing request for family {} uses {}{}", request.family_id, ToString(method),
                request.use_case.has_value() ? std::string(" (") + ToString(*request.use_case) + ")" : "");

  if (method == SigningMethod::kThresholdSignature) {
    Result<SigningSession> created = sessions_.CreateSession(
        CreateSessionParams{
            .family_id = request.family_id,
            .message_digest = request.message_digest,
            .participants = request.participants,
            .threshold = request.threshold,
            .created_by = request.created_by,
            .event_type = request.event_type,
            .expires_in = request.expires_in,
        },
        now);
    if (!created.ok()) {
      return created.error();
    }
    return ToOperation(created.value());
  }

  Result<ReconstructionRequest> created = reconstructions_.CreateRequest(
      CreateRequestParams{
          .family_id = request.family_id,
          .message_digest = request.message_digest,
          .required_guardians = request.participants,
          .threshold = request.threshold,
          .created_by = request.created_by,
          .event_type = request.event_type,
          .expires_in = request.expires_in,
      },
      now);
  if (!created.ok()) {
    return created.error();
  }
  return ToOperation(created.value());
}

Result<SigningSession> GuardianSigningService::SubmitNonceCommitment(const std::string& session_id,
                                                                     const GuardianId& participant_id,
                                                                     const std::string& commitment,
                                                                     TimePoint now) {
  return sessions_.SubmitNonceCommitment(session_id, participant_id, commitment, now);
}

Result<SigningSession> GuardianSigningService::SubmitPartialSignature(const std::string& session_id,
                                                                      const GuardianId& participant_id,
                                                                      const std::string& partial_signature,
                                                                      TimePoint now) {
  return sessions_.SubmitPartialSignature(session_id, participant_id, partial_signature, now);
}

Result<std::string> GuardianSigningService::AggregateSignatures(const std::string& session_id, TimePoint now) {
  return sessions_.AggregateSignatures(session_id, now);
}

Result<ReconstructionRequest> GuardianSigningService::SubmitShare(const std::string& request_id,
                                                                  const GuardianId& guardian_id,
                                                                  const std::string& encoded_share,
                                                                  TimePoint now) {
  return reconstructions_.SubmitShare(request_id, guardian_id, encoded_share, now);
}

Result<SigningOperation> GuardianSigningService::GetSessionStatus(const std::string& id,
                                                                  std::optional<SigningMethod> method) {
  if (!method.has_value() || *method == SigningMethod::kThresholdSignature) {
    Result<SigningSession> session = sessions_.GetSession(id);
    if (session.ok()) {
      return ToOperation(session.value());
    }
    if (session.code() != ErrorCode::kNotFound || method.has_value()) {
      return session.error();
    }
  }

  Result<ReconstructionRequest> request = reconstructions_.GetRequest(id);
  if (!request.ok()) {
    return request.error();
  }
  return ToOperation(request.value());
}

Result<SigningOperation> GuardianSigningService::FailSession(const std::string& id,
                                                             const std::string& reason,
                                                             std::optional<SigningMethod> method,
                                                             TimePoint now) {
  if (!method.has_value() || *method == SigningMethod::kThresholdSignature) {
    Result<SigningSession> failed = sessions_.FailSession(id, reason, now);
    if (failed.ok()) {
      return ToOperation(failed.value());
    }
    if (failed.code() != ErrorCode::kNotFound || method.has_value()) {
      return failed.error();
    }
  }

  Result<ReconstructionRequest> failed = reconstructions_.FailRequest(id, reason, now);
  if (!failed.ok()) {
    return failed.error();
  }
  return ToOperation(failed.value());
}

Result<SigningOperation> GuardianSigningService::RejectSigningRequest(const std::string& id,
                                                                      const GuardianId& guardian_id,
                                                                      const std::string& reason,
                                                                      std::optional<SigningMethod> method,
                                                                      TimePoint now) {
  if (!method.has_value() || *method == SigningMethod::kThresholdSignature) {
    Result<SigningSession> rejected = sessions_.RejectSession(id, guardian_id, reason, now);
    if (rejected.ok()) {
      return ToOperation(rejected.value());
    }
    if (rejected.code() != ErrorCode::kNotFound || method.has_value()) {
      return rejected.error();
    }
  }

  Result<ReconstructionRequest> rejected = reconstructions_.RejectRequest(id, guardian_id, reason, now);
  if (!rejected.ok()) {
    return rejected.error();
  }
  return ToOperation(rejected.value());
}

ExpirySweepResult GuardianSigningService::CleanupExpiredSessions(TimePoint now) {
  ExpirySweepResult result;
  result.sessions_expired = sessions_.ExpireOldSessions(now);
  result.requests_expired = reconstructions_.ExpireOldRequests(now);
  return result;
}

}  // namespace guardsig
