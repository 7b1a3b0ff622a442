#pragma once

#include <optional>
#include <string>
#include <vector>

#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/protocol/types.hpp"
#include "guardsig/rotation/audit_trail.hpp"
#include "guardsig/rotation/schedule.hpp"
#include "guardsig/rotation/verification.hpp"

namespace guardsig {

enum class StoreStatus {
  kOk = 0,
  kNotFound = 1,
  kDuplicate = 2,
  kConflict = 3,
  kUnavailable = 4,
};

const char* ToString(StoreStatus status);

// Maps a failed store call onto the service error space: kNotFound and
// kConflict keep their meaning, everything else is a persistence failure.
Error StoreFailure(StoreStatus status, const std::string& what);

// Persistence port. Versioned records (sessions, requests, schedules) are
// updated conditionally: Update succeeds only when the caller's `version`
// matches the stored one, and bumps it on both sides.
class ISigningStore {
 public:
  virtual ~ISigningStore() = default;

  virtual StoreStatus PutFamilyKey(const FamilyKey& key) = 0;
  virtual StoreStatus GetFamilyKey(const std::string& family_id, FamilyKey* out) = 0;

  virtual StoreStatus InsertSession(const SigningSession& session) = 0;
  virtual StoreStatus GetSession(const std::string& session_id, SigningSession* out) = 0;
  virtual StoreStatus UpdateSession(SigningSession* session) = 0;
  virtual std::vector<SigningSession> ListSessions() = 0;
  // Drops the session and its commitment rows. Commitment values stay
  // reserved, so they can never be accepted again.
  virtual StoreStatus DeleteSession(const std::string& session_id) = 0;

  // kDuplicate when the value was ever stored, or the participant already
  // committed in this session.
  virtual StoreStatus InsertCommitment(const NonceCommitment& commitment) = 0;
  virtual StoreStatus GetCommitment(const std::string& session_id,
                                    const GuardianId& participant_id,
                                    NonceCommitment* out) = 0;
  // Atomic used=false -> true flip. kConflict when already used.
  virtual StoreStatus MarkCommitmentUsed(const std::string& session_id,
                                         const GuardianId& participant_id,
                                         TimePoint used_at) = 0;

  virtual StoreStatus InsertRequest(const ReconstructionRequest& request) = 0;
  virtual StoreStatus GetRequest(const std::string& request_id, ReconstructionRequest* out) = 0;
  virtual StoreStatus UpdateRequest(ReconstructionRequest* request) = 0;
  virtual std::vector<ReconstructionRequest> ListRequests() = 0;
  virtual StoreStatus DeleteRequest(const std::string& request_id) = 0;

  // One schedule per user; kDuplicate otherwise.
  virtual StoreStatus InsertSchedule(const RotationSchedule& schedule) = 0;
  virtual StoreStatus GetSchedule(const std::string& schedule_id, RotationSchedule* out) = 0;
  virtual StoreStatus FindScheduleByUser(const std::string& user_id, RotationSchedule* out) = 0;
  virtual StoreStatus UpdateSchedule(RotationSchedule* schedule) = 0;
  virtual std::vector<RotationSchedule> ListSchedules() = 0;

  virtual StoreStatus PutAuditTrail(const RotationAuditTrail& trail) = 0;
  virtual std::optional<RotationAuditTrail> GetAuditTrail(const std::string& rotation_id) = 0;
  virtual std::vector<RotationAuditTrail> ListAuditTrails(const std::string& user_id) = 0;

  virtual StoreStatus PutChecklist(const std::string& rotation_id,
                                   const RotationVerificationChecklist& checklist) = 0;
  virtual std::optional<RotationVerificationChecklist> GetChecklist(const std::string& rotation_id) = 0;
};

}  // namespace guardsig
