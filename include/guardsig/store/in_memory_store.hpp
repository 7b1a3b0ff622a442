#pragma once

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "guardsig/store/signing_store.hpp"

namespace guardsig {

// Single-process store; one mutex guards every table.
class InMemorySigningStore : public ISigningStore {
 public:
  StoreStatus PutFamilyKey(const FamilyKey& key) override;
  StoreStatus GetFamilyKey(const std::string& family_id, FamilyKey* out) override;

  StoreStatus InsertSession(const SigningSession& session) override;
  StoreStatus GetSession(const std::string& session_id, SigningSession* out) override;
  StoreStatus UpdateSession(SigningSession* session) override;
  std::vector<SigningSession> ListSessions() override;
  StoreStatus DeleteSession(const std::string& session_id) override;

  StoreStatus InsertCommitment(const NonceCommitment& commitment) override;
  StoreStatus GetCommitment(const std::string& session_id,
                            const GuardianId& participant_id,
                            NonceCommitment* out) override;
  StoreStatus MarkCommitmentUsed(const std::string& session_id,
                                 const GuardianId& participant_id,
                                 TimePoint used_at) override;

  StoreStatus InsertRequest(const ReconstructionRequest& request) override;
  StoreStatus GetRequest(const std::string& request_id, ReconstructionRequest* out) override;
  StoreStatus UpdateRequest(ReconstructionRequest* request) override;
  std::vector<ReconstructionRequest> ListRequests() override;
  StoreStatus DeleteRequest(const std::string& request_id) override;

  StoreStatus InsertSchedule(const RotationSchedule& schedule) override;
  StoreStatus GetSchedule(const std::string& schedule_id, RotationSchedule* out) override;
  StoreStatus FindScheduleByUser(const std::string& user_id, RotationSchedule* out) override;
  StoreStatus UpdateSchedule(RotationSchedule* schedule) override;
  std::vector<RotationSchedule> ListSchedules() override;

  StoreStatus PutAuditTrail(const RotationAuditTrail& trail) override;
  std::optional<RotationAuditTrail> GetAuditTrail(const std::string& rotation_id) override;
  std::vector<RotationAuditTrail> ListAuditTrails(const std::string& user_id) override;

  StoreStatus PutChecklist(const std::string& rotation_id,
                           const RotationVerificationChecklist& checklist) override;
  std::optional<RotationVerificationChecklist> GetChecklist(const std::string& rotation_id) override;

  // Test hook: every subsequent call reports kUnavailable while set.
  void SetUnavailable(bool unavailable);

  enum class InterleavePoint {
    kGetSession,
    kUpdateSession,
    kGetCommitment,
    kMarkCommitmentUsed,
    kGetRequest,
    kUpdateRequest,
    kUpdateSchedule,
    kPutAuditTrail,
  };

  // Test hook: runs `write` once, without the lock held, on the next call at
  // `point`. Reads run it after copying their result, writes before applying
  // theirs, so `write` lands between a caller's read and its update.
  void InterleaveOnce(InterleavePoint point, std::function<void()> write);

 private:
  using CommitmentKey = std::pair<std::string, GuardianId>;

  void RunInterleaved(InterleavePoint point);

  bool unavailable_ = false;
  std::map<InterleavePoint, std::function<void()>> interleaved_;

  std::unordered_map<std::string, FamilyKey> family_keys_;
  std::unordered_map<std::string, SigningSession> sessions_;
  std::map<CommitmentKey, NonceCommitment> commitments_;
  std::unordered_set<std::string> commitment_values_;
  std::unordered_map<std::string, ReconstructionRequest> requests_;
  std::unordered_map<std::string, RotationSchedule> schedules_;
  std::unordered_map<std::string, RotationAuditTrail> audit_trails_;
  std::unordered_map<std::string, RotationVerificationChecklist> checklists_;
  std::mutex mu_;
};

}  // namespace guardsig
