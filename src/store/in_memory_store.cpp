#include "guardsig/store/in_memory_store.hpp"

namespace guardsig {
namespace {

template <typename Record>
StoreStatus ConditionalUpdate(std::unordered_map<std::string, Record>* table,
                              const std::string& id,
                              Record* record) {
  const auto it = table->find(id);
  if (it == table->end()) {
    return StoreStatus::kNotFound;
  }
  if (it->second.version != record->version) {
    return StoreStatus::kConflict;
  }
  ++record->version;
  it->second = *record;
  return StoreStatus::kOk;
}

template <typename Record>
StoreStatus FindRecord(const std::unordered_map<std::string, Record>& table, const std::string& id, Record* out) {
  const auto it = table.find(id);
  if (it == table.end()) {
    return StoreStatus::kNotFound;
  }
  *out = it->second;
  return StoreStatus::kOk;
}

}  // namespace

StoreStatus InMemorySigningStore::PutFamilyKey(const FamilyKey& key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  family_keys_.insert_or_assign(key.family_id, key);
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::GetFamilyKey(const std::string& family_id, FamilyKey* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  const auto it = family_keys_.find(family_id);
  if (it == family_keys_.end()) {
    return StoreStatus::kNotFound;
  }
  *out = it->second;
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::InsertSession(const SigningSession& session) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  if (!sessions_.emplace(session.session_id, session).second) {
    return StoreStatus::kDuplicate;
  }
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::GetSession(const std::string& session_id, SigningSession* out) {
  StoreStatus status = StoreStatus::kUnavailable;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!unavailable_) {
      status = FindRecord(sessions_, session_id, out);
    }
  }
  RunInterleaved(InterleavePoint::kGetSession);
  return status;
}

StoreStatus InMemorySigningStore::UpdateSession(SigningSession* session) {
  RunInterleaved(InterleavePoint::kUpdateSession);
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  return ConditionalUpdate(&sessions_, session->session_id, session);
}

std::vector<SigningSession> InMemorySigningStore::ListSessions() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<SigningSession> out;
  if (unavailable_) {
    return out;
  }
  out.reserve(sessions_.size());
  for (const auto& [id, session] : sessions_) {
    (void)id;
    out.push_back(session);
  }
  return out;
}

StoreStatus InMemorySigningStore::DeleteSession(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  if (sessions_.erase(session_id) == 0) {
    return StoreStatus::kNotFound;
  }
  for (auto it = commitments_.begin(); it != commitments_.end();) {
    if (it->first.first == session_id) {
      it = commitments_.erase(it);
    } else {
      ++it;
    }
  }
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::InsertCommitment(const NonceCommitment& commitment) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  if (commitment_values_.count(commitment.commitment_value) != 0) {
    return StoreStatus::kDuplicate;
  }
  const CommitmentKey key{commitment.session_id, commitment.participant_id};
  if (!commitments_.emplace(key, commitment).second) {
    return StoreStatus::kDuplicate;
  }
  commitment_values_.insert(commitment.commitment_value);
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::GetCommitment(const std::string& session_id,
                                                const GuardianId& participant_id,
                                                NonceCommitment* out) {
  StoreStatus status = StoreStatus::kUnavailable;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!unavailable_) {
      const auto it = commitments_.find(CommitmentKey{session_id, participant_id});
      if (it == commitments_.end()) {
        status = StoreStatus::kNotFound;
      } else {
        *out = it->second;
        status = StoreStatus::kOk;
      }
    }
  }
  RunInterleaved(InterleavePoint::kGetCommitment);
  return status;
}

StoreStatus InMemorySigningStore::MarkCommitmentUsed(const std::string& session_id,
                                                     const GuardianId& participant_id,
                                                     TimePoint used_at) {
  RunInterleaved(InterleavePoint::kMarkCommitmentUsed);
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  const auto it = commitments_.find(CommitmentKey{session_id, participant_id});
  if (it == commitments_.end()) {
    return StoreStatus::kNotFound;
  }
  if (it->second.used) {
    return StoreStatus::kConflict;
  }
  it->second.used = true;
  it->second.used_at = used_at;
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::InsertRequest(const ReconstructionRequest& request) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  if (!requests_.emplace(request.request_id, request).second) {
    return StoreStatus::kDuplicate;
  }
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::GetRequest(const std::string& request_id, ReconstructionRequest* out) {
  StoreStatus status = StoreStatus::kUnavailable;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!unavailable_) {
      status = FindRecord(requests_, request_id, out);
    }
  }
  RunInterleaved(InterleavePoint::kGetRequest);
  return status;
}

StoreStatus InMemorySigningStore::UpdateRequest(ReconstructionRequest* request) {
  RunInterleaved(InterleavePoint::kUpdateRequest);
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  return ConditionalUpdate(&requests_, request->request_id, request);
}

std::vector<ReconstructionRequest> InMemorySigningStore::ListRequests() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ReconstructionRequest> out;
  if (unavailable_) {
    return out;
  }
  out.reserve(requests_.size());
  for (const auto& [id, request] : requests_) {
    (void)id;
    out.push_back(request);
  }
  return out;
}

StoreStatus InMemorySigningStore::DeleteRequest(const std::string& request_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  return requests_.erase(request_id) == 0 ? StoreStatus::kNotFound : StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::InsertSchedule(const RotationSchedule& schedule) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  for (const auto& [id, existing] : schedules_) {
    (void)id;
    if (existing.user_id == schedule.user_id) {
      return StoreStatus::kDuplicate;
    }
  }
  if (!schedules_.emplace(schedule.schedule_id, schedule).second) {
    return StoreStatus::kDuplicate;
  }
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::GetSchedule(const std::string& schedule_id, RotationSchedule* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  const auto it = schedules_.find(schedule_id);
  if (it == schedules_.end()) {
    return StoreStatus::kNotFound;
  }
  *out = it->second;
  return StoreStatus::kOk;
}

StoreStatus InMemorySigningStore::FindScheduleByUser(const std::string& user_id, RotationSchedule* out) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  for (const auto& [id, schedule] : schedules_) {
    (void)id;
    if (schedule.user_id == user_id) {
      *out = schedule;
      return StoreStatus::kOk;
    }
  }
  return StoreStatus::kNotFound;
}

StoreStatus InMemorySigningStore::UpdateSchedule(RotationSchedule* schedule) {
  RunInterleaved(InterleavePoint::kUpdateSchedule);
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  return ConditionalUpdate(&schedules_, schedule->schedule_id, schedule);
}

std::vector<RotationSchedule> InMemorySigningStore::ListSchedules() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<RotationSchedule> out;
  if (unavailable_) {
    return out;
  }
  out.reserve(schedules_.size());
  for (const auto& [id, schedule] : schedules_) {
    (void)id;
    out.push_back(schedule);
  }
  return out;
}

StoreStatus InMemorySigningStore::PutAuditTrail(const RotationAuditTrail& trail) {
  RunInterleaved(InterleavePoint::kPutAuditTrail);
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  audit_trails_.insert_or_assign(trail.rotation_id(), trail);
  return StoreStatus::kOk;
}

std::optional<RotationAuditTrail> InMemorySigningStore::GetAuditTrail(const std::string& rotation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return std::nullopt;
  }
  const auto it = audit_trails_.find(rotation_id);
  if (it == audit_trails_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<RotationAuditTrail> InMemorySigningStore::ListAuditTrails(const std::string& user_id) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<RotationAuditTrail> out;
  if (unavailable_) {
    return out;
  }
  for (const auto& [id, trail] : audit_trails_) {
    (void)id;
    if (trail.user_id() == user_id) {
      out.push_back(trail);
    }
  }
  return out;
}

StoreStatus InMemorySigningStore::PutChecklist(const std::string& rotation_id,
                                               const RotationVerificationChecklist& checklist) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return StoreStatus::kUnavailable;
  }
  checklists_.insert_or_assign(rotation_id, checklist);
  return StoreStatus::kOk;
}

std::optional<RotationVerificationChecklist> InMemorySigningStore::GetChecklist(const std::string& rotation_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unavailable_) {
    return std::nullopt;
  }
  const auto it = checklists_.find(rotation_id);
  if (it == checklists_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void InMemorySigningStore::SetUnavailable(bool unavailable) {
  std::lock_guard<std::mutex> lock(mu_);
  unavailable_ = unavailable;
}

void InMemorySigningStore::InterleaveOnce(InterleavePoint point, std::function<void()> write) {
  std::lock_guard<std::mutex> lock(mu_);
  interleaved_[point] = std::move(write);
}

void InMemorySigningStore::RunInterleaved(InterleavePoint point) {
  std::function<void()> write;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = interleaved_.find(point);
    if (it == interleaved_.end()) {
      return;
    }
    write = std::move(it->second);
    interleaved_.erase(it);
  }
  write();
}

}  // namespace guardsig
