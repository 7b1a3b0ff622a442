#include "guardsig/protocol/reconstruction_request.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "guardsig/common/log.hpp"
#include "guardsig/crypto/encoding.hpp"
#include "guardsig/crypto/random.hpp"
#include "guardsig/crypto/schnorr.hpp"

namespace guardsig {
namespace {

bool Contains(const std::vector<GuardianId>& ids, const GuardianId& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

bool IsPastExpiry(const ReconstructionRequest& request, TimePoint now) {
  return !IsTerminal(request.status) && now >= request.expires_at;
}

}  // namespace

ReconstructionCoordinator::ReconstructionCoordinator(ISigningStore& store,
                                                     IEventPublisher& publisher,
                                                     IGuardianNotifier& guardian_notifier,
                                                     ReconstructionConfig config,
                                                     std::shared_ptr<spdlog::logger> logger)
    : store_(store),
      publisher_(publisher),
      guardian_notifier_(guardian_notifier),
      config_(config),
      logger_(LoggerOrDefault(std::move(logger))) {
  if (config_.default_expiry.count() <= 0) {
    throw std::invalid_argument("request expiry must be positive");
  }
  if (config_.max_update_attempts <= 0) {
    throw std::invalid_argument("max_update_attempts must be positive");
  }
}

Result<ReconstructionRequest> ReconstructionCoordinator::CreateRequest(const CreateRequestParams& params,
                                                                       TimePoint now) {
  if (params.family_id.empty()) {
    return MakeError(ErrorCode::kValidation, "family_id is required");
  }
  if (params.message_digest.size() != 32) {
    return MakeError(ErrorCode::kValidation, "message digest must be 32 bytes");
  }
  const std::set<GuardianId> unique(params.required_guardians.begin(), params.required_guardians.end());
  if (unique.size() != params.required_guardians.size()) {
    return MakeError(ErrorCode::kValidation, "required guardians must be unique");
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
  if (threshold < key.threshold) {
    return MakeError(ErrorCode::kValidation,
                     "threshold is below the family key threshold of " + std::to_string(key.threshold));
  }
  if (threshold > params.required_guardians.size()) {
    return MakeError(ErrorCode::kValidation, "threshold exceeds number of required guardians");
  }
  for (const GuardianId& guardian : params.required_guardians) {
    if (key.guardians.count(guardian) == 0) {
      return MakeError(ErrorCode::kValidation, "required guardian is not a guardian of this family");
    }
  }

  ReconstructionRequest request;
  request.request_id = Csprng::RandomId();
  request.family_id = params.family_id;
  std::copy(params.message_digest.begin(), params.message_digest.end(), request.message_digest.begin());
  request.required_guardians = params.required_guardians;
  request.threshold = threshold;
  request.status = ReconstructionStatus::kPending;
  request.created_by = params.created_by;
  request.event_type = params.event_type;
  request.created_at = now;
  request.updated_at = now;
  request.expires_at = now + params.expires_in.value_or(config_.default_expiry);
  request.version = 1;

  const StoreStatus status = store_.InsertRequest(request);
  if (status != StoreStatus::kOk) {
    logger_->error("failed to persist reconstruction request {}: {}", request.request_id, ToString(status));
    return StoreFailure(status, "reconstruction request");
  }
  logger_->info("reconstruction request {} created for family {} (threshold {})",
                request.request_id, request.family_id, request.threshold);
  NotifyGuardians(request);
  return request;
}

Result<ReconstructionRequest> ReconstructionCoordinator::GetRequest(const std::string& request_id) {
  ReconstructionRequest request;
  const StoreStatus status = store_.GetRequest(request_id, &request);
  if (status != StoreStatus::kOk) {
    return StoreFailure(status, "reconstruction request");
  }
  return request;
}

Result<ReconstructionRequest> ReconstructionCoordinator::SubmitShare(const std::string& request_id,
                                                                     const GuardianId& guardian_id,
                                                                     const std::string& encoded_share,
                                                                     TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);

  Result<ReconstructionRequest> loaded = LoadPendingLocked(request_id, now);
  if (!loaded.ok()) {
    return loaded;
  }
  const ReconstructionRequest& current = loaded.value();
  if (!Contains(current.required_guardians, guardian_id)) {
    logger_->warn("rejected share for request {}: guardian not required", request_id);
    return MakeError(ErrorCode::kValidation, "guardian is not required for this request");
  }
  if (current.rejections.count(guardian_id) != 0) {
    return MakeError(ErrorCode::kState, "guardian has rejected this request");
  }
  if (Contains(current.submitted_guardians, guardian_id)) {
    logger_->warn("rejected duplicate share for request {}", request_id);
    return MakeError(ErrorCode::kReplay, "guardian has already submitted a share");
  }

  FamilyKey key;
  const StoreStatus key_status = store_.GetFamilyKey(current.family_id, &key);
  if (key_status != StoreStatus::kOk) {
    return StoreFailure(key_status, "family key");
  }

  Zeroizing<std::vector<Share>> decoded;
  try {
    decoded->push_back(DecodeShare(encoded_share));
  } catch (const std::invalid_argument& ex) {
    logger_->warn("rejected malformed share for request {}", request_id);
    return MakeError(ErrorCode::kValidation, std::string("invalid share: ") + ex.what());
  }
  const Share& share = decoded->front();
  if (share.secret_id != key.secret_id || share.threshold != key.threshold) {
    return MakeError(ErrorCode::kValidation, "share does not belong to this family key");
  }
  const auto guardian = key.guardians.find(guardian_id);
  if (guardian == key.guardians.end() || guardian->second.share_index != share.index) {
    return MakeError(ErrorCode::kValidation, "share index does not match the guardian's assignment");
  }

  Result<ReconstructionRequest> updated = Transition(request_id, now, [&](ReconstructionRequest* r) -> Result<bool> {
    if (IsTerminal(r->status)) {
      return MakeError(ErrorCode::kState, std::string("shares are not accepted in status ") + ToString(r->status));
    }
    if (r->rejections.count(guardian_id) != 0) {
      return MakeError(ErrorCode::kState, "guardian has rejected this request");
    }
    if (Contains(r->submitted_guardians, guardian_id)) {
      return MakeError(ErrorCode::kReplay, "guardian has already submitted a share");
    }
    r->submitted_guardians.push_back(guardian_id);
    r->updated_at = now;
    return true;
  });
  if (!updated.ok()) {
    return updated;
  }

  ShareSet& held = held_shares_[request_id];
  held->push_back(share);
  logger_->info("request {} accepted share {}/{}", request_id, updated.value().submitted_guardians.size(),
                updated.value().threshold);

  if (updated.value().submitted_guardians.size() < updated.value().threshold) {
    return updated;
  }
  return SignAndPublish(updated.value(), key, now);
}

Result<ReconstructionRequest> ReconstructionCoordinator::FailRequest(const std::string& request_id,
                                                                     const std::string& reason,
                                                                     TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  return FailLocked(request_id, reason, now);
}

Result<ReconstructionRequest> ReconstructionCoordinator::RejectRequest(const std::string& request_id,
                                                                       const GuardianId& guardian_id,
                                                                       const std::string& reason,
                                                                       TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);

  Result<ReconstructionRequest> loaded = LoadPendingLocked(request_id, now);
  if (!loaded.ok()) {
    return loaded;
  }

  Result<ReconstructionRequest> updated = Transition(request_id, now, [&](ReconstructionRequest* r) -> Result<bool> {
    if (IsTerminal(r->status)) {
      return MakeError(ErrorCode::kState, std::string("request is already ") + ToString(r->status));
    }
    if (!Contains(r->required_guardians, guardian_id)) {
      return MakeError(ErrorCode::kValidation, "guardian is not required for this request");
    }
    if (r->rejections.count(guardian_id) != 0) {
      return MakeError(ErrorCode::kReplay, "guardian has already rejected this request");
    }
    if (Contains(r->submitted_guardians, guardian_id)) {
      return MakeError(ErrorCode::kState, "guardian has already submitted a share");
    }

    r->rejections[guardian_id] = reason.empty() ? "declined" : reason;
    const size_t remaining = r->required_guardians.size() - r->rejections.size();
    if (remaining < r->threshold) {
      r->status = ReconstructionStatus::kFailed;
      r->error_message = "threshold unreachable: " + std::to_string(r->rejections.size()) + " of " +
                         std::to_string(r->required_guardians.size()) + " guardians rejected";
      r->failed_at = now;
    }
    r->updated_at = now;
    return true;
  });
  if (!updated.ok()) {
    return updated;
  }

  const ReconstructionRequest& request = updated.value();
  logger_->info("request {} rejected by a guardian ({}/{} declined)", request_id, request.rejections.size(),
                request.required_guardians.size());
  if (request.status == ReconstructionStatus::kFailed) {
    logger_->info("request {} failed: {}", request_id, *request.error_message);
  }
  return updated;
}

size_t ReconstructionCoordinator::ExpireOldRequests(TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  size_t expired = 0;
  for (const ReconstructionRequest& request : store_.ListRequests()) {
    if (!IsPastExpiry(request, now)) {
      continue;
    }
    Result<ReconstructionRequest> result = Transition(request.request_id, now, [](ReconstructionRequest*) -> Result<bool> {
      return false;
    });
    if (result.code() == ErrorCode::kTimeout) {
      ++expired;
    }
  }
  if (expired > 0) {
    logger_->info("expired {} reconstruction requests", expired);
  }
  return expired;
}

size_t ReconstructionCoordinator::CleanupOldRequests(TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  const TimePoint cutoff = now - config_.retention;
  size_t deleted = 0;
  for (const ReconstructionRequest& request : store_.ListRequests()) {
    if (!IsTerminal(request.status) || request.updated_at >= cutoff) {
      continue;
    }
    const StoreStatus status = store_.DeleteRequest(request.request_id);
    if (status == StoreStatus::kOk) {
      WipeSharesLocked(request.request_id);
      ++deleted;
    } else if (status != StoreStatus::kNotFound) {
      logger_->error("failed to delete reconstruction request {}: {}", request.request_id, ToString(status));
    }
  }
  if (deleted > 0) {
    logger_->info("deleted {} reconstruction requests older than {} days", deleted, config_.retention.count());
  }
  return deleted;
}

size_t ReconstructionCoordinator::HeldShareCount(const std::string& request_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = held_shares_.find(request_id);
  return it == held_shares_.end() ? 0 : it->second->size();
}

Result<ReconstructionRequest> ReconstructionCoordinator::Transition(const std::string& request_id,
                                                                    TimePoint now,
                                                                    const RequestMutator& mutate) {
  for (int attempt = 0; attempt < config_.max_update_attempts; ++attempt) {
    ReconstructionRequest request;
    const StoreStatus read = store_.GetRequest(request_id, &request);
    if (read != StoreStatus::kOk) {
      return StoreFailure(read, "reconstruction request");
    }

    bool expiring = false;
    if (IsPastExpiry(request, now)) {
      request.status = ReconstructionStatus::kExpired;
      request.updated_at = now;
      expiring = true;
    } else {
      Result<bool> changed = mutate(&request);
      if (!changed.ok()) {
        return changed.error();
      }
      if (!changed.value()) {
        return request;
      }
    }

    const StoreStatus written = store_.UpdateRequest(&request);
    if (written == StoreStatus::kConflict) {
      continue;
    }
    if (written != StoreStatus::kOk) {
      logger_->error("failed to update reconstruction request {}: {}", request_id, ToString(written));
      return StoreFailure(written, "reconstruction request");
    }
    if (IsTerminal(request.status)) {
      WipeSharesLocked(request_id);
    }
    if (expiring) {
      logger_->info("request {} expired", request_id);
      return MakeError(ErrorCode::kTimeout, "reconstruction request has expired");
    }
    return request;
  }
  return MakeError(ErrorCode::kConflict, "reconstruction request was modified concurrently");
}

Result<ReconstructionRequest> ReconstructionCoordinator::SignAndPublish(const ReconstructionRequest& request,
                                                                        const FamilyKey& key,
                                                                        TimePoint now) {
  const std::string& request_id = request.request_id;
  auto fail = [&](const std::string& reason) -> Result<ReconstructionRequest> {
    Result<ReconstructionRequest> failed = FailLocked(request_id, reason, now);
    if (!failed.ok()) {
      return failed;
    }
    return MakeError(ErrorCode::kAggregation, reason);
  };

  std::string signature_hex;
  try {
    Zeroizing<Scalar> secret = ReconstructSecret(held_shares_.at(request_id).get());
    WipeSharesLocked(request_id);
    if (ECPoint::GeneratorMultiply(secret.get()) != key.group_public_key) {
      return fail("reconstructed key does not match the family public key");
    }

    const SchnorrSignature signature = SchnorrSign(secret.get(), request.message_digest);
    secret.Wipe();
    if (!SchnorrVerify(signature, request.message_digest, key.group_public_key.XOnlyBytes())) {
      return fail("signature failed verification");
    }
    signature_hex = HexEncode(signature);
  } catch (const std::exception& ex) {
    WipeSharesLocked(request_id);
    logger_->error("request {}: reconstruction failed: {}", request_id, ex.what());
    return fail(std::string("key reconstruction failed: ") + ex.what());
  }

  const SignedEvent event{
      .event_id = HexEncode(request.message_digest),
      .origin_id = request_id,
      .family_id = request.family_id,
      .event_type = request.event_type,
      .pubkey = HexEncode(key.group_public_key.XOnlyBytes()),
      .signature = signature_hex,
      .signed_at = now,
  };
  std::string event_id;
  try {
    event_id = publisher_.Publish(event);
  } catch (const std::exception& ex) {
    logger_->error("request {}: publishing signed event failed: {}", request_id, ex.what());
    Result<ReconstructionRequest> failed = FailLocked(request_id, "publication failed", now);
    if (!failed.ok()) {
      return failed;
    }
    return MakeError(ErrorCode::kPersistence, "signed event could not be published");
  }

  Result<ReconstructionRequest> completed = Transition(request_id, now, [&](ReconstructionRequest* r) -> Result<bool> {
    if (IsTerminal(r->status)) {
      return MakeError(ErrorCode::kState, std::string("request is already ") + ToString(r->status));
    }
    r->status = ReconstructionStatus::kCompleted;
    r->signature = signature_hex;
    r->final_event_id = event_id;
    r->completed_at = now;
    r->updated_at = now;
    return true;
  });
  if (completed.ok()) {
    logger_->info("request {} completed, published event {}", request_id, event_id);
  }
  return completed;
}

Result<ReconstructionRequest> ReconstructionCoordinator::FailLocked(const std::string& request_id,
                                                                    const std::string& reason,
                                                                    TimePoint now) {
  Result<ReconstructionRequest> failed = Transition(request_id, now, [&](ReconstructionRequest* r) -> Result<bool> {
    if (IsTerminal(r->status)) {
      return MakeError(ErrorCode::kState, std::string("request is already ") + ToString(r->status));
    }
    r->status = ReconstructionStatus::kFailed;
    r->error_message = reason;
    r->failed_at = now;
    r->updated_at = now;
    return true;
  });
  if (failed.ok()) {
    logger_->info("request {} failed: {}", request_id, reason);
  }
  return failed;
}

Result<ReconstructionRequest> ReconstructionCoordinator::LoadPendingLocked(const std::string& request_id,
                                                                           TimePoint now) {
  Result<ReconstructionRequest> loaded = GetRequest(request_id);
  if (!loaded.ok()) {
    return loaded;
  }
  const ReconstructionRequest& current = loaded.value();
  if (current.status == ReconstructionStatus::kExpired) {
    return MakeError(ErrorCode::kTimeout, "reconstruction request has expired");
  }
  if (IsPastExpiry(current, now)) {
    Result<ReconstructionRequest> expired = Transition(request_id, now, [](ReconstructionRequest*) -> Result<bool> {
      return false;
    });
    if (!expired.ok()) {
      return expired.error();
    }
    // Another writer moved it to a terminal status first.
    WipeSharesLocked(request_id);
    return MakeError(ErrorCode::kState,
                     std::string("request is already ") + ToString(expired.value().status));
  }
  if (IsTerminal(current.status)) {
    WipeSharesLocked(request_id);
    return MakeError(ErrorCode::kState,
                     std::string("request is already ") + ToString(current.status));
  }
  return loaded;
}

void ReconstructionCoordinator::NotifyGuardians(const ReconstructionRequest& request) {
  size_t notified = 0;
  for (const GuardianId& guardian : request.required_guardians) {
    try {
      guardian_notifier_.NotifySigningRequest(GuardianSigningRequest{
          .guardian_id = guardian,
          .family_id = request.family_id,
          .operation_id = request.request_id,
          .method = SigningMethod::kKeyReconstruction,
          .message_digest = HexEncode(request.message_digest),
          .event_type = request.event_type,
          .requested_by = request.created_by,
          .expires_at = request.expires_at,
      });
      ++notified;
    } catch (const std::exception& ex) {
      logger_->warn("request {}: share request to a guardian was not delivered: {}", request.request_id, ex.what());
    }
  }
  logger_->info("request {} notified {}/{} guardians", request.request_id, notified,
                request.required_guardians.size());
}

void ReconstructionCoordinator::WipeSharesLocked(const std::string& request_id) {
  const auto it = held_shares_.find(request_id);
  if (it != held_shares_.end()) {
    it->second.Wipe();
    held_shares_.erase(it);
  }
}

}  // namespace guardsig
