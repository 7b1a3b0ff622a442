#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/bytes.hpp"
#include "guardsig/common/error.hpp"
#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/crypto/shamir.hpp"
#include "guardsig/net/notifier.hpp"
#include "guardsig/net/publisher.hpp"
#include "guardsig/protocol/types.hpp"
#include "guardsig/store/signing_store.hpp"

namespace guardsig {

struct ReconstructionConfig {
  std::chrono::seconds default_expiry{2 * 60 * 60};
  int max_update_attempts = 3;
  std::chrono::days retention{90};
};

struct CreateRequestParams {
  std::string family_id;
  Bytes message_digest;
  std::vector<GuardianId> required_guardians;
  // 0 uses the family key threshold.
  uint32_t threshold = 0;
  std::string created_by;
  std::string event_type;
  std::optional<std::chrono::seconds> expires_in;
};

// One-round signing that briefly reconstructs the family key in memory.
// Submitted shares live only inside this coordinator and are wiped as soon
// as the request leaves `pending`.
class ReconstructionCoordinator {
 public:
  ReconstructionCoordinator(ISigningStore& store,
                            IEventPublisher& publisher,
                            IGuardianNotifier& guardian_notifier,
                            ReconstructionConfig config = {},
                            std::shared_ptr<spdlog::logger> logger = nullptr);

  Result<ReconstructionRequest> CreateRequest(const CreateRequestParams& params, TimePoint now = Clock::now());
  Result<ReconstructionRequest> GetRequest(const std::string& request_id);

  // Once the threshold is reached the key is reconstructed, checked against
  // the family public key, used to sign, then wiped.
  Result<ReconstructionRequest> SubmitShare(const std::string& request_id,
                                            const GuardianId& guardian_id,
                                            const std::string& encoded_share,
                                            TimePoint now = Clock::now());

  Result<ReconstructionRequest> FailRequest(const std::string& request_id,
                                            const std::string& reason,
                                            TimePoint now = Clock::now());

  // Records `guardian_id` declining to contribute a share. The request fails
  // once the guardians left can no longer reach the threshold.
  Result<ReconstructionRequest> RejectRequest(const std::string& request_id,
                                              const GuardianId& guardian_id,
                                              const std::string& reason,
                                              TimePoint now = Clock::now());

  size_t ExpireOldRequests(TimePoint now = Clock::now());
  size_t CleanupOldRequests(TimePoint now = Clock::now());

  size_t HeldShareCount(const std::string& request_id) const;

 private:
  using RequestMutator = std::function<Result<bool>(ReconstructionRequest* request)>;

  Result<ReconstructionRequest> Transition(const std::string& request_id, TimePoint now, const RequestMutator& mutate);
  Result<ReconstructionRequest> SignAndPublish(const ReconstructionRequest& request,
                                               const FamilyKey& key,
                                               TimePoint now);
  Result<ReconstructionRequest> FailLocked(const std::string& request_id, const std::string& reason, TimePoint now);
  // Loads a request that still accepts guardian input, persisting a lapsed
  // expiry on the way.
  Result<ReconstructionRequest> LoadPendingLocked(const std::string& request_id, TimePoint now);
  void NotifyGuardians(const ReconstructionRequest& request);
  void WipeSharesLocked(const std::string& request_id);

  ISigningStore& store_;
  IEventPublisher& publisher_;
  IGuardianNotifier& guardian_notifier_;
  ReconstructionConfig config_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, ShareSet> held_shares_;
};

}  // namespace guardsig
