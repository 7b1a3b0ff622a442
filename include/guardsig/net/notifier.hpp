#pragma once

#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "guardsig/common/time.hpp"
#include "guardsig/protocol/method_policy.hpp"
#include "guardsig/rotation/schedule.hpp"

namespace guardsig {

struct RotationNotification {
  std::string schedule_id;
  std::string user_id;
  RotationNotificationType type = RotationNotificationType::kNone;
  TimePoint next_rotation_at;
  double days_until = 0.0;
};

class IRotationNotifier {
 public:
  virtual ~IRotationNotifier() = default;

  // Throws std::runtime_error when delivery fails.
  virtual void Notify(const RotationNotification& notification) = 0;
};

class InMemoryRotationNotifier : public IRotationNotifier {
 public:
  void Notify(const RotationNotification& notification) override;

  std::vector<RotationNotification> sent() const;

 private:
  mutable std::mutex mu_;
  std::vector<RotationNotification> sent_;
};

// Invites one guardian into a signing operation: a threshold session asks
// for a nonce commitment, a reconstruction request for a share.
struct GuardianSigningRequest {
  std::string guardian_id;
  std::string family_id;
  std::string operation_id;
  SigningMethod method = SigningMethod::kThresholdSignature;
  std::string message_digest;
  std::string event_type;
  std::string requested_by;
  TimePoint expires_at;
};

class IGuardianNotifier {
 public:
  virtual ~IGuardianNotifier() = default;

  // Throws std::runtime_error when delivery fails.
  virtual void NotifySigningRequest(const GuardianSigningRequest& request) = 0;
};

class InMemoryGuardianNotifier : public IGuardianNotifier {
 public:
  void NotifySigningRequest(const GuardianSigningRequest& request) override;

  std::vector<GuardianSigningRequest> sent() const;
  // Deliveries to `guardian_id` fail while set.
  void SetUnreachable(const std::string& guardian_id, bool unreachable);

 private:
  mutable std::mutex mu_;
  std::vector<GuardianSigningRequest> sent_;
  std::set<std::string> unreachable_;
};

}  // namespace guardsig
