#include "guardsig/net/notifier.hpp"

#include <stdexcept>

namespace guardsig {

void InMemoryRotationNotifier::Notify(const RotationNotification& notification) {
  if (notification.type == RotationNotificationType::kNone) {
    throw std::invalid_argument("notification type must not be none");
  }

  std::lock_guard<std::mutex> lock(mu_);
  sent_.push_back(notification);
}

std::vector<RotationNotification> InMemoryRotationNotifier::sent() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sent_;
}

void InMemoryGuardianNotifier::NotifySigningRequest(const GuardianSigningRequest& request) {
  if (request.guardian_id.empty() || request.operation_id.empty()) {
    throw std::invalid_argument("signing request must name a guardian and an operation");
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (unreachable_.count(request.guardian_id) != 0) {
    throw std::runtime_error("guardian " + request.guardian_id + " is unreachable");
  }
  sent_.push_back(request);
}

std::vector<GuardianSigningRequest> InMemoryGuardianNotifier::sent() const {
  std::lock_guard<std::mutex> lock(mu_);
  return sent_;
}

void InMemoryGuardianNotifier::SetUnreachable(const std::string& guardian_id, bool unreachable) {
  std::lock_guard<std::mutex> lock(mu_);
  if (unreachable) {
    unreachable_.insert(guardian_id);
  } else {
    unreachable_.erase(guardian_id);
  }
}

}  // namespace guardsig
