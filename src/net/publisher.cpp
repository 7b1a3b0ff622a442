#include "guardsig/net/publisher.hpp"

#include <stdexcept>

namespace guardsig {

std::string InMemoryEventPublisher::Publish(const SignedEvent& event) {
  if (event.event_id.empty()) {
    throw std::invalid_argument("SignedEvent.event_id must not be empty");
  }
  if (event.signature.empty()) {
    throw std::invalid_argument("SignedEvent.signature must not be empty");
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (failing_) {
    throw std::runtime_error("relay rejected event");
  }
  published_.push_back(event);
  return event.event_id;
}

std::vector<SignedEvent> InMemoryEventPublisher::published() const {
  std::lock_guard<std::mutex> lock(mu_);
  return published_;
}

void InMemoryEventPublisher::SetFailing(bool failing) {
  std::lock_guard<std::mutex> lock(mu_);
  failing_ = failing;
}

}  // namespace guardsig
