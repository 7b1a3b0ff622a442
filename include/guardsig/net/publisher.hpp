#pragma once

#include <mutex>
#include <string>
#include <vector>

#include "guardsig/common/time.hpp"

namespace guardsig {

struct SignedEvent {
  std::string event_id;
  std::string origin_id;
  std::string family_id;
  std::string event_type;
  std::string pubkey;
  std::string signature;
  TimePoint signed_at;
};

class IEventPublisher {
 public:
  virtual ~IEventPublisher() = default;

  // Returns the published event id. Throws std::runtime_error when the event
  // could not be published.
  virtual std::string Publish(const SignedEvent& event) = 0;
};

class InMemoryEventPublisher : public IEventPublisher {
 public:
  std::string Publish(const SignedEvent& event) override;

  std::vector<SignedEvent> published() const;
  void SetFailing(bool failing);

 private:
  mutable std::mutex mu_;
  std::vector<SignedEvent> published_;
  bool failing_ = false;
};

}  // namespace guardsig
