#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/time.hpp"
#include "guardsig/protocol/method_policy.hpp"
#include "guardsig/protocol/reconstruction_request.hpp"
#include "guardsig/protocol/threshold_session.hpp"
#include "guardsig/store/signing_store.hpp"

namespace guardsig {

struct MonitorConfig {
  std::chrono::hours metrics_window{24};
  double failure_rate_alert = 0.25;
  double expiry_rate_alert = 0.50;
  size_t min_finished_for_alert = 5;
  size_t max_active = 20;
};

struct MethodMetrics {
  size_t total = 0;
  size_t active = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t expired = 0;
  // Rates are over finished operations (completed + failed + expired).
  double success_rate = 0.0;
  double failure_rate = 0.0;
  double expiry_rate = 0.0;
  std::optional<std::chrono::milliseconds> average_completion_time;

  size_t finished() const { return completed + failed + expired; }
};

struct SigningMetrics {
  TimePoint window_start;
  TimePoint window_end;
  MethodMetrics threshold_signature;
  MethodMetrics key_reconstruction;
  MethodMetrics combined;
};

struct AlertDecision {
  bool alert = false;
  std::vector<std::string> reasons;
};

// Identifiers, method, status and timestamps only.
struct ActivityEntry {
  std::string id;
  SigningMethod method = SigningMethod::kThresholdSignature;
  std::string status;
  TimePoint created_at;
  TimePoint updated_at;
  std::optional<TimePoint> completed_at;
};

struct SweepReport {
  size_t sessions_expired = 0;
  size_t requests_expired = 0;
  size_t sessions_deleted = 0;
  size_t requests_deleted = 0;
};

class SigningMonitor {
 public:
  SigningMonitor(ISigningStore& store,
                 ThresholdSessionManager& sessions,
                 ReconstructionCoordinator& reconstructions,
                 MonitorConfig config = {},
                 std::shared_ptr<spdlog::logger> logger = nullptr);

  SigningMetrics GetMetrics(TimePoint now = Clock::now());
  AlertDecision ShouldAlert(const SigningMetrics& metrics) const;
  std::vector<ActivityEntry> GetRecentActivity(size_t limit = 20);

  // Expires stale operations of both methods, then deletes terminal ones
  // past retention.
  SweepReport RunSweep(TimePoint now = Clock::now());

 private:
  ISigningStore& store_;
  ThresholdSessionManager& sessions_;
  ReconstructionCoordinator& reconstructions_;
  MonitorConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guardsig
