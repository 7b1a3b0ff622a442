#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/net/notifier.hpp"
#include "guardsig/rotation/schedule.hpp"
#include "guardsig/store/signing_store.hpp"

namespace guardsig {

struct RotationConfig {
  uint32_t grace_days = kDefaultRotationGraceDays;
  uint32_t notification_horizon_days = kRotationNotificationHorizonDays;
  std::chrono::days deprecation_window{30};
  int max_update_attempts = 3;
};

struct RotationPerformance {
  uint32_t rotation_count = 0;
  uint32_t failure_count = 0;
  double success_rate = 0.0;
  std::chrono::milliseconds average_rotation_time{0};
};

// Persists one rotation schedule per user and decides when rotations and
// reminders are due.
class RotationScheduler {
 public:
  RotationScheduler(ISigningStore& store,
                    IRotationNotifier& notifier,
                    RotationConfig config = {},
                    std::shared_ptr<spdlog::logger> logger = nullptr);

  Result<RotationSchedule> CreateSchedule(const std::string& user_id,
                                          uint32_t interval_days = kDefaultRotationIntervalDays,
                                          TimePoint now = Clock::now());
  Result<RotationSchedule> GetSchedule(const std::string& user_id);

  Result<RotationSchedule> SetEnabled(const std::string& user_id, bool enabled);
  Result<RotationSchedule> UpdateRotationInterval(const std::string& user_id, uint32_t interval_days);
  // A non-empty `rotation_id` records that rotation's outcome at most once.
  Result<RotationSchedule> RecordRotation(const std::string& user_id,
                                          std::chrono::milliseconds duration,
                                          TimePoint at = Clock::now(),
                                          const std::string& rotation_id = "");
  Result<RotationSchedule> RecordFailure(const std::string& user_id,
                                         const std::string& error,
                                         TimePoint at = Clock::now(),
                                         const std::string& rotation_id = "");

  std::vector<RotationSchedule> GetDueSchedules(TimePoint now = Clock::now());
  std::vector<RotationSchedule> GetOverdueSchedules(TimePoint now = Clock::now());

  // Sends each notification type at most once per due date. Returns the
  // number sent.
  size_t DispatchNotifications(TimePoint now = Clock::now());

  Result<RotationPerformance> GetPerformanceMetrics(const std::string& user_id);

  const RotationConfig& config() const;

 private:
  using ScheduleMutator = std::function<Result<bool>(RotationSchedule* schedule)>;

  Result<RotationSchedule> Update(const std::string& user_id, const ScheduleMutator& mutate);

  ISigningStore& store_;
  IRotationNotifier& notifier_;
  RotationConfig config_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace guardsig
