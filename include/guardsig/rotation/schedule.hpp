#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "guardsig/common/time.hpp"

namespace guardsig {

constexpr uint32_t kDefaultRotationIntervalDays = 90;
constexpr uint32_t kMinRotationIntervalDays = 30;
constexpr uint32_t kMaxRotationIntervalDays = 365;
constexpr uint32_t kDefaultRotationGraceDays = 7;
constexpr uint32_t kRotationNotificationHorizonDays = 14;

enum class RotationNotificationType {
  kNone = 0,
  kUpcoming = 1,
  kDue = 2,
  kOverdue = 3,
};

const char* ToString(RotationNotificationType type);

enum class RotationRunStatus {
  kNever = 0,
  kSuccess = 1,
  kFailed = 2,
};

const char* ToString(RotationRunStatus status);

struct RotationSchedule {
  std::string schedule_id;
  std::string user_id;
  uint32_t rotation_interval_days = kDefaultRotationIntervalDays;
  TimePoint created_at;
  TimePoint last_rotation_at;
  TimePoint next_rotation_at;
  bool enabled = true;

  uint32_t rotation_count = 0;
  uint32_t failure_count = 0;
  std::chrono::milliseconds average_rotation_time{0};
  RotationRunStatus last_status = RotationRunStatus::kNever;
  std::optional<std::string> last_error;
  std::optional<TimePoint> last_failure_at;
  // Rotation whose outcome was recorded last.
  std::optional<std::string> last_recorded_rotation;

  // Notification bookkeeping: the type last sent and the due date it was
  // sent for, so each type goes out once per cycle.
  std::optional<RotationNotificationType> last_notified_type;
  std::optional<TimePoint> last_notified_for;

  uint64_t version = 0;
};

// Throws std::invalid_argument for an empty user or an interval outside
// [30, 365] days.
RotationSchedule CreateSchedule(const std::string& user_id,
                                uint32_t interval_days = kDefaultRotationIntervalDays,
                                TimePoint start = Clock::now());

bool IsDue(const RotationSchedule& schedule, TimePoint now = Clock::now());
bool IsOverdue(const RotationSchedule& schedule,
               TimePoint now = Clock::now(),
               uint32_t grace_days = kDefaultRotationGraceDays);

// Fractional days until `next_rotation_at`; negative once past due.
double DaysUntilRotation(const RotationSchedule& schedule, TimePoint now = Clock::now());

// `due` within one day either side of the due date, `upcoming` when 1 to
// `horizon_days` days remain, `overdue` past the grace period.
RotationNotificationType GetNotificationType(const RotationSchedule& schedule,
                                             TimePoint now = Clock::now(),
                                             uint32_t grace_days = kDefaultRotationGraceDays,
                                             uint32_t horizon_days = kRotationNotificationHorizonDays);

void UpdateAfterRotation(RotationSchedule* schedule,
                         std::chrono::milliseconds duration,
                         TimePoint at = Clock::now());
void UpdateAfterFailure(RotationSchedule* schedule,
                        const std::string& error,
                        TimePoint at = Clock::now());

// Re-plans the next rotation from the last one. Throws std::invalid_argument
// outside [30, 365] days.
void UpdateRotationInterval(RotationSchedule* schedule, uint32_t interval_days);

}  // namespace guardsig
