#include "guardsig/rotation/schedule.hpp"

#include <cmath>
#include <stdexcept>

#include "guardsig/crypto/random.hpp"

namespace guardsig {
namespace {

void ValidateInterval(uint32_t interval_days) {
  if (interval_days < kMinRotationIntervalDays || interval_days > kMaxRotationIntervalDays) {
    throw std::invalid_argument("rotation interval must be between 30 and 365 days");
  }
}

}  // namespace

const char* ToString(RotationNotificationType type) {
  switch (type) {
    case RotationNotificationType::kNone:
      return "none";
    case RotationNotificationType::kUpcoming:
      return "upcoming";
    case RotationNotificationType::kDue:
      return "due";
    case RotationNotificationType::kOverdue:
      return "overdue";
  }
  return "unknown";
}

const char* ToString(RotationRunStatus status) {
  switch (status) {
    case RotationRunStatus::kNever:
      return "never";
    case RotationRunStatus::kSuccess:
      return "success";
    case RotationRunStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

RotationSchedule CreateSchedule(const std::string& user_id, uint32_t interval_days, TimePoint start) {
  if (user_id.empty()) {
    throw std::invalid_argument("user_id must not be empty");
  }
  ValidateInterval(interval_days);

  RotationSchedule schedule;
  schedule.schedule_id = Csprng::RandomId();
  schedule.user_id = user_id;
  schedule.rotation_interval_days = interval_days;
  schedule.created_at = start;
  schedule.last_rotation_at = start;
  schedule.next_rotation_at = start + std::chrono::days(interval_days);
  return schedule;
}

bool IsDue(const RotationSchedule& schedule, TimePoint now) {
  return schedule.enabled && now >= schedule.next_rotation_at;
}

bool IsOverdue(const RotationSchedule& schedule, TimePoint now, uint32_t grace_days) {
  return schedule.enabled && now > schedule.next_rotation_at + std::chrono::days(grace_days);
}

double DaysUntilRotation(const RotationSchedule& schedule, TimePoint now) {
  return DaysBetween(now, schedule.next_rotation_at);
}

RotationNotificationType GetNotificationType(const RotationSchedule& schedule,
                                             TimePoint now,
                                             uint32_t grace_days,
                                             uint32_t horizon_days) {
  if (!schedule.enabled) {
    return RotationNotificationType::kNone;
  }

  const double days = DaysUntilRotation(schedule, now);
  if (days < -static_cast<double>(grace_days)) {
    return RotationNotificationType::kOverdue;
  }
  if (std::fabs(days) <= 1.0) {
    return RotationNotificationType::kDue;
  }
  if (days > 1.0 && days <= static_cast<double>(horizon_days)) {
    return RotationNotificationType::kUpcoming;
  }
  return RotationNotificationType::kNone;
}

void UpdateAfterRotation(RotationSchedule* schedule, std::chrono::milliseconds duration, TimePoint at) {
  if (schedule == nullptr) {
    throw std::invalid_argument("schedule must not be null");
  }
  if (duration.count() < 0) {
    throw std::invalid_argument("rotation duration must not be negative");
  }

  const int64_t old_count = schedule->rotation_count;
  const int64_t new_count = old_count + 1;
  const int64_t total = schedule->average_rotation_time.count() * old_count + duration.count();

  schedule->last_rotation_at = at;
  schedule->next_rotation_at = at + std::chrono::days(schedule->rotation_interval_days);
  schedule->rotation_count = static_cast<uint32_t>(new_count);
  schedule->average_rotation_time = std::chrono::milliseconds(total / new_count);
  schedule->last_status = RotationRunStatus::kSuccess;
  schedule->last_error.reset();
  schedule->last_notified_type.reset();
  schedule->last_notified_for.reset();
}

void UpdateAfterFailure(RotationSchedule* schedule, const std::string& error, TimePoint at) {
  if (schedule == nullptr) {
    throw std::invalid_argument("schedule must not be null");
  }
  ++schedule->failure_count;
  schedule->last_status = RotationRunStatus::kFailed;
  schedule->last_error = error;
  schedule->last_failure_at = at;
}

void UpdateRotationInterval(RotationSchedule* schedule, uint32_t interval_days) {
  if (schedule == nullptr) {
    throw std::invalid_argument("schedule must not be null");
  }
  ValidateInterval(interval_days);
  schedule->rotation_interval_days = interval_days;
  schedule->next_rotation_at = schedule->last_rotation_at + std::chrono::days(interval_days);
}

}  // namespace guardsig
