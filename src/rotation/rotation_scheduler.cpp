#include "guardsig/rotation/rotation_scheduler.hpp"

#include <stdexcept>
#include <utility>

#include "guardsig/common/log.hpp"

namespace guardsig {

RotationScheduler::RotationScheduler(ISigningStore& store,
                                     IRotationNotifier& notifier,
                                     RotationConfig config,
                                     std::shared_ptr<spdlog::logger> logger)
    : store_(store), notifier_(notifier), config_(config), logger_(LoggerOrDefault(std::move(logger))) {
  if (config_.max_update_attempts <= 0) {
    throw std::invalid_argument("max_update_attempts must be positive");
  }
}

const RotationConfig& RotationScheduler::config() const {
  return config_;
}

Result<RotationSchedule> RotationScheduler::CreateSchedule(const std::string& user_id,
                                                           uint32_t interval_days,
                                                           TimePoint now) {
  RotationSchedule schedule;
  try {
    schedule = guardsig::CreateSchedule(user_id, interval_days, now);
  } catch (const std::invalid_argument& ex) {
    return MakeError(ErrorCode::kValidation, ex.what());
  }
  schedule.version = 1;

  const StoreStatus status = store_.InsertSchedule(schedule);
  if (status == StoreStatus::kDuplicate) {
    return MakeError(ErrorCode::kState, "user already has a rotation schedule");
  }
  if (status != StoreStatus::kOk) {
    logger_->error("failed to persist rotation schedule for user {}: {}", user_id, ToString(status));
    return StoreFailure(status, "rotation schedule");
  }
  logger_->info("rotation schedule {} created for user {} every {} days", schedule.schedule_id, user_id,
                interval_days);
  return schedule;
}

Result<RotationSchedule> RotationScheduler::GetSchedule(const std::string& user_id) {
  RotationSchedule schedule;
  const StoreStatus status = store_.FindScheduleByUser(user_id, &schedule);
  if (status != StoreStatus::kOk) {
    return StoreFailure(status, "rotation schedule");
  }
  return schedule;
}

Result<RotationSchedule> RotationScheduler::SetEnabled(const std::string& user_id, bool enabled) {
  Result<RotationSchedule> updated = Update(user_id, [enabled](RotationSchedule* schedule) -> Result<bool> {
    if (schedule->enabled == enabled) {
      return false;
    }
    schedule->enabled = enabled;
    return true;
  });
  if (updated.ok()) {
    logger_->info("rotation schedule for user {} {}", user_id, enabled ? "enabled" : "disabled");
  }
  return updated;
}

Result<RotationSchedule> RotationScheduler::UpdateRotationInterval(const std::string& user_id,
                                                                   uint32_t interval_days) {
  return Update(user_id, [interval_days](RotationSchedule* schedule) -> Result<bool> {
    try {
      guardsig::UpdateRotationInterval(schedule, interval_days);
    } catch (const std::invalid_argument& ex) {
      return MakeError(ErrorCode::kValidation, ex.what());
    }
    return true;
  });
}

Result<RotationSchedule> RotationScheduler::RecordRotation(const std::string& user_id,
                                                           std::chrono::milliseconds duration,
                                                           TimePoint at,
                                                           const std::string& rotation_id) {
  bool recorded = false;
  Result<RotationSchedule> updated = Update(user_id, [&](RotationSchedule* schedule) -> Result<bool> {
    if (!rotation_id.empty() && schedule->last_recorded_rotation == rotation_id) {
      return false;
    }
    try {
      UpdateAfterRotation(schedule, duration, at);
    } catch (const std::invalid_argument& ex) {
      return MakeError(ErrorCode::kValidation, ex.what());
    }
    if (!rotation_id.empty()) {
      schedule->last_recorded_rotation = rotation_id;
    }
    recorded = true;
    return true;
  });
  if (updated.ok() && recorded) {
    logger_->info("rotation #{} recorded for user {} ({} ms)", updated.value().rotation_count, user_id,
                  duration.count());
  }
  return updated;
}

Result<RotationSchedule> RotationScheduler::RecordFailure(const std::string& user_id,
                                                          const std::string& error,
                                                          TimePoint at,
                                                          const std::string& rotation_id) {
  bool recorded = false;
  Result<RotationSchedule> updated = Update(user_id, [&](RotationSchedule* schedule) -> Result<bool> {
    if (!rotation_id.empty() && schedule->last_recorded_rotation == rotation_id) {
      return false;
    }
    UpdateAfterFailure(schedule, error, at);
    if (!rotation_id.empty()) {
      schedule->last_recorded_rotation = rotation_id;
    }
    recorded = true;
    return true;
  });
  if (updated.ok() && recorded) {
    logger_->warn("rotation failure recorded for user {}: {}", user_id, error);
  }
  return updated;
}

std::vector<RotationSchedule> RotationScheduler::GetDueSchedules(TimePoint now) {
  std::vector<RotationSchedule> out;
  for (RotationSchedule& schedule : store_.ListSchedules()) {
    if (IsDue(schedule, now)) {
      out.push_back(std::move(schedule));
    }
  }
  return out;
}

std::vector<RotationSchedule> RotationScheduler::GetOverdueSchedules(TimePoint now) {
  std::vector<RotationSchedule> out;
  for (RotationSchedule& schedule : store_.ListSchedules()) {
    if (IsOverdue(schedule, now, config_.grace_days)) {
      out.push_back(std::move(schedule));
    }
  }
  return out;
}

size_t RotationScheduler::DispatchNotifications(TimePoint now) {
  size_t sent = 0;
  for (const RotationSchedule& schedule : store_.ListSchedules()) {
    const RotationNotificationType type =
        GetNotificationType(schedule, now, config_.grace_days, config_.notification_horizon_days);
    if (type == RotationNotificationType::kNone) {
      continue;
    }
    if (schedule.last_notified_type == type && schedule.last_notified_for == schedule.next_rotation_at) {
      continue;
    }

    try {
      notifier_.Notify(RotationNotification{
          .schedule_id = schedule.schedule_id,
          .user_id = schedule.user_id,
          .type = type,
          .next_rotation_at = schedule.next_rotation_at,
          .days_until = DaysUntilRotation(schedule, now),
      });
    } catch (const std::exception& ex) {
      logger_->error("rotation notification for user {} failed: {}", schedule.user_id, ex.what());
      continue;
    }
    ++sent;

    const TimePoint due = schedule.next_rotation_at;
    Result<RotationSchedule> recorded = Update(schedule.user_id, [type, due](RotationSchedule* s) -> Result<bool> {
      s->last_notified_type = type;
      s->last_notified_for = due;
      return true;
    });
    if (!recorded.ok()) {
      logger_->error("failed to record notification for user {}: {}", schedule.user_id,
                     recorded.error().message);
    }
  }
  return sent;
}

Result<RotationPerformance> RotationScheduler::GetPerformanceMetrics(const std::string& user_id) {
  Result<RotationSchedule> schedule = GetSchedule(user_id);
  if (!schedule.ok()) {
    return schedule.error();
  }
  const RotationSchedule& s = schedule.value();

  RotationPerformance out;
  out.rotation_count = s.rotation_count;
  out.failure_count = s.failure_count;
  out.average_rotation_time = s.average_rotation_time;
  const uint32_t attempts = s.rotation_count + s.failure_count;
  out.success_rate = attempts == 0 ? 0.0 : static_cast<double>(s.rotation_count) / attempts;
  return out;
}

Result<RotationSchedule> RotationScheduler::Update(const std::string& user_id, const ScheduleMutator& mutate) {
  for (int attempt = 0; attempt < config_.max_update_attempts; ++attempt) {
    RotationSchedule schedule;
    const StoreStatus read = store_.FindScheduleByUser(user_id, &schedule);
    if (read != StoreStatus::kOk) {
      return StoreFailure(read, "rotation schedule");
    }

    Result<bool> changed = mutate(&schedule);
    if (!changed.ok()) {
      return changed.error();
    }
    if (!changed.value()) {
      return schedule;
    }

    const StoreStatus written = store_.UpdateSchedule(&schedule);
    if (written == StoreStatus::kConflict) {
      continue;
    }
    if (written != StoreStatus::kOk) {
      logger_->error("failed to update rotation schedule for user {}: {}", user_id, ToString(written));
      return StoreFailure(written, "rotation schedule");
    }
    return schedule;
  }
  return MakeError(ErrorCode::kConflict, "rotation schedule was modified concurrently");
}

}  // namespace guardsig
