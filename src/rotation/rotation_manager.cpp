#include "guardsig/rotation/rotation_manager.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "guardsig/common/log.hpp"
#include "guardsig/crypto/random.hpp"

namespace guardsig {

RotationManager::RotationManager(ISigningStore& store,
                                 RotationScheduler& scheduler,
                                 GuardianSigningService& signing,
                                 std::shared_ptr<spdlog::logger> logger)
    : store_(store), scheduler_(scheduler), signing_(signing), logger_(LoggerOrDefault(std::move(logger))) {}

Result<RotationAuditTrail> RotationManager::StartRotation(const std::string& user_id,
                                                          const std::string& actor,
                                                          TimePoint now) {
  Result<RotationSchedule> schedule = scheduler_.GetSchedule(user_id);
  if (!schedule.ok()) {
    return schedule.error();
  }
  if (!schedule.value().enabled) {
    return MakeError(ErrorCode::kState, "rotation schedule is disabled");
  }

  std::lock_guard<std::mutex> lock(mu_);
  RotationAuditTrail trail(Csprng::RandomId(), user_id, schedule.value().schedule_id, now);
  trail.AddEntry(audit_event::kRotationStarted, actor,
                 {{"rotation_number", std::to_string(schedule.value().rotation_count + 1)}}, now);

  if (Result<void> saved = SaveTrail(trail); !saved.ok()) {
    return saved.error();
  }
  const StoreStatus checklist_status = store_.PutChecklist(trail.rotation_id(), RotationVerificationChecklist());
  if (checklist_status != StoreStatus::kOk) {
    return StoreFailure(checklist_status, "verification checklist");
  }

  logger_->info("rotation {} started for user {}", trail.rotation_id(), user_id);
  return trail;
}

Result<RotationVerificationChecklist> RotationManager::RecordStep(const std::string& rotation_id,
                                                                  const std::string& step_name,
                                                                  StepStatus status,
                                                                  const std::string& actor,
                                                                  const std::optional<std::string>& error,
                                                                  TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  Result<RotationAuditTrail> trail = LoadTrail(rotation_id);
  if (!trail.ok()) {
    return trail.error();
  }
  if (trail.value().IsTerminal()) {
    return MakeError(ErrorCode::kState, "rotation is already finished");
  }
  Result<RotationVerificationChecklist> checklist = LoadChecklist(rotation_id);
  if (!checklist.ok()) {
    return checklist;
  }

  const char* event_type = nullptr;
  std::map<std::string, std::string> details{{"step", step_name}};
  try {
    switch (status) {
      case StepStatus::kCompleted:
        checklist.value().MarkStepCompleted(step_name, now);
        event_type = audit_event::kStepCompleted;
        break;
      case StepStatus::kFailed:
        checklist.value().MarkStepFailed(step_name, error.value_or("unspecified failure"), now);
        event_type = audit_event::kStepFailed;
        details.emplace("error", error.value_or("unspecified failure"));
        break;
      case StepStatus::kSkipped:
        checklist.value().MarkStepSkipped(step_name);
        event_type = audit_event::kStepSkipped;
        break;
      case StepStatus::kPending:
        return MakeError(ErrorCode::kValidation, "a step cannot be reset to pending");
    }
  } catch (const std::invalid_argument& ex) {
    return MakeError(ErrorCode::kValidation, ex.what());
  }

  trail.value().AddEntry(event_type, actor, std::move(details), now);
  const StoreStatus checklist_status = store_.PutChecklist(rotation_id, checklist.value());
  if (checklist_status != StoreStatus::kOk) {
    return StoreFailure(checklist_status, "verification checklist");
  }
  if (Result<void> saved = SaveTrail(trail.value()); !saved.ok()) {
    return saved.error();
  }

  logger_->info("rotation {} step {} -> {}", rotation_id, step_name, ToString(status));
  return checklist;
}

Result<SigningOperation> RotationManager::RequestRotationSigning(const std::string& rotation_id,
                                                                 SigningRequest request,
                                                                 const std::string& actor,
                                                                 TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  Result<RotationAuditTrail> trail = LoadTrail(rotation_id);
  if (!trail.ok()) {
    return trail.error();
  }
  if (trail.value().IsTerminal()) {
    return MakeError(ErrorCode::kState, "rotation is already finished");
  }

  request.use_case = UseCase::kKeyRotation;
  Result<SigningOperation> operation = signing_.CreateSigningRequest(request, now);
  if (operation.ok()) {
    trail.value().AddEntry(audit_event::kSigningRequested, actor,
                           {{"operation_id", operation.value().id},
                            {"method", ToString(operation.value().method)}},
                           now);
  } else {
    trail.value().AddEntry(audit_event::kSigningFailed, actor,
                           {{"error", ErrorCodeName(operation.code())}}, now);
  }
  if (Result<void> saved = SaveTrail(trail.value()); !saved.ok()) {
    return saved.error();
  }
  return operation;
}

Result<RotationAuditTrail> RotationManager::FinishRotation(const std::string& rotation_id,
                                                           const std::string& actor,
                                                           TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  Result<RotationAuditTrail> loaded = LoadTrail(rotation_id);
  if (!loaded.ok()) {
    return loaded;
  }
  RotationAuditTrail& trail = loaded.value();
  if (trail.IsTerminal()) {
    return MakeError(ErrorCode::kState, "rotation is already finished");
  }
  Result<RotationVerificationChecklist> checklist = LoadChecklist(rotation_id);
  if (!checklist.ok()) {
    return checklist.error();
  }

  const std::vector<VerificationIssue> issues = checklist.value().GetCriticalIssues();
  if (!issues.empty()) {
    std::string reason = "critical steps incomplete:";
    for (const VerificationIssue& issue : issues) {
      reason += " " + issue.step;
    }
    // The trail turns terminal only after the schedule holds the outcome.
    Result<RotationSchedule> recorded = scheduler_.RecordFailure(trail.user_id(), reason, now, rotation_id);
    if (!recorded.ok()) {
      return recorded.error();
    }
    trail.MarkFailed(actor, reason, now);
    if (Result<void> saved = SaveTrail(trail); !saved.ok()) {
      return saved.error();
    }
    logger_->warn("rotation {} failed: {}", rotation_id, reason);
    return trail;
  }

  const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - trail.created_at());
  Result<RotationSchedule> recorded = scheduler_.RecordRotation(trail.user_id(), duration, now, rotation_id);
  if (!recorded.ok()) {
    return recorded.error();
  }
  trail.MarkCompleted(actor, now);
  if (Result<void> saved = SaveTrail(trail); !saved.ok()) {
    return saved.error();
  }
  logger_->info("rotation {} completed in {} ms", rotation_id, duration.count());
  return trail;
}

Result<RotationAuditTrail> RotationManager::RollbackRotation(const std::string& rotation_id,
                                                             const std::string& actor,
                                                             const std::string& reason,
                                                             TimePoint now) {
  std::lock_guard<std::mutex> lock(mu_);
  Result<RotationAuditTrail> loaded = LoadTrail(rotation_id);
  if (!loaded.ok()) {
    return loaded;
  }
  RotationAuditTrail& trail = loaded.value();
  try {
    trail.MarkRolledBack(actor, reason, now);
  } catch (const std::logic_error& ex) {
    return MakeError(ErrorCode::kState, ex.what());
  }
  if (Result<void> saved = SaveTrail(trail); !saved.ok()) {
    return saved.error();
  }
  logger_->warn("rotation {} rolled back", rotation_id);
  return trail;
}

Result<std::string> RotationManager::GenerateReport(const std::string& rotation_id) {
  Result<RotationAuditTrail> trail = LoadTrail(rotation_id);
  if (!trail.ok()) {
    return trail.error();
  }
  std::string report = trail.value().GenerateReport();
  Result<RotationVerificationChecklist> checklist = LoadChecklist(rotation_id);
  if (checklist.ok()) {
    const VerificationSummary summary = checklist.value().GetVerificationSummary();
    report += "Verification: " + std::string(ToString(summary.overall)) + " (" +
              std::to_string(summary.completed) + "/" + std::to_string(summary.total) + " steps completed)\n";
  }
  return report;
}

Result<std::vector<std::string>> RotationManager::CheckForSuspiciousActivity(const std::string& rotation_id) {
  Result<RotationAuditTrail> trail = LoadTrail(rotation_id);
  if (!trail.ok()) {
    return trail.error();
  }
  return trail.value().CheckForSuspiciousActivity();
}

Result<VerificationSummary> RotationManager::GetVerificationSummary(const std::string& rotation_id) {
  Result<RotationVerificationChecklist> checklist = LoadChecklist(rotation_id);
  if (!checklist.ok()) {
    return checklist.error();
  }
  return checklist.value().GetVerificationSummary();
}

Result<bool> RotationManager::CanRollback(const std::string& rotation_id, TimePoint now) {
  Result<RotationAuditTrail> trail = LoadTrail(rotation_id);
  if (!trail.ok()) {
    return trail.error();
  }
  return trail.value().CanRollback(now, scheduler_.config().deprecation_window);
}

Result<RotationAuditTrail> RotationManager::LoadTrail(const std::string& rotation_id) {
  std::optional<RotationAuditTrail> trail = store_.GetAuditTrail(rotation_id);
  if (!trail.has_value()) {
    return MakeError(ErrorCode::kNotFound, "rotation audit trail not found");
  }
  return std::move(*trail);
}

Result<RotationVerificationChecklist> RotationManager::LoadChecklist(const std::string& rotation_id) {
  std::optional<RotationVerificationChecklist> checklist = store_.GetChecklist(rotation_id);
  if (!checklist.has_value()) {
    return MakeError(ErrorCode::kNotFound, "verification checklist not found");
  }
  return std::move(*checklist);
}

Result<void> RotationManager::SaveTrail(const RotationAuditTrail& trail) {
  const StoreStatus status = store_.PutAuditTrail(trail);
  if (status != StoreStatus::kOk) {
    logger_->error("failed to persist audit trail {}: {}", trail.rotation_id(), ToString(status));
    return StoreFailure(status, "rotation audit trail");
  }
  return Result<void>::Ok();
}

}  // namespace guardsig
