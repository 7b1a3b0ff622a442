#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/crypto/hash.hpp"
#include "guardsig/crypto/random.hpp"
#include "guardsig/crypto/threshold_scheme.hpp"
#include "guardsig/net/notifier.hpp"
#include "guardsig/net/publisher.hpp"
#include "guardsig/protocol/family_key.hpp"
#include "guardsig/protocol/signing_service.hpp"
#include "guardsig/rotation/audit_trail.hpp"
#include "guardsig/rotation/rotation_manager.hpp"
#include "guardsig/rotation/rotation_scheduler.hpp"
#include "guardsig/rotation/schedule.hpp"
#include "guardsig/rotation/verification.hpp"
#include "guardsig/store/in_memory_store.hpp"

namespace {

using guardsig::ErrorCode;
using guardsig::Result;
using guardsig::RotationAuditStatus;
using guardsig::RotationAuditTrail;
using guardsig::RotationNotificationType;
using guardsig::RotationSchedule;
using guardsig::RotationVerificationChecklist;
using guardsig::StepStatus;
using guardsig::TimePoint;
using guardsig::VerificationStatus;
using guardsig::VerificationStep;
using namespace std::chrono_literals;
namespace step = guardsig::rotation_step;

const TimePoint kT0 = guardsig::FromEpochMillis(1'700'000'000'000);

TimePoint Day(int days) {
  return kT0 + std::chrono::days(days);
}

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

template <typename T>
void ExpectCode(const Result<T>& result, ErrorCode code, const std::string& message) {
  if (result.code() != code) {
    throw std::runtime_error("Test failed: " + message + " (got " + guardsig::ErrorCodeName(result.code()) +
                             ", want " + guardsig::ErrorCodeName(code) + ")");
  }
}

void TestScheduleTiming() {
  const RotationSchedule schedule = guardsig::CreateSchedule("user-1", 90, kT0);
  Expect(schedule.next_rotation_at == Day(90), "next rotation is one interval out");
  Expect(schedule.last_status == guardsig::RotationRunStatus::kNever, "new schedule never ran");

  Expect(guardsig::GetNotificationType(schedule, Day(50)) == RotationNotificationType::kNone, "40 days out");
  Expect(guardsig::GetNotificationType(schedule, Day(76)) == RotationNotificationType::kUpcoming, "14 days out");
  Expect(guardsig::GetNotificationType(schedule, Day(89) + 12h) == RotationNotificationType::kDue, "half a day out");
  Expect(guardsig::GetNotificationType(schedule, Day(90)) == RotationNotificationType::kDue, "due date");
  Expect(guardsig::GetNotificationType(schedule, Day(95)) == RotationNotificationType::kNone, "inside grace");
  Expect(guardsig::GetNotificationType(schedule, Day(98)) == RotationNotificationType::kOverdue, "past grace");

  Expect(!guardsig::IsDue(schedule, Day(89)), "not due early");
  Expect(guardsig::IsDue(schedule, Day(90)), "due on the due date");
  Expect(!guardsig::IsOverdue(schedule, Day(97)), "grace period is inclusive");
  Expect(guardsig::IsOverdue(schedule, Day(98)), "overdue after grace");
  Expect(guardsig::DaysUntilRotation(schedule, Day(80)) == 10.0, "days until rotation");

  RotationSchedule disabled = schedule;
  disabled.enabled = false;
  Expect(!guardsig::IsDue(disabled, Day(120)), "disabled schedules are never due");
  Expect(guardsig::GetNotificationType(disabled, Day(90)) == RotationNotificationType::kNone,
         "disabled schedules get no notifications");

  ExpectThrow([]() { (void)guardsig::CreateSchedule("user-1", 29, kT0); }, "interval below 30 days");
  ExpectThrow([]() { (void)guardsig::CreateSchedule("user-1", 366, kT0); }, "interval above 365 days");
  ExpectThrow([]() { (void)guardsig::CreateSchedule("", 90, kT0); }, "empty user");
}

void TestScheduleUpdates() {
  RotationSchedule schedule = guardsig::CreateSchedule("user-1", 90, kT0);
  guardsig::UpdateAfterRotation(&schedule, 10s, Day(90));
  guardsig::UpdateAfterRotation(&schedule, 20s, Day(180));
  Expect(schedule.rotation_count == 2, "rotation count increments");
  Expect(schedule.average_rotation_time == 15s, "average of 10s and 20s is 15s");
  Expect(schedule.next_rotation_at == Day(270), "next rotation re-planned from the last one");
  Expect(schedule.last_status == guardsig::RotationRunStatus::kSuccess, "last status success");

  guardsig::UpdateAfterFailure(&schedule, "relay offline", Day(271));
  Expect(schedule.failure_count == 1 && schedule.last_error == "relay offline", "failure recorded");
  Expect(schedule.next_rotation_at == Day(270), "failure keeps the due date");

  guardsig::UpdateRotationInterval(&schedule, 30);
  Expect(schedule.next_rotation_at == Day(210), "interval change re-plans from the last rotation");
  ExpectThrow([&]() { guardsig::UpdateRotationInterval(&schedule, 400); }, "interval above 365 days");
}

void TestAuditTrail() {
  RotationAuditTrail trail("rot-1", "user-1", "sched-1", kT0);
  trail.AddEntry(guardsig::audit_event::kRotationStarted, "user-1", {}, kT0);
  trail.AddEntry(guardsig::audit_event::kStepCompleted, "user-1", {{"step", step::kProfileUpdated}}, kT0 + 1s);
  Expect(trail.CheckForSuspiciousActivity().empty(), "ordinary rotation raises no warnings");

  trail.MarkCompleted("user-1", kT0 + 2s);
  Expect(trail.status() == RotationAuditStatus::kCompleted, "trail completed");
  Expect(trail.completed_at() == kT0 + 2s, "completion time recorded");
  ExpectThrow([&]() { trail.AddEntry(guardsig::audit_event::kStepCompleted, "user-1", {}, kT0 + 3s); },
              "no entries after completion");
  ExpectThrow([&]() { trail.MarkFailed("user-1", "late", kT0 + 3s); }, "status is set once");

  Expect(trail.CanRollback(kT0 + std::chrono::days(29)), "rollback inside the deprecation window");
  Expect(!trail.CanRollback(kT0 + std::chrono::days(31)), "no rollback after the window");
  ExpectThrow([&]() { trail.MarkRolledBack("user-1", "too late", kT0 + std::chrono::days(31)); },
              "rollback refused after the window");

  trail.MarkRolledBack("user-1", "lost access to new key", kT0 + std::chrono::days(2));
  Expect(trail.status() == RotationAuditStatus::kRolledBack, "trail rolled back");
  Expect(trail.entries().back().event_type == guardsig::audit_event::kRotationRolledBack, "rollback logged");
  Expect(!trail.CanRollback(kT0 + std::chrono::days(3)), "rolled back trails cannot roll back again");
  ExpectThrow([&]() { trail.MarkRolledBack("user-1", "again", kT0 + std::chrono::days(3)); }, "rollback once");

  const std::vector<std::string> warnings = trail.CheckForSuspiciousActivity();
  Expect(warnings.size() == 1, "rollback is flagged");

  const std::string report = trail.GenerateReport();
  Expect(report.find("rot-1") != std::string::npos, "report names the rotation");
  Expect(report.find("rolled_back") != std::string::npos, "report shows the status");
  Expect(report.find("reason=lost access to new key") != std::string::npos, "report lists entry details");
}

void TestSuspiciousActivity() {
  RotationAuditTrail trail("rot-2", "user-1", "sched-1", kT0);
  trail.AddEntry(guardsig::audit_event::kStepFailed, "user-1", {}, kT0);
  trail.AddEntry(guardsig::audit_event::kSigningFailed, "guardian-a", {}, kT0 + 1h);
  trail.AddEntry(guardsig::audit_event::kStepFailed, "guardian-b", {}, kT0 + 25h);
  trail.MarkFailed("user-1", "gave up", kT0 + 26h);

  const std::vector<std::string> warnings = trail.CheckForSuspiciousActivity();
  Expect(warnings.size() == 3, "failures, actors and duration are all flagged");
  Expect(!trail.CanRollback(kT0 + 27h), "failed rotations cannot be rolled back");
}

void TestVerificationChecklist() {
  RotationVerificationChecklist checklist;
  Expect(checklist.steps().size() == 8, "eight verification steps");
  Expect(checklist.step(step::kDelegationPublished).critical, "delegation is critical");
  Expect(checklist.step(step::kProfileUpdated).critical, "profile update is critical");
  Expect(checklist.step(step::kKeyStorageUpdated).critical, "key storage is critical");
  Expect(!checklist.step(step::kContactsNotified).critical, "contact notification is not critical");
  Expect(checklist.CalculateOverallStatus() == VerificationStatus::kPartial, "pending steps give partial");
  Expect(checklist.GetCriticalIssues().size() == 3, "pending critical steps are issues");

  for (const VerificationStep& s : checklist.steps()) {
    checklist.MarkStepCompleted(s.name, kT0);
  }
  Expect(checklist.CalculateOverallStatus() == VerificationStatus::kVerified, "all completed is verified");
  Expect(!checklist.HasCriticalIssues(), "no critical issues once completed");

  checklist.MarkStepSkipped(step::kLightningAddressUpdated);
  Expect(checklist.CalculateOverallStatus() == VerificationStatus::kPartial, "a skipped step gives partial");

  checklist.MarkStepFailed(step::kNip05Updated, "dns timeout", kT0);
  const guardsig::VerificationSummary summary = checklist.GetVerificationSummary();
  Expect(summary.overall == VerificationStatus::kFailed, "a failed step fails verification");
  Expect(summary.completed == 6 && summary.failed == 1 && summary.skipped == 1 && summary.total == 8,
         "summary counts steps");
  Expect(summary.issues.size() == 1 && summary.issues[0].severity == guardsig::IssueSeverity::kWarning,
         "non-critical failures are warnings");
  Expect(!checklist.HasCriticalIssues(), "non-critical failures do not block");

  ExpectThrow([&]() { checklist.MarkStepCompleted("made_up_step", kT0); }, "unknown step");
}

// Scheduler, manager and the signing stack over one store.
struct Fixture {
  Fixture()
      : dealt(guardsig::DealFamilyKey(guardsig::Csprng::RandomNonZeroScalar(), "family-1", {"a", "b", "c"}, 2)) {
    if (store.PutFamilyKey(dealt->key) != guardsig::StoreStatus::kOk) {
      throw std::runtime_error("failed to store family key");
    }
  }

  void CompleteCriticalSteps(const std::string& rotation_id, TimePoint at) {
    for (const char* name : {step::kDelegationPublished, step::kProfileUpdated, step::kKeyStorageUpdated}) {
      if (!manager.RecordStep(rotation_id, name, StepStatus::kCompleted, "user-1", std::nullopt, at).ok()) {
        throw std::runtime_error(std::string("failed to record step ") + name);
      }
    }
  }

  guardsig::InMemorySigningStore store;
  guardsig::SchnorrThresholdScheme scheme;
  guardsig::InMemoryEventPublisher publisher;
  guardsig::InMemoryGuardianNotifier guardian_notifier;
  guardsig::InMemoryRotationNotifier notifier;
  guardsig::ThresholdSessionManager sessions{store, scheme, publisher, guardian_notifier};
  guardsig::ReconstructionCoordinator reconstructions{store, publisher, guardian_notifier};
  guardsig::GuardianSigningService signing{sessions, reconstructions};
  guardsig::RotationScheduler scheduler{store, notifier};
  guardsig::RotationManager manager{store, scheduler, signing};
  guardsig::Zeroizing<guardsig::DealtFamilyKey> dealt;
};

void TestSchedulerService() {
  Fixture f;
  Result<RotationSchedule> created = f.scheduler.CreateSchedule("user-1", 90, kT0);
  Expect(created.ok() && created.value().version == 1, "schedule created");
  ExpectCode(f.scheduler.CreateSchedule("user-1", 90, kT0), ErrorCode::kState, "one schedule per user");
  ExpectCode(f.scheduler.CreateSchedule("user-2", 10, kT0), ErrorCode::kValidation, "interval out of range");
  ExpectCode(f.scheduler.GetSchedule("nobody"), ErrorCode::kNotFound, "unknown user");

  Expect(f.scheduler.GetDueSchedules(Day(89)).empty(), "nothing due early");
  Expect(f.scheduler.GetDueSchedules(Day(90)).size() == 1, "schedule due");
  Expect(f.scheduler.GetOverdueSchedules(Day(97)).empty(), "not overdue inside grace");
  Expect(f.scheduler.GetOverdueSchedules(Day(98)).size() == 1, "overdue after grace");

  Expect(f.scheduler.DispatchNotifications(Day(50)) == 0, "no notification far from the due date");
  Expect(f.scheduler.DispatchNotifications(Day(76)) == 1, "upcoming notification sent");
  Expect(f.scheduler.DispatchNotifications(Day(77)) == 0, "upcoming notification sent once");
  Expect(f.scheduler.DispatchNotifications(Day(90)) == 1, "due notification sent");
  Expect(f.scheduler.DispatchNotifications(Day(90) + 6h) == 0, "due notification sent once");
  Expect(f.scheduler.DispatchNotifications(Day(98)) == 1, "overdue notification sent");
  Expect(f.scheduler.DispatchNotifications(Day(99)) == 0, "overdue notification sent once");

  const auto sent = f.notifier.sent();
  Expect(sent.size() == 3, "three notifications in one cycle");
  Expect(sent[0].type == RotationNotificationType::kUpcoming && sent[1].type == RotationNotificationType::kDue &&
             sent[2].type == RotationNotificationType::kOverdue,
         "notifications escalate");
  Expect(sent[0].user_id == "user-1" && sent[0].next_rotation_at == Day(90), "notification names the schedule");

  Result<RotationSchedule> disabled = f.scheduler.SetEnabled("user-1", false);
  Expect(disabled.ok() && !disabled.value().enabled, "schedule disabled");
  Expect(f.scheduler.GetDueSchedules(Day(120)).empty(), "disabled schedules are not due");

  Result<RotationSchedule> interval = f.scheduler.UpdateRotationInterval("user-1", 30);
  Expect(interval.ok() && interval.value().next_rotation_at == Day(30), "interval change re-plans");
  ExpectCode(f.scheduler.UpdateRotationInterval("user-1", 5), ErrorCode::kValidation, "interval out of range");
}

void TestRotationLifecycle() {
  Fixture f;
  Expect(f.scheduler.CreateSchedule("user-1", 90, kT0).ok(), "schedule created");

  const RotationAuditTrail first = f.manager.StartRotation("user-1", "user-1", Day(90)).value();
  Expect(first.status() == RotationAuditStatus::kInProgress, "rotation in progress");
  Expect(first.entries().size() == 1 && first.entries()[0].event_type == guardsig::audit_event::kRotationStarted,
         "start is logged");

  guardsig::SigningRequest request{
      .family_id = "family-1",
      .message_digest = guardsig::Sha256(guardsig::Bytes{'k', 'e', 'y'}),
      .event_type = "kind:10100",
      .participants = {"a", "b", "c"},
      .use_case = guardsig::UseCase::kDailyOperations,
  };
  Result<guardsig::SigningOperation> signing =
      f.manager.RequestRotationSigning(first.rotation_id(), request, "user-1", Day(90));
  Expect(signing.ok() && signing.value().method == guardsig::SigningMethod::kKeyReconstruction,
         "rotation signing always reconstructs");

  f.CompleteCriticalSteps(first.rotation_id(), Day(90) + 5s);
  ExpectCode(f.manager.RecordStep(first.rotation_id(), "made_up", StepStatus::kCompleted, "user-1"),
             ErrorCode::kValidation, "unknown step");
  ExpectCode(f.manager.RecordStep(first.rotation_id(), step::kAuditRecorded, StepStatus::kPending, "user-1"),
             ErrorCode::kValidation, "steps cannot return to pending");

  Result<RotationAuditTrail> finished = f.manager.FinishRotation(first.rotation_id(), "user-1", Day(90) + 10s);
  Expect(finished.ok() && finished.value().status() == RotationAuditStatus::kCompleted, "rotation completed");
  ExpectCode(f.manager.RecordStep(first.rotation_id(), step::kAuditRecorded, StepStatus::kCompleted, "user-1"),
             ErrorCode::kState, "finished rotations accept no steps");
  ExpectCode(f.manager.FinishRotation(first.rotation_id(), "user-1", Day(91)), ErrorCode::kState,
             "rotation finishes once");

  const RotationAuditTrail second = f.manager.StartRotation("user-1", "user-1", Day(180)).value();
  f.CompleteCriticalSteps(second.rotation_id(), Day(180));
  Expect(f.manager.FinishRotation(second.rotation_id(), "user-1", Day(180) + 20s).ok(), "second rotation");

  const RotationSchedule schedule = f.scheduler.GetSchedule("user-1").value();
  Expect(schedule.rotation_count == 2, "two rotations recorded");
  Expect(schedule.average_rotation_time == 15s, "average rotation time is 15s");
  Expect(schedule.next_rotation_at == Day(270) + 20s, "next rotation planned from the last");

  const std::string report = f.manager.GenerateReport(second.rotation_id()).value();
  Expect(report.find("Verification: partial") != std::string::npos, "report includes verification status");
  Expect(f.manager.GetVerificationSummary(second.rotation_id()).value().completed == 3, "summary via manager");
}

void TestCriticalStepFailureFailsRotation() {
  Fixture f;
  Expect(f.scheduler.CreateSchedule("user-1", 90, kT0).ok(), "schedule created");
  const RotationAuditTrail trail = f.manager.StartRotation("user-1", "user-1", Day(90)).value();

  Expect(f.manager.RecordStep(trail.rotation_id(), step::kDelegationPublished, StepStatus::kCompleted, "user-1",
                              std::nullopt, Day(90)).ok(), "delegation recorded");
  Expect(f.manager.RecordStep(trail.rotation_id(), step::kProfileUpdated, StepStatus::kCompleted, "user-1",
                              std::nullopt, Day(90)).ok(), "profile recorded");
  Expect(f.manager.RecordStep(trail.rotation_id(), step::kKeyStorageUpdated, StepStatus::kFailed, "user-1",
                              std::string("vault write rejected"), Day(90)).ok(), "storage failure recorded");

  Result<RotationAuditTrail> finished = f.manager.FinishRotation(trail.rotation_id(), "user-1", Day(90) + 1min);
  Expect(finished.ok() && finished.value().status() == RotationAuditStatus::kFailed,
         "failed critical step fails the rotation");
  Expect(finished.value().entries().back().details.at("error").find(step::kKeyStorageUpdated) != std::string::npos,
         "failure names the step");

  const RotationSchedule schedule = f.scheduler.GetSchedule("user-1").value();
  Expect(schedule.failure_count == 1 && schedule.rotation_count == 0, "failure recorded on the schedule");
  Expect(schedule.last_status == guardsig::RotationRunStatus::kFailed, "last status failed");
  const guardsig::RotationPerformance perf = f.scheduler.GetPerformanceMetrics("user-1").value();
  Expect(perf.success_rate == 0.0 && perf.failure_count == 1, "performance reflects the failure");
  ExpectCode(f.manager.RollbackRotation(trail.rotation_id(), "user-1", "undo", Day(91)), ErrorCode::kState,
             "failed rotations cannot be rolled back");
}

void TestRollbackAndStartChecks() {
  Fixture f;
  ExpectCode(f.manager.StartRotation("user-1", "user-1", kT0), ErrorCode::kNotFound, "no schedule");
  Expect(f.scheduler.CreateSchedule("user-1", 90, kT0).ok(), "schedule created");

  const RotationAuditTrail trail = f.manager.StartRotation("user-1", "user-1", Day(90)).value();
  f.CompleteCriticalSteps(trail.rotation_id(), Day(90));
  Expect(f.manager.FinishRotation(trail.rotation_id(), "user-1", Day(90)).ok(), "rotation completed");

  Expect(f.manager.CanRollback(trail.rotation_id(), Day(110)).value(), "rollback open inside 30 days");
  Expect(!f.manager.CanRollback(trail.rotation_id(), Day(121)).value(), "rollback closed after 30 days");
  ExpectCode(f.manager.RollbackRotation(trail.rotation_id(), "user-1", "late", Day(121)), ErrorCode::kState,
             "rollback refused after the window");
  Result<RotationAuditTrail> rolled = f.manager.RollbackRotation(trail.rotation_id(), "user-1", "bad key", Day(95));
  Expect(rolled.ok() && rolled.value().status() == RotationAuditStatus::kRolledBack, "rotation rolled back");
  Expect(f.manager.CheckForSuspiciousActivity(trail.rotation_id()).value().size() == 1, "rollback flagged");
  ExpectCode(f.manager.GenerateReport("missing"), ErrorCode::kNotFound, "unknown rotation");

  Expect(f.scheduler.SetEnabled("user-1", false).ok(), "schedule disabled");
  ExpectCode(f.manager.StartRotation("user-1", "user-1", Day(200)), ErrorCode::kState, "disabled schedule");
}

void TestFinishRotationRetriesAfterStoreFailure() {
  using Point = guardsig::InMemorySigningStore::InterleavePoint;
  Fixture f;
  Expect(f.scheduler.CreateSchedule("user-1", 90, kT0).ok(), "schedule created");
  const RotationAuditTrail trail = f.manager.StartRotation("user-1", "user-1", Day(90)).value();
  f.CompleteCriticalSteps(trail.rotation_id(), Day(90));

  f.store.InterleaveOnce(Point::kUpdateSchedule, [&] { f.store.SetUnavailable(true); });
  ExpectCode(f.manager.FinishRotation(trail.rotation_id(), "user-1", Day(90) + 5s), ErrorCode::kPersistence,
             "schedule write failure is reported");
  f.store.SetUnavailable(false);
  Expect(f.store.GetAuditTrail(trail.rotation_id())->status() == RotationAuditStatus::kInProgress,
         "trail stays open when the schedule was not updated");
  Expect(f.scheduler.GetSchedule("user-1").value().rotation_count == 0, "nothing recorded");

  f.store.InterleaveOnce(Point::kPutAuditTrail, [&] { f.store.SetUnavailable(true); });
  ExpectCode(f.manager.FinishRotation(trail.rotation_id(), "user-1", Day(90) + 10s), ErrorCode::kPersistence,
             "trail write failure is reported");
  f.store.SetUnavailable(false);
  Expect(f.store.GetAuditTrail(trail.rotation_id())->status() == RotationAuditStatus::kInProgress,
         "trail stays open when its write failed");
  Expect(f.scheduler.GetSchedule("user-1").value().rotation_count == 1, "schedule already holds the outcome");

  Result<RotationAuditTrail> finished = f.manager.FinishRotation(trail.rotation_id(), "user-1", Day(90) + 15s);
  Expect(finished.ok() && finished.value().status() == RotationAuditStatus::kCompleted, "retry completes the rotation");
  const RotationSchedule schedule = f.scheduler.GetSchedule("user-1").value();
  Expect(schedule.rotation_count == 1, "retry does not record the rotation twice");
  Expect(schedule.last_recorded_rotation == trail.rotation_id(), "schedule names the recorded rotation");
  Expect(schedule.average_rotation_time == 10s, "first recorded duration is kept");
}

void TestScheduleUpdateConflicts() {
  using Point = guardsig::InMemorySigningStore::InterleavePoint;
  Fixture f;
  Expect(f.scheduler.CreateSchedule("user-1", 90, kT0).ok(), "schedule created");

  f.store.InterleaveOnce(Point::kUpdateSchedule, [&] {
    RotationSchedule current;
    Expect(f.store.FindScheduleByUser("user-1", &current) == guardsig::StoreStatus::kOk, "schedule readable");
    current.enabled = false;
    Expect(f.store.UpdateSchedule(&current) == guardsig::StoreStatus::kOk, "concurrent writer wins the version");
  });
  Result<RotationSchedule> failed = f.scheduler.RecordFailure("user-1", "relay timeout", Day(90));
  Expect(failed.ok() && failed.value().failure_count == 1, "stale write is retried");
  Expect(!failed.value().enabled, "retry keeps the concurrent change");
  Expect(failed.value().version == 3, "both writes bump the version");

  int writes = 0;
  std::function<void()> bump = [&] {
    RotationSchedule current;
    Expect(f.store.FindScheduleByUser("user-1", &current) == guardsig::StoreStatus::kOk, "schedule readable");
    Expect(f.store.UpdateSchedule(&current) == guardsig::StoreStatus::kOk, "concurrent write applied");
    if (++writes < f.scheduler.config().max_update_attempts) {
      f.store.InterleaveOnce(Point::kUpdateSchedule, bump);
    }
  };
  f.store.InterleaveOnce(Point::kUpdateSchedule, bump);
  ExpectCode(f.scheduler.RecordFailure("user-1", "again", Day(91)), ErrorCode::kConflict,
             "persistent conflicts are reported");
  Expect(writes == 3, "every attempt rereads the schedule");
  Expect(f.scheduler.GetSchedule("user-1").value().failure_count == 1, "conflicting update not applied");
}

}  // namespace

int main() {
  try {
    TestScheduleTiming();
    TestScheduleUpdates();
    TestAuditTrail();
    TestSuspiciousActivity();
    TestVerificationChecklist();
    TestSchedulerService();
    TestRotationLifecycle();
    TestCriticalStepFailureFailsRotation();
    TestRollbackAndStartChecks();
    TestFinishRotationRetriesAfterStoreFailure();
    TestScheduleUpdateConflicts();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Rotation tests passed" << '\n';
  return 0;
}
