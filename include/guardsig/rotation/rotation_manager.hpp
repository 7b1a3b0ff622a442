#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/protocol/signing_service.hpp"
#include "guardsig/rotation/audit_trail.hpp"
#include "guardsig/rotation/rotation_scheduler.hpp"
#include "guardsig/rotation/verification.hpp"
#include "guardsig/store/signing_store.hpp"

namespace guardsig {

// Drives one key rotation from start to a terminal audit status, keeping the
// audit trail, the verification checklist and the schedule in step.
class RotationManager {
 public:
  RotationManager(ISigningStore& store,
                  RotationScheduler& scheduler,
                  GuardianSigningService& signing,
                  std::shared_ptr<spdlog::logger> logger = nullptr);

  Result<RotationAuditTrail> StartRotation(const std::string& user_id,
                                           const std::string& actor,
                                           TimePoint now = Clock::now());

  Result<RotationVerificationChecklist> RecordStep(const std::string& rotation_id,
                                                   const std::string& step_name,
                                                   StepStatus status,
                                                   const std::string& actor,
                                                   const std::optional<std::string>& error = std::nullopt,
                                                   TimePoint now = Clock::now());

  // Signing for a rotation always runs under the key_rotation use case.
  Result<SigningOperation> RequestRotationSigning(const std::string& rotation_id,
                                                  SigningRequest request,
                                                  const std::string& actor,
                                                  TimePoint now = Clock::now());

  // Fails the rotation when any critical step is incomplete, otherwise
  // completes it; the schedule is updated either way.
  Result<RotationAuditTrail> FinishRotation(const std::string& rotation_id,
                                            const std::string& actor,
                                            TimePoint now = Clock::now());

  Result<RotationAuditTrail> RollbackRotation(const std::string& rotation_id,
                                              const std::string& actor,
                                              const std::string& reason,
                                              TimePoint now = Clock::now());

  Result<std::string> GenerateReport(const std::string& rotation_id);
  Result<std::vector<std::string>> CheckForSuspiciousActivity(const std::string& rotation_id);
  Result<VerificationSummary> GetVerificationSummary(const std::string& rotation_id);
  Result<bool> CanRollback(const std::string& rotation_id, TimePoint now = Clock::now());

 private:
  Result<RotationAuditTrail> LoadTrail(const std::string& rotation_id);
  Result<RotationVerificationChecklist> LoadChecklist(const std::string& rotation_id);
  Result<void> SaveTrail(const RotationAuditTrail& trail);

  ISigningStore& store_;
  RotationScheduler& scheduler_;
  GuardianSigningService& signing_;
  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mu_;
};

}  // namespace guardsig
