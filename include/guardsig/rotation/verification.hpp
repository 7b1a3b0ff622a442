#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "guardsig/common/time.hpp"

namespace guardsig {

enum class StepStatus {
  kPending = 0,
  kCompleted = 1,
  kFailed = 2,
  kSkipped = 3,
};

enum class VerificationStatus {
  kVerified = 0,
  kPartial = 1,
  kFailed = 2,
};

const char* ToString(StepStatus status);
const char* ToString(VerificationStatus status);

namespace rotation_step {
constexpr char kDelegationPublished[] = "delegation_published";
constexpr char kProfileUpdated[] = "profile_updated";
constexpr char kNip05Updated[] = "nip05_updated";
constexpr char kLightningAddressUpdated[] = "lightning_address_updated";
constexpr char kContactsNotified[] = "contacts_notified";
constexpr char kDeprecationNoticePublished[] = "deprecation_notice_published";
constexpr char kKeyStorageUpdated[] = "key_storage_updated";
constexpr char kAuditRecorded[] = "audit_recorded";
}  // namespace rotation_step

struct VerificationStep {
  std::string name;
  std::string description;
  StepStatus status = StepStatus::kPending;
  bool critical = false;
  std::optional<TimePoint> completed_at;
  std::optional<std::string> error;
};

enum class IssueSeverity {
  kCritical = 0,
  kWarning = 1,
};

struct VerificationIssue {
  IssueSeverity severity = IssueSeverity::kWarning;
  std::string step;
  std::string message;
};

struct VerificationSummary {
  size_t total = 0;
  size_t completed = 0;
  size_t failed = 0;
  size_t skipped = 0;
  size_t pending = 0;
  VerificationStatus overall = VerificationStatus::kPartial;
  std::vector<VerificationIssue> issues;
};

class RotationVerificationChecklist {
 public:
  // The eight post-rotation steps, all pending.
  RotationVerificationChecklist();

  const std::vector<VerificationStep>& steps() const;
  const VerificationStep& step(const std::string& name) const;

  // Throw std::invalid_argument for an unknown step name.
  void MarkStepCompleted(const std::string& name, TimePoint at = Clock::now());
  void MarkStepFailed(const std::string& name, const std::string& error, TimePoint at = Clock::now());
  void MarkStepSkipped(const std::string& name);

  VerificationStatus CalculateOverallStatus() const;
  std::vector<VerificationIssue> GetCriticalIssues() const;
  bool HasCriticalIssues() const;
  VerificationSummary GetVerificationSummary() const;

 private:
  VerificationStep& MutableStep(const std::string& name);

  std::vector<VerificationStep> steps_;
};

}  // namespace guardsig
