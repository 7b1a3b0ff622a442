#include "guardsig/rotation/verification.hpp"

#include <stdexcept>
#include <utility>

namespace guardsig {

const char* ToString(StepStatus status) {
  switch (status) {
    case StepStatus::kPending:
      return "pending";
    case StepStatus::kCompleted:
      return "completed";
    case StepStatus::kFailed:
      return "failed";
    case StepStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

const char* ToString(VerificationStatus status) {
  switch (status) {
    case VerificationStatus::kVerified:
      return "verified";
    case VerificationStatus::kPartial:
      return "partial";
    case VerificationStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

RotationVerificationChecklist::RotationVerificationChecklist() {
  auto add = [this](const char* name, const char* description, bool critical) {
    steps_.push_back(VerificationStep{
        .name = name,
        .description = description,
        .critical = critical,
    });
  };

  add(rotation_step::kDelegationPublished, "Delegation from the old key to the new key published", true);
  add(rotation_step::kProfileUpdated, "Profile metadata republished under the new key", true);
  add(rotation_step::kNip05Updated, "NIP-05 identifier points at the new key", false);
  add(rotation_step::kLightningAddressUpdated, "Lightning address bound to the new key", false);
  add(rotation_step::kContactsNotified, "Contacts notified of the key change", false);
  add(rotation_step::kDeprecationNoticePublished, "Deprecation notice published for the old key", false);
  add(rotation_step::kKeyStorageUpdated, "New key material written to durable storage", true);
  add(rotation_step::kAuditRecorded, "Rotation recorded in the audit log", false);
}

const std::vector<VerificationStep>& RotationVerificationChecklist::steps() const {
  return steps_;
}

const VerificationStep& RotationVerificationChecklist::step(const std::string& name) const {
  for (const VerificationStep& s : steps_) {
    if (s.name == name) {
      return s;
    }
  }
  throw std::invalid_argument("unknown verification step: " + name);
}

void RotationVerificationChecklist::MarkStepCompleted(const std::string& name, TimePoint at) {
  VerificationStep& s = MutableStep(name);
  s.status = StepStatus::kCompleted;
  s.completed_at = at;
  s.error.reset();
}

void RotationVerificationChecklist::MarkStepFailed(const std::string& name,
                                                   const std::string& error,
                                                   TimePoint at) {
  VerificationStep& s = MutableStep(name);
  s.status = StepStatus::kFailed;
  s.completed_at = at;
  s.error = error;
}

void RotationVerificationChecklist::MarkStepSkipped(const std::string& name) {
  VerificationStep& s = MutableStep(name);
  s.status = StepStatus::kSkipped;
  s.completed_at.reset();
  s.error.reset();
}

VerificationStatus RotationVerificationChecklist::CalculateOverallStatus() const {
  bool all_completed = true;
  for (const VerificationStep& s : steps_) {
    if (s.status == StepStatus::kFailed) {
      return VerificationStatus::kFailed;
    }
    if (s.status != StepStatus::kCompleted) {
      all_completed = false;
    }
  }
  return all_completed ? VerificationStatus::kVerified : VerificationStatus::kPartial;
}

std::vector<VerificationIssue> RotationVerificationChecklist::GetCriticalIssues() const {
  std::vector<VerificationIssue> issues;
  for (const VerificationStep& s : steps_) {
    if (s.critical && s.status != StepStatus::kCompleted) {
      std::string message = s.description + " (" + ToString(s.status) + ")";
      if (s.error.has_value()) {
        message += ": " + *s.error;
      }
      issues.push_back(VerificationIssue{
          .severity = IssueSeverity::kCritical,
          .step = s.name,
          .message = std::move(message),
      });
    }
  }
  return issues;
}

bool RotationVerificationChecklist::HasCriticalIssues() const {
  return !GetCriticalIssues().empty();
}

VerificationSummary RotationVerificationChecklist::GetVerificationSummary() const {
  VerificationSummary summary;
  summary.total = steps_.size();
  for (const VerificationStep& s : steps_) {
    switch (s.status) {
      case StepStatus::kCompleted:
        ++summary.completed;
        break;
      case StepStatus::kFailed:
        ++summary.failed;
        break;
      case StepStatus::kSkipped:
        ++summary.skipped;
        break;
      case StepStatus::kPending:
        ++summary.pending;
        break;
    }
  }
  summary.overall = CalculateOverallStatus();
  summary.issues = GetCriticalIssues();
  for (const VerificationStep& s : steps_) {
    if (!s.critical && s.status == StepStatus::kFailed) {
      summary.issues.push_back(VerificationIssue{
          .severity = IssueSeverity::kWarning,
          .step = s.name,
          .message = s.description + " failed" + (s.error.has_value() ? ": " + *s.error : std::string()),
      });
    }
  }
  return summary;
}

VerificationStep& RotationVerificationChecklist::MutableStep(const std::string& name) {
  for (VerificationStep& s : steps_) {
    if (s.name == name) {
      return s;
    }
  }
  throw std::invalid_argument("unknown verification step: " + name);
}

}  // namespace guardsig
