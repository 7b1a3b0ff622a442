#include "guardsig/rotation/audit_trail.hpp"

#include <set>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace guardsig {
namespace {

constexpr size_t kMaxFailureEntries = 2;
constexpr size_t kMaxDistinctActors = 2;
constexpr std::chrono::hours kMaxRotationDuration{24};

bool IsFailureEntry(const std::string& event_type) {
  constexpr std::string_view kSuffix = "_failed";
  return event_type.size() >= kSuffix.size() &&
         event_type.compare(event_type.size() - kSuffix.size(), kSuffix.size(), kSuffix) == 0;
}

}  // namespace

const char* ToString(RotationAuditStatus status) {
  switch (status) {
    case RotationAuditStatus::kInProgress:
      return "in_progress";
    case RotationAuditStatus::kCompleted:
      return "completed";
    case RotationAuditStatus::kFailed:
      return "failed";
    case RotationAuditStatus::kRolledBack:
      return "rolled_back";
  }
  return "unknown";
}

RotationAuditTrail::RotationAuditTrail(std::string rotation_id,
                                       std::string user_id,
                                       std::string schedule_id,
                                       TimePoint created_at)
    : rotation_id_(std::move(rotation_id)),
      user_id_(std::move(user_id)),
      schedule_id_(std::move(schedule_id)),
      created_at_(created_at) {
  if (rotation_id_.empty()) {
    throw std::invalid_argument("rotation_id must not be empty");
  }
  if (user_id_.empty()) {
    throw std::invalid_argument("user_id must not be empty");
  }
}

const std::string& RotationAuditTrail::rotation_id() const {
  return rotation_id_;
}

const std::string& RotationAuditTrail::user_id() const {
  return user_id_;
}

const std::string& RotationAuditTrail::schedule_id() const {
  return schedule_id_;
}

const std::vector<AuditEntry>& RotationAuditTrail::entries() const {
  return entries_;
}

RotationAuditStatus RotationAuditTrail::status() const {
  return status_;
}

TimePoint RotationAuditTrail::created_at() const {
  return created_at_;
}

const std::optional<TimePoint>& RotationAuditTrail::completed_at() const {
  return completed_at_;
}

bool RotationAuditTrail::IsTerminal() const {
  return status_ != RotationAuditStatus::kInProgress;
}

void RotationAuditTrail::AddEntry(const std::string& event_type,
                                  const std::string& actor,
                                  std::map<std::string, std::string> details,
                                  TimePoint at) {
  EnsureOpen();
  if (event_type.empty()) {
    throw std::invalid_argument("audit event_type must not be empty");
  }
  entries_.push_back(AuditEntry{
      .event_type = event_type,
      .timestamp = at,
      .actor = actor,
      .details = std::move(details),
  });
}

void RotationAuditTrail::MarkCompleted(const std::string& actor, TimePoint at) {
  Close(RotationAuditStatus::kCompleted, audit_event::kRotationCompleted, actor, {}, at);
}

void RotationAuditTrail::MarkFailed(const std::string& actor, const std::string& error, TimePoint at) {
  Close(RotationAuditStatus::kFailed, audit_event::kRotationFailed, actor, {{"error", error}}, at);
}

void RotationAuditTrail::MarkRolledBack(const std::string& actor, const std::string& reason, TimePoint at) {
  if (status_ == RotationAuditStatus::kCompleted) {
    if (!CanRollback(at)) {
      throw std::logic_error("rollback window has closed");
    }
    // The only transition out of a terminal status.
    status_ = RotationAuditStatus::kInProgress;
  }
  Close(RotationAuditStatus::kRolledBack, audit_event::kRotationRolledBack, actor, {{"reason", reason}}, at);
}

std::vector<std::string> RotationAuditTrail::CheckForSuspiciousActivity() const {
  std::vector<std::string> warnings;

  size_t failures = 0;
  bool rolled_back = false;
  std::set<std::string> actors;
  TimePoint last_seen = created_at_;
  for (const AuditEntry& entry : entries_) {
    if (IsFailureEntry(entry.event_type)) {
      ++failures;
    }
    if (entry.event_type == audit_event::kRotationRolledBack) {
      rolled_back = true;
    }
    if (!entry.actor.empty()) {
      actors.insert(entry.actor);
    }
    if (entry.timestamp > last_seen) {
      last_seen = entry.timestamp;
    }
  }

  if (failures > kMaxFailureEntries) {
    warnings.push_back("multiple failures recorded (" + std::to_string(failures) + ")");
  }
  if (rolled_back) {
    warnings.push_back("rotation was rolled back");
  }
  if (actors.size() > kMaxDistinctActors) {
    warnings.push_back("rotation involved " + std::to_string(actors.size()) + " distinct actors");
  }

  const TimePoint end = completed_at_.value_or(last_seen);
  if (end - created_at_ > kMaxRotationDuration) {
    warnings.push_back("rotation took longer than 24 hours");
  }
  return warnings;
}

std::string RotationAuditTrail::GenerateReport() const {
  std::ostringstream out;
  out << "Rotation " << rotation_id_ << " (user " << user_id_ << ")\n";
  out << "Status: " << ToString(status_) << "\n";
  out << "Started: " << ToEpochMillis(created_at_) << "\n";
  if (completed_at_.has_value()) {
    out << "Finished: " << ToEpochMillis(*completed_at_) << "\n";
  }
  out << "Entries: " << entries_.size() << "\n";
  for (const AuditEntry& entry : entries_) {
    out << "  [" << ToEpochMillis(entry.timestamp) << "] " << entry.event_type;
    if (!entry.actor.empty()) {
      out << " by " << entry.actor;
    }
    for (const auto& [key, value] : entry.details) {
      out << " " << key << "=" << value;
    }
    out << "\n";
  }

  const std::vector<std::string> warnings = CheckForSuspiciousActivity();
  if (!warnings.empty()) {
    out << "Warnings:\n";
    for (const std::string& warning : warnings) {
      out << "  - " << warning << "\n";
    }
  }
  return out.str();
}

bool RotationAuditTrail::CanRollback(TimePoint now, std::chrono::days window) const {
  if (status_ != RotationAuditStatus::kCompleted || !completed_at_.has_value()) {
    return false;
  }
  return now - *completed_at_ <= window;
}

void RotationAuditTrail::EnsureOpen() const {
  if (IsTerminal()) {
    throw std::logic_error("audit trail is closed");
  }
}

void RotationAuditTrail::Close(RotationAuditStatus status,
                               const char* event_type,
                               const std::string& actor,
                               std::map<std::string, std::string> details,
                               TimePoint at) {
  EnsureOpen();
  entries_.push_back(AuditEntry{
      .event_type = event_type,
      .timestamp = at,
      .actor = actor,
      .details = std::move(details),
  });
  status_ = status;
  if (!completed_at_.has_value()) {
    completed_at_ = at;
  }
}

}  // namespace guardsig
