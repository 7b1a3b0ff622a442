#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "guardsig/common/time.hpp"

namespace guardsig {

enum class RotationAuditStatus {
  kInProgress = 0,
  kCompleted = 1,
  kFailed = 2,
  kRolledBack = 3,
};

const char* ToString(RotationAuditStatus status);

namespace audit_event {
constexpr char kRotationStarted[] = "rotation_started";
constexpr char kStepCompleted[] = "step_completed";
constexpr char kStepFailed[] = "step_failed";
constexpr char kStepSkipped[] = "step_skipped";
constexpr char kSigningRequested[] = "signing_requested";
constexpr char kSigningFailed[] = "signing_failed";
constexpr char kRotationCompleted[] = "rotation_completed";
constexpr char kRotationFailed[] = "rotation_failed";
constexpr char kRotationRolledBack[] = "rotation_rolled_back";
}  // namespace audit_event

constexpr std::chrono::days kDefaultDeprecationWindow{30};

struct AuditEntry {
  std::string event_type;
  TimePoint timestamp;
  std::string actor;
  std::map<std::string, std::string> details;
};

// Append-only record of one key rotation. The status is set once, after
// which no further entries are accepted; a completed rotation may still be
// rolled back inside its deprecation window.
class RotationAuditTrail {
 public:
  RotationAuditTrail(std::string rotation_id,
                     std::string user_id,
                     std::string schedule_id,
                     TimePoint created_at = Clock::now());

  const std::string& rotation_id() const;
  const std::string& user_id() const;
  const std::string& schedule_id() const;
  const std::vector<AuditEntry>& entries() const;
  RotationAuditStatus status() const;
  TimePoint created_at() const;
  const std::optional<TimePoint>& completed_at() const;
  bool IsTerminal() const;

  // All mutators throw std::logic_error once the trail is terminal.
  void AddEntry(const std::string& event_type,
                const std::string& actor,
                std::map<std::string, std::string> details = {},
                TimePoint at = Clock::now());
  void MarkCompleted(const std::string& actor, TimePoint at = Clock::now());
  void MarkFailed(const std::string& actor, const std::string& error, TimePoint at = Clock::now());
  void MarkRolledBack(const std::string& actor, const std::string& reason, TimePoint at = Clock::now());

  // Informational warnings; never blocks anything.
  std::vector<std::string> CheckForSuspiciousActivity() const;

  std::string GenerateReport() const;

  // A completed rotation can be rolled back while the old key's
  // deprecation window is still open.
  bool CanRollback(TimePoint now = Clock::now(),
                   std::chrono::days window = kDefaultDeprecationWindow) const;

 private:
  void EnsureOpen() const;
  void Close(RotationAuditStatus status,
             const char* event_type,
             const std::string& actor,
             std::map<std::string, std::string> details,
             TimePoint at);

  std::string rotation_id_;
  std::string user_id_;
  std::string schedule_id_;
  std::vector<AuditEntry> entries_;
  RotationAuditStatus status_ = RotationAuditStatus::kInProgress;
  TimePoint created_at_;
  std::optional<TimePoint> completed_at_;
};

}  // namespace guardsig
