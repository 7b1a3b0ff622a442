#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "guardsig/common/time.hpp"
#include "guardsig/crypto/ec_point.hpp"

namespace guardsig {

using GuardianId = std::string;
using MessageDigest = std::array<uint8_t, 32>;

enum class SigningSessionStatus {
  kPending = 0,
  kCollectingCommitments = 1,
  kSigning = 2,
  kAggregating = 3,
  kCompleted = 4,
  kFailed = 5,
  kExpired = 6,
};

const char* ToString(SigningSessionStatus status);
bool IsTerminal(SigningSessionStatus status);

enum class ReconstructionStatus {
  kPending = 0,
  kCompleted = 1,
  kFailed = 2,
  kExpired = 3,
};

const char* ToString(ReconstructionStatus status);
bool IsTerminal(ReconstructionStatus status);

struct GuardianKeyInfo {
  uint32_t share_index = 0;
  ECPoint verification_share;
};

// Public half of a dealt family key. Holds no secret material.
struct FamilyKey {
  std::string family_id;
  std::string secret_id;
  ECPoint group_public_key;
  uint32_t threshold = 0;
  std::map<GuardianId, GuardianKeyInfo> guardians;
};

struct SigningSession {
  std::string session_id;
  std::string family_id;
  MessageDigest message_digest{};
  std::vector<GuardianId> participants;
  uint32_t threshold = 0;
  SigningSessionStatus status = SigningSessionStatus::kPending;
  std::string created_by;
  std::string event_type;

  // participant -> compressed nonce point (hex).
  std::map<GuardianId, std::string> nonce_commitments;
  // participant -> partial signature scalar (hex).
  std::map<GuardianId, std::string> partial_signatures;
  // participant -> reason given when declining.
  std::map<GuardianId, std::string> rejections;

  TimePoint created_at;
  TimePoint updated_at;
  TimePoint expires_at;
  std::optional<TimePoint> round1_started_at;
  std::optional<TimePoint> round2_started_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> failed_at;

  std::optional<std::string> final_signature;
  std::optional<std::string> final_event_id;
  std::optional<std::string> error_message;

  uint64_t version = 0;
};

struct NonceCommitment {
  std::string session_id;
  GuardianId participant_id;
  std::string commitment_value;
  bool used = false;
  TimePoint created_at;
  std::optional<TimePoint> used_at;
};

struct ReconstructionRequest {
  std::string request_id;
  std::string family_id;
  MessageDigest message_digest{};
  std::vector<GuardianId> required_guardians;
  uint32_t threshold = 0;
  ReconstructionStatus status = ReconstructionStatus::kPending;
  std::string created_by;
  std::string event_type;
  std::vector<GuardianId> submitted_guardians;
  std::map<GuardianId, std::string> rejections;

  TimePoint created_at;
  TimePoint updated_at;
  TimePoint expires_at;
  std::optional<TimePoint> completed_at;
  std::optional<TimePoint> failed_at;

  std::optional<std::string> final_event_id;
  std::optional<std::string> signature;
  std::optional<std::string> error_message;

  uint64_t version = 0;
};

}  // namespace guardsig
