#include "guardsig/protocol/types.hpp"

namespace guardsig {

const char* ToString(SigningSessionStatus status) {
  switch (status) {
    case SigningSessionStatus::kPending:
      return "pending";
    case SigningSessionStatus::kCollectingCommitments:
      return "collecting_commitments";
    case SigningSessionStatus::kSigning:
      return "signing";
    case SigningSessionStatus::kAggregating:
      return "aggregating";
    case SigningSessionStatus::kCompleted:
      return "completed";
    case SigningSessionStatus::kFailed:
      return "failed";
    case SigningSessionStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

bool IsTerminal(SigningSessionStatus status) {
  return status == SigningSessionStatus::kCompleted ||
         status == SigningSessionStatus::kFailed ||
         status == SigningSessionStatus::kExpired;
}

const char* ToString(ReconstructionStatus status) {
  switch (status) {
    case ReconstructionStatus::kPending:
      return "pending";
    case ReconstructionStatus::kCompleted:
      return "completed";
    case ReconstructionStatus::kFailed:
      return "failed";
    case ReconstructionStatus::kExpired:
      return "expired";
  }
  return "unknown";
}

bool IsTerminal(ReconstructionStatus status) {
  return status != ReconstructionStatus::kPending;
}

}  // namespace guardsig
