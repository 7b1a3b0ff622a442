#include "guardsig/common/error.hpp"

namespace guardsig {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kValidation:
      return "validation";
    case ErrorCode::kNotFound:
      return "not_found";
    case ErrorCode::kState:
      return "state";
    case ErrorCode::kReplay:
      return "replay";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kAggregation:
      return "aggregation";
    case ErrorCode::kPersistence:
      return "persistence";
    case ErrorCode::kConflict:
      return "conflict";
  }
  return "unknown";
}

bool IsRetryable(ErrorCode code) {
  return code == ErrorCode::kPersistence || code == ErrorCode::kConflict;
}

}  // namespace guardsig
