#include "guardsig/store/signing_store.hpp"

namespace guardsig {

const char* ToString(StoreStatus status) {
  switch (status) {
    case StoreStatus::kOk:
      return "ok";
    case StoreStatus::kNotFound:
      return "not_found";
    case StoreStatus::kDuplicate:
      return "duplicate";
    case StoreStatus::kConflict:
      return "conflict";
    case StoreStatus::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

Error StoreFailure(StoreStatus status, const std::string& what) {
  switch (status) {
    case StoreStatus::kNotFound:
      return MakeError(ErrorCode::kNotFound, what + " not found");
    case StoreStatus::kConflict:
      return MakeError(ErrorCode::kConflict, what + " was modified concurrently");
    case StoreStatus::kOk:
    case StoreStatus::kDuplicate:
    case StoreStatus::kUnavailable:
      break;
  }
  return MakeError(ErrorCode::kPersistence, what + ": store returned " + ToString(status));
}

}  // namespace guardsig
