#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace guardsig {

enum class ErrorCode : uint8_t {
  kOk = 0,
  kValidation = 1,
  kNotFound = 2,
  kState = 3,
  kReplay = 4,
  kTimeout = 5,
  kAggregation = 6,
  kPersistence = 7,
  kConflict = 8,
};

class GuardsigErrorCategory : public std::error_category {
 public:
  const char* name() const noexcept override { return "guardsig"; }

  std::string message(int ev) const override {
    switch (static_cast<ErrorCode>(ev)) {
      case ErrorCode::kOk:
        return "ok";
      case ErrorCode::kValidation:
        return "validation error";
      case ErrorCode::kNotFound:
        return "not found";
      case ErrorCode::kState:
        return "operation invalid for current status";
      case ErrorCode::kReplay:
        return "duplicate or reused commitment";
      case ErrorCode::kTimeout:
        return "entity has expired";
      case ErrorCode::kAggregation:
        return "signature aggregation failed";
      case ErrorCode::kPersistence:
        return "persistence failure";
      case ErrorCode::kConflict:
        return "concurrent update conflict";
      default:
        return "unknown guardsig error";
    }
  }
};

inline const std::error_category& guardsig_category() {
  static GuardsigErrorCategory instance;
  return instance;
}

inline std::error_code make_error_code(ErrorCode e) {
  return {static_cast<int>(e), guardsig_category()};
}

// Machine-readable code for structured results ("validation", "replay", ...).
const char* ErrorCodeName(ErrorCode code);

// Persistence and conflict failures may be retried by the caller. Nothing
// else becomes valid on retry.
bool IsRetryable(ErrorCode code);

struct Error {
  ErrorCode code = ErrorCode::kOk;
  std::string message;

  std::error_code error_code() const { return make_error_code(code); }
};

template <typename T>
class Result {
 public:
  Result(T value) : state_(std::move(value)) {}
  Result(Error error) : state_(std::move(error)) {
    if (std::get<Error>(state_).code == ErrorCode::kOk) {
      throw std::logic_error("error result must carry a non-ok code");
    }
  }

  static Result Ok(T value) { return Result(std::move(value)); }
  static Result Err(ErrorCode code, std::string message) {
    return Result(Error{.code = code, .message = std::move(message)});
  }

  bool ok() const { return std::holds_alternative<T>(state_); }
  explicit operator bool() const { return ok(); }

  const T& value() const& {
    EnsureOk();
    return std::get<T>(state_);
  }
  T& value() & {
    EnsureOk();
    return std::get<T>(state_);
  }
  T&& value() && {
    EnsureOk();
    return std::get<T>(std::move(state_));
  }

  const Error& error() const {
    if (ok()) {
      throw std::logic_error("result holds a value, not an error");
    }
    return std::get<Error>(state_);
  }

  ErrorCode code() const { return ok() ? ErrorCode::kOk : error().code; }

 private:
  void EnsureOk() const {
    if (!ok()) {
      throw std::logic_error("result holds an error: " + std::get<Error>(state_).message);
    }
  }

  std::variant<T, Error> state_;
};

template <>
class Result<void> {
 public:
  Result() = default;
  Result(Error error) : error_(std::move(error)) {
    if (error_.code == ErrorCode::kOk) {
      throw std::logic_error("error result must carry a non-ok code");
    }
  }

  static Result Ok() { return Result(); }
  static Result Err(ErrorCode code, std::string message) {
    return Result(Error{.code = code, .message = std::move(message)});
  }

  bool ok() const { return error_.code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  const Error& error() const {
    if (ok()) {
      throw std::logic_error("result holds no error");
    }
    return error_;
  }

  ErrorCode code() const { return error_.code; }

 private:
  Error error_;
};

inline Error MakeError(ErrorCode code, std::string message) {
  return Error{.code = code, .message = std::move(message)};
}

}  // namespace guardsig

namespace std {
template <>
struct is_error_code_enum<guardsig::ErrorCode> : true_type {};
}  // namespace std
