#include "guardsig/protocol/method_policy.hpp"

namespace guardsig {
namespace {

constexpr UseCase kAllUseCases[] = {
    UseCase::kDailyOperations,   UseCase::kHighValueTransaction, UseCase::kFedimintIntegration,
    UseCase::kEmergencyRecovery, UseCase::kKeyRotation,          UseCase::kPerformanceCritical,
    UseCase::kOfflineGuardians,
};

const char* ReasonFor(UseCase use_case) {
  switch (use_case) {
    case UseCase::kDailyOperations:
      return "Routine signing keeps the key split at all times";
    case UseCase::kHighValueTransaction:
      return "High-value operations must never expose the full key";
    case UseCase::kFedimintIntegration:
      return "Federation integration requires threshold signatures";
    case UseCase::kEmergencyRecovery:
      return "Recovery must succeed in a single round";
    case UseCase::kKeyRotation:
      return "Rotation needs the key material to derive and delegate the new key";
    case UseCase::kPerformanceCritical:
      return "Single-round signing has the lowest latency";
    case UseCase::kOfflineGuardians:
      return "Guardians can submit shares asynchronously without a live multi-round exchange";
  }
  return "";
}

}  // namespace

const char* ToString(SigningMethod method) {
  switch (method) {
    case SigningMethod::kThresholdSignature:
      return "threshold_signature";
    case SigningMethod::kKeyReconstruction:
      return "key_reconstruction";
  }
  return "unknown";
}

const char* ToString(UseCase use_case) {
  switch (use_case) {
    case UseCase::kDailyOperations:
      return "daily_operations";
    case UseCase::kHighValueTransaction:
      return "high_value_transaction";
    case UseCase::kFedimintIntegration:
      return "fedimint_integration";
    case UseCase::kEmergencyRecovery:
      return "emergency_recovery";
    case UseCase::kKeyRotation:
      return "key_rotation";
    case UseCase::kPerformanceCritical:
      return "performance_critical";
    case UseCase::kOfflineGuardians:
      return "offline_guardians";
  }
  return "unknown";
}

std::optional<SigningMethod> ParseSigningMethod(std::string_view text) {
  for (SigningMethod method : {SigningMethod::kThresholdSignature, SigningMethod::kKeyReconstruction}) {
    if (text == ToString(method)) {
      return method;
    }
  }
  return std::nullopt;
}

std::optional<UseCase> ParseUseCase(std::string_view text) {
  for (UseCase use_case : kAllUseCases) {
    if (text == ToString(use_case)) {
      return use_case;
    }
  }
  return std::nullopt;
}

SigningMethod SelectMethod(std::optional<UseCase> use_case, std::optional<SigningMethod> override_method) {
  if (override_method.has_value()) {
    return *override_method;
  }
  if (!use_case.has_value()) {
    return SigningMethod::kThresholdSignature;
  }
  switch (*use_case) {
    case UseCase::kDailyOperations:
    case UseCase::kHighValueTransaction:
    case UseCase::kFedimintIntegration:
      return SigningMethod::kThresholdSignature;
    case UseCase::kEmergencyRecovery:
    case UseCase::kKeyRotation:
    case UseCase::kPerformanceCritical:
    case UseCase::kOfflineGuardians:
      return SigningMethod::kKeyReconstruction;
  }
  return SigningMethod::kThresholdSignature;
}

MethodRecommendation GetMethodRecommendation(std::optional<UseCase> use_case) {
  MethodRecommendation out;
  out.method = SelectMethod(use_case);
  out.reason = use_case.has_value() ? ReasonFor(*use_case)
                                    : "Default to the method that never reconstructs the key";
  if (out.method == SigningMethod::kThresholdSignature) {
    out.expected_latency = "450-900ms (multi-round)";
    out.security = "Maximum - never reconstructs private key";
  } else {
    out.expected_latency = "150-300ms (single-round)";
    out.security = "Good - temporarily reconstructs key with immediate cleanup";
  }
  return out;
}

}  // namespace guardsig
