#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace guardsig {

enum class SigningMethod {
  kThresholdSignature = 0,
  kKeyReconstruction = 1,
};

enum class UseCase {
  kDailyOperations = 0,
  kHighValueTransaction = 1,
  kFedimintIntegration = 2,
  kEmergencyRecovery = 3,
  kKeyRotation = 4,
  kPerformanceCritical = 5,
  kOfflineGuardians = 6,
};

const char* ToString(SigningMethod method);
const char* ToString(UseCase use_case);
std::optional<SigningMethod> ParseSigningMethod(std::string_view text);
std::optional<UseCase> ParseUseCase(std::string_view text);

struct MethodRecommendation {
  SigningMethod method = SigningMethod::kThresholdSignature;
  std::string reason;
  std::string expected_latency;
  std::string security;
};

// An explicit override always wins. Without a use case the
// never-reconstruct threshold signature is chosen.
SigningMethod SelectMethod(std::optional<UseCase> use_case = std::nullopt,
                           std::optional<SigningMethod> override_method = std::nullopt);

MethodRecommendation GetMethodRecommendation(std::optional<UseCase> use_case);

}  // namespace guardsig
