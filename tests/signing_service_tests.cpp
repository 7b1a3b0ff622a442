#include <chrono>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "guardsig/common/error.hpp"
#include "guardsig/common/time.hpp"
#include "guardsig/crypto/encoding.hpp"
#include "guardsig/crypto/hash.hpp"
#include "guardsig/crypto/random.hpp"
#include "guardsig/crypto/schnorr.hpp"
#include "guardsig/crypto/threshold_scheme.hpp"
#include "guardsig/net/notifier.hpp"
#include "guardsig/net/publisher.hpp"
#include "guardsig/protocol/family_key.hpp"
#include "guardsig/protocol/method_policy.hpp"
#include "guardsig/protocol/signing_service.hpp"
#include "guardsig/store/in_memory_store.hpp"

namespace {

using guardsig::Bytes;
using guardsig::ErrorCode;
using guardsig::Result;
using guardsig::SigningMethod;
using guardsig::SigningOperation;
using guardsig::SigningRequest;
using guardsig::TimePoint;
using guardsig::UseCase;
using namespace std::chrono_literals;

const TimePoint kT0 = guardsig::FromEpochMillis(1'700'000'000'000);
const std::vector<std::string> kGuardians = {"g1", "g2", "g3"};

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

template <typename T>
void ExpectCode(const Result<T>& result, ErrorCode code, const std::string& message) {
  if (result.code() != code) {
    throw std::runtime_error("Test failed: " + message + " (got " + guardsig::ErrorCodeName(result.code()) +
                             ", want " + guardsig::ErrorCodeName(code) + ")");
  }
}

Bytes DigestOf(const std::string& text) {
  return guardsig::Sha256(Bytes(text.begin(), text.end()));
}

struct Fixture {
  Fixture()
      : dealt(guardsig::DealFamilyKey(guardsig::Csprng::RandomNonZeroScalar(), "family-1", kGuardians, 2)) {
    if (store.PutFamilyKey(dealt->key) != guardsig::StoreStatus::kOk) {
      throw std::runtime_error("failed to store family key");
    }
  }

  SigningRequest Request(const std::string& text, std::optional<UseCase> use_case) const {
    return SigningRequest{
        .family_id = "family-1",
        .message_digest = DigestOf(text),
        .event_type = "kind:1",
        .participants = kGuardians,
        .created_by = "g1",
        .use_case = use_case,
    };
  }

  guardsig::InMemorySigningStore store;
  guardsig::SchnorrThresholdScheme scheme;
  guardsig::InMemoryEventPublisher publisher;
  guardsig::InMemoryGuardianNotifier guardian_notifier;
  guardsig::ThresholdSessionManager sessions{store, scheme, publisher, guardian_notifier};
  guardsig::ReconstructionCoordinator reconstructions{store, publisher, guardian_notifier};
  guardsig::GuardianSigningService service{sessions, reconstructions};
  guardsig::Zeroizing<guardsig::DealtFamilyKey> dealt;
};

void TestMethodSelection() {
  Expect(guardsig::SelectMethod() == SigningMethod::kThresholdSignature, "default is threshold signature");
  Expect(guardsig::SelectMethod(UseCase::kDailyOperations) == SigningMethod::kThresholdSignature,
         "daily operations use threshold signatures");
  Expect(guardsig::SelectMethod(UseCase::kHighValueTransaction) == SigningMethod::kThresholdSignature,
         "high value transactions use threshold signatures");
  Expect(guardsig::SelectMethod(UseCase::kFedimintIntegration) == SigningMethod::kThresholdSignature,
         "federation integration uses threshold signatures");
  Expect(guardsig::SelectMethod(UseCase::kEmergencyRecovery) == SigningMethod::kKeyReconstruction,
         "emergency recovery reconstructs");
  Expect(guardsig::SelectMethod(UseCase::kKeyRotation) == SigningMethod::kKeyReconstruction,
         "key rotation reconstructs");
  Expect(guardsig::SelectMethod(UseCase::kPerformanceCritical) == SigningMethod::kKeyReconstruction,
         "performance critical reconstructs");
  Expect(guardsig::SelectMethod(UseCase::kOfflineGuardians) == SigningMethod::kKeyReconstruction,
         "offline guardians reconstruct");
  Expect(guardsig::SelectMethod(UseCase::kKeyRotation, SigningMethod::kThresholdSignature) ==
             SigningMethod::kThresholdSignature,
         "explicit override wins");

  const guardsig::MethodRecommendation threshold = guardsig::GetMethodRecommendation(UseCase::kDailyOperations);
  Expect(threshold.expected_latency == "450-900ms (multi-round)", "threshold latency estimate");
  Expect(threshold.security == "Maximum - never reconstructs private key", "threshold security note");
  const guardsig::MethodRecommendation reconstruct = guardsig::GetMethodRecommendation(UseCase::kEmergencyRecovery);
  Expect(reconstruct.method == SigningMethod::kKeyReconstruction, "recommendation follows selection");
  Expect(reconstruct.expected_latency == "150-300ms (single-round)", "reconstruction latency estimate");
  Expect(!reconstruct.reason.empty(), "recommendation explains itself");

  Expect(guardsig::ParseUseCase("offline_guardians") == UseCase::kOfflineGuardians, "use case parses");
  Expect(!guardsig::ParseUseCase("weekly").has_value(), "unknown use case");
  Expect(guardsig::ParseSigningMethod("key_reconstruction") == SigningMethod::kKeyReconstruction,
         "method parses");
  Expect(std::string(guardsig::ToString(SigningMethod::kThresholdSignature)) == "threshold_signature",
         "method names");
}

void TestRoutesByUseCase() {
  Fixture f;
  Result<SigningOperation> daily = f.service.CreateSigningRequest(f.Request("daily", UseCase::kDailyOperations), kT0);
  Expect(daily.ok() && daily.value().method == SigningMethod::kThresholdSignature, "daily routes to sessions");
  Expect(daily.value().status == "pending", "new operation is pending");
  Expect(f.sessions.GetSession(daily.value().id).ok(), "threshold session exists");

  Result<SigningOperation> recovery =
      f.service.CreateSigningRequest(f.Request("recovery", UseCase::kEmergencyRecovery), kT0);
  Expect(recovery.ok() && recovery.value().method == SigningMethod::kKeyReconstruction,
         "recovery routes to reconstruction");
  Expect(f.reconstructions.GetRequest(recovery.value().id).ok(), "reconstruction request exists");

  SigningRequest forced = f.Request("forced", UseCase::kDailyOperations);
  forced.preferred_method = SigningMethod::kKeyReconstruction;
  Result<SigningOperation> overridden = f.service.CreateSigningRequest(forced, kT0);
  Expect(overridden.ok() && overridden.value().method == SigningMethod::kKeyReconstruction,
         "preferred method overrides the use case");

  SigningRequest bad = f.Request("bad", std::nullopt);
  bad.participants = {"g1", "stranger"};
  ExpectCode(f.service.CreateSigningRequest(bad, kT0), ErrorCode::kValidation, "engine validation is surfaced");
}

void TestThresholdFlowThroughService() {
  Fixture f;
  const SigningOperation op = f.service.CreateSigningRequest(f.Request("via service", std::nullopt), kT0).value();

  guardsig::SigningNonce n1 = guardsig::SigningNonce::Generate();
  guardsig::SigningNonce n3 = guardsig::SigningNonce::Generate();
  Expect(f.service.SubmitNonceCommitment(op.id, "g1", n1.commitment.ToHex(), kT0).ok(), "commitment");
  Expect(f.service.SubmitNonceCommitment(op.id, "g3", n3.commitment.ToHex(), kT0).ok(), "commitment");

  const guardsig::SigningPackage package = f.sessions.GetSigningPackage(op.id, kT0).value();
  const guardsig::Share& s1 = f.dealt->shares.at("g1");
  const guardsig::Share& s3 = f.dealt->shares.at("g3");
  Expect(f.service
             .SubmitPartialSignature(op.id, "g1",
                                     f.scheme.SignPartial(package, s1.index, s1.value, n1).ToCanonicalHex(),
                                     kT0)
             .ok(),
         "partial accepted");
  Expect(f.service
             .SubmitPartialSignature(op.id, "g3",
                                     f.scheme.SignPartial(package, s3.index, s3.value, n3).ToCanonicalHex(),
                                     kT0)
             .ok(),
         "partial accepted");

  Result<std::string> signature = f.service.AggregateSignatures(op.id, kT0);
  Expect(signature.ok(), "aggregation through the service");
  Expect(guardsig::SchnorrVerify(guardsig::HexDecode(signature.value()), DigestOf("via service"),
                                 f.dealt->key.group_public_key.XOnlyBytes()),
         "service signature verifies");

  const SigningOperation status = f.service.GetSessionStatus(op.id).value();
  Expect(status.status == "completed" && status.signature == signature.value(), "status reflects completion");
}

void TestReconstructionFlowThroughService() {
  Fixture f;
  const SigningOperation op =
      f.service.CreateSigningRequest(f.Request("rotate", UseCase::kKeyRotation), kT0).value();
  Expect(f.service.SubmitShare(op.id, "g2", guardsig::EncodeShare(f.dealt->shares.at("g2")), kT0).ok(),
         "share accepted");
  Result<guardsig::ReconstructionRequest> done =
      f.service.SubmitShare(op.id, "g3", guardsig::EncodeShare(f.dealt->shares.at("g3")), kT0);
  Expect(done.ok() && done.value().status == guardsig::ReconstructionStatus::kCompleted, "request completed");

  const SigningOperation status = f.service.GetSessionStatus(op.id).value();
  Expect(status.method == SigningMethod::kKeyReconstruction, "status lookup falls back to reconstruction");
  Expect(status.signature.has_value() && status.final_event_id.has_value(), "status carries the signature");

  ExpectCode(f.service.GetSessionStatus(op.id, SigningMethod::kThresholdSignature), ErrorCode::kNotFound,
             "explicit method does not fall back");
  ExpectCode(f.service.GetSessionStatus("nothing"), ErrorCode::kNotFound, "unknown id");
}

void TestFailAndSweep() {
  Fixture f;
  const SigningOperation session = f.service.CreateSigningRequest(f.Request("s", std::nullopt), kT0).value();
  const SigningOperation request =
      f.service.CreateSigningRequest(f.Request("r", UseCase::kOfflineGuardians), kT0).value();

  Result<SigningOperation> failed = f.service.FailSession(request.id, "declined", std::nullopt, kT0 + 1s);
  Expect(failed.ok() && failed.value().status == "failed", "fail falls back to reconstruction");
  Expect(failed.value().error_message == "declined", "failure reason kept");
  ExpectCode(f.service.FailSession(request.id, "again", std::nullopt, kT0 + 2s), ErrorCode::kState,
             "failure is set once");

  const guardsig::ExpirySweepResult early = f.service.CleanupExpiredSessions(kT0 + 1min);
  Expect(early.sessions_expired == 0 && early.requests_expired == 0, "nothing expires early");
  const SigningOperation late = f.service.CreateSigningRequest(f.Request("late", UseCase::kKeyRotation), kT0).value();
  const guardsig::ExpirySweepResult swept = f.service.CleanupExpiredSessions(kT0 + 3h);
  Expect(swept.sessions_expired == 1 && swept.requests_expired == 1, "sweep expires both kinds");
  Expect(f.service.GetSessionStatus(session.id).value().status == "expired", "session expired");
  Expect(f.service.GetSessionStatus(late.id).value().status == "expired", "request expired");
}

void TestRejectRouting() {
  Fixture f;
  const SigningOperation session = f.service.CreateSigningRequest(f.Request("s", std::nullopt), kT0).value();
  const SigningOperation request =
      f.service.CreateSigningRequest(f.Request("r", UseCase::kEmergencyRecovery), kT0).value();
  Expect(f.guardian_notifier.sent().size() == kGuardians.size() * 2, "both engines notify every guardian");

  Result<SigningOperation> declined = f.service.RejectSigningRequest(session.id, "g1", "busy", std::nullopt, kT0);
  Expect(declined.ok() && declined.value().method == SigningMethod::kThresholdSignature,
         "rejection routes to the session");
  Expect(f.sessions.GetSession(session.id).value().rejections.count("g1") == 1, "session records the rejection");

  ExpectCode(f.service.RejectSigningRequest(request.id, "g1", "", SigningMethod::kThresholdSignature, kT0),
             ErrorCode::kNotFound, "explicit method does not fall back");
  for (const char* guardian : {"g1", "g2", "g3"}) {
    Result<SigningOperation> rejected = f.service.RejectSigningRequest(request.id, guardian, "", std::nullopt, kT0);
    Expect(rejected.ok() && rejected.value().method == SigningMethod::kKeyReconstruction,
           "rejection falls back to reconstruction");
    Expect(rejected.value().status == "pending", "request lives while the threshold is reachable");
  }
  Result<SigningOperation> last = f.service.RejectSigningRequest(request.id, "g4", "", std::nullopt, kT0 + 1s);
  Expect(last.ok() && last.value().status == "failed", "unreachable threshold fails the request");
  Expect(last.value().error_message == "threshold unreachable: 4 of 5 guardians rejected",
         "failure reason counts rejections only");
  ExpectCode(f.service.RejectSigningRequest("nothing", "g1", "", std::nullopt, kT0), ErrorCode::kNotFound,
             "unknown id");
}

}  // namespace

int main() {
  try {
    TestMethodSelection();
    TestRoutesByUseCase();
    TestThresholdFlowThroughService();
    TestReconstructionFlowThroughService();
    TestFailAndSweep();
    TestRejectRouting();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Signing service tests passed" << '\n';
  return 0;
}
