#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "guardsig/crypto/ec_point.hpp"
#include "guardsig/crypto/random.hpp"
#include "guardsig/crypto/scalar.hpp"
#include "guardsig/crypto/shamir.hpp"
#include "guardsig/protocol/family_key.hpp"

namespace {

using guardsig::ECPoint;
using guardsig::Scalar;
using guardsig::Share;
using guardsig::ShareSet;

void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

std::vector<Share> Pick(const ShareSet& shares, const std::vector<uint32_t>& indices) {
  std::vector<Share> out;
  for (uint32_t index : indices) {
    out.push_back(shares.get().at(index - 1));
  }
  return out;
}

void TestSplitAndReconstruct() {
  const Scalar secret = guardsig::Csprng::RandomNonZeroScalar();
  const ShareSet shares = guardsig::SplitSecret(secret, 3, 5, "family-1");

  Expect(shares->size() == 5, "SplitSecret produces N shares");
  for (size_t i = 0; i < shares->size(); ++i) {
    const Share& share = shares.get()[i];
    Expect(share.index == i + 1, "share indices run 1..N");
    Expect(share.threshold == 3 && share.total_shares == 5, "shares carry threshold metadata");
    Expect(share.secret_id == "family-1", "shares carry the secret id");
  }

  Expect(guardsig::ReconstructSecret(Pick(shares, {1, 3, 5})).get() == secret,
         "shares {1,3,5} reconstruct the secret");
  Expect(guardsig::ReconstructSecret(Pick(shares, {2, 4, 5})).get() == secret,
         "shares {2,4,5} reconstruct the secret");
  Expect(guardsig::ReconstructSecret(Pick(shares, {1, 2, 3, 4, 5})).get() == secret,
         "more than threshold shares reconstruct the secret");
}

void TestReconstructRejectsBadInput() {
  const Scalar secret = guardsig::Csprng::RandomNonZeroScalar();
  const ShareSet shares = guardsig::SplitSecret(secret, 3, 5, "family-1");

  ExpectThrow([&]() { (void)guardsig::ReconstructSecret(Pick(shares, {1, 2})); },
              "fewer than threshold shares are rejected");
  ExpectThrow([&]() { (void)guardsig::ReconstructSecret(Pick(shares, {4})); },
              "a single share is rejected");
  ExpectThrow([&]() { (void)guardsig::ReconstructSecret(Pick(shares, {1, 1, 2})); },
              "duplicate indices are rejected");

  const ShareSet other = guardsig::SplitSecret(secret, 3, 5, "family-2");
  std::vector<Share> mixed = Pick(shares, {1, 2});
  mixed.push_back(other.get()[2]);
  ExpectThrow([&]() { (void)guardsig::ReconstructSecret(mixed); }, "shares of different secrets are rejected");
}

void TestSplitValidation() {
  const Scalar secret = Scalar::FromUint64(1234);
  ExpectThrow([&]() { (void)guardsig::SplitSecret(secret, 1, 3, "id"); }, "threshold below 2");
  ExpectThrow([&]() { (void)guardsig::SplitSecret(secret, 4, 3, "id"); }, "threshold above total");
  ExpectThrow([&]() { (void)guardsig::SplitSecret(secret, 2, 256, "id"); }, "more than 255 shares");
  ExpectThrow([&]() { (void)guardsig::SplitSecret(Scalar(), 2, 3, "id"); }, "zero secret");
  ExpectThrow([&]() { (void)guardsig::SplitSecret(secret, 2, 3, "a:b"); }, "secret id with separator");
  ExpectThrow([&]() { (void)guardsig::SplitSecret(secret, 2, 3, ""); }, "empty secret id");
}

void TestShareEncoding() {
  const ShareSet shares = guardsig::SplitSecret(Scalar::FromUint64(99), 2, 3, "abc123");
  const Share& share = shares.get()[1];
  const std::string encoded = guardsig::EncodeShare(share);
  Expect(encoded.rfind("abc123:2:2:3:", 0) == 0, "encoded share starts with its metadata");
  Expect(encoded.size() == std::string("abc123:2:2:3:").size() + 64, "encoded value is 64 hex chars");

  const Share decoded = guardsig::DecodeShare(encoded);
  Expect(decoded.index == share.index && decoded.value == share.value && decoded.secret_id == share.secret_id &&
             decoded.threshold == share.threshold && decoded.total_shares == share.total_shares,
         "decoded share matches the original");

  const std::string value = share.value.ToCanonicalHex();
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:x:2:3:" + value); }, "non-numeric index");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:-1:2:3:" + value); }, "negative index");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:0:2:3:" + value); }, "index zero");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:4:2:3:" + value); }, "index above total");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:1:2:3"); }, "missing field");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:1:2:3:" + value.substr(2)); }, "short value");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:1:2:3:" + std::string(64, 'g')); }, "non-hex value");
  ExpectThrow([&]() { (void)guardsig::DecodeShare("abc123:1:1:3:" + value); }, "threshold below 2");
}

void TestLagrangeCoefficients() {
  // Interpolating the constant polynomial 1 gives sum(lambda_i) == 1.
  for (const std::vector<uint32_t>& indices :
       {std::vector<uint32_t>{1, 2, 3}, std::vector<uint32_t>{2, 4, 5}, std::vector<uint32_t>{1, 7}}) {
    Scalar sum;
    for (const auto& [index, lambda] : guardsig::ComputeLagrangeAtZero(indices)) {
      (void)index;
      sum = sum + lambda;
    }
    Expect(sum == Scalar::FromUint64(1), "lagrange coefficients at zero sum to one");
  }
  ExpectThrow([&]() { (void)guardsig::ComputeLagrangeAtZero({1, 1}); }, "duplicate lagrange index");
  ExpectThrow([&]() { (void)guardsig::ComputeLagrangeAtZero({0, 1}); }, "zero lagrange index");

  const std::vector<Scalar> coefficients = {Scalar::FromUint64(5), Scalar::FromUint64(3), Scalar::FromUint64(2)};
  Expect(guardsig::EvaluatePolynomialAt(coefficients, 2) == Scalar::FromUint64(5 + 6 + 8),
         "polynomial evaluation at x = 2");
}

void TestRecommendShareDistribution() {
  Expect(guardsig::RecommendShareDistribution(2).distribution == "2-of-3", "two members get 2-of-3");
  Expect(guardsig::RecommendShareDistribution(3).distribution == "2-of-3", "three members get 2-of-3");
  Expect(guardsig::RecommendShareDistribution(4).distribution == "3-of-4", "four members get 3-of-4");
  Expect(guardsig::RecommendShareDistribution(5).distribution == "3-of-5", "five members get 3-of-5");
  Expect(guardsig::RecommendShareDistribution(6).distribution == "4-of-7", "six members get 4-of-7");
  Expect(guardsig::RecommendShareDistribution(7).threshold == 4, "seven members need four shares");
  const guardsig::ShareDistribution large = guardsig::RecommendShareDistribution(12);
  Expect(large.threshold == 5 && large.total_shares == 7, "large families get 5-of-7");
}

void TestDealFamilyKey() {
  const Scalar secret = guardsig::Csprng::RandomNonZeroScalar();
  const std::vector<std::string> guardians = {"alice", "bob", "carol", "dave"};
  const auto dealt = guardsig::DealFamilyKey(secret, "family-x", guardians, 3);

  Expect(dealt->key.group_public_key == ECPoint::GeneratorMultiply(secret), "group key is secret * G");
  Expect(dealt->key.threshold == 3, "dealt key records its threshold");
  Expect(dealt->key.guardians.size() == 4 && dealt->shares.size() == 4, "every guardian gets a share");
  Expect(dealt->key.guardians.at("alice").share_index == 1 && dealt->key.guardians.at("dave").share_index == 4,
         "share indices follow the given guardian order");
  for (const auto& [guardian, share] : dealt->shares) {
    Expect(dealt->key.guardians.at(guardian).verification_share == ECPoint::GeneratorMultiply(share.value),
           "verification share matches the guardian's share");
    Expect(share.secret_id == dealt->key.secret_id, "shares carry the key's secret id");
  }

  std::vector<Share> subset = {dealt->shares.at("bob"), dealt->shares.at("carol"), dealt->shares.at("dave")};
  Expect(guardsig::ReconstructSecret(subset).get() == secret, "dealt shares reconstruct the family key");

  ExpectThrow([&]() { (void)guardsig::DealFamilyKey(secret, "family-x", {"a", "a", "b"}, 2); },
              "duplicate guardian ids");
  ExpectThrow([&]() { (void)guardsig::DealFamilyKey(secret, "", guardians, 2); }, "empty family id");
}

}  // namespace

int main() {
  try {
    TestSplitAndReconstruct();
    TestReconstructRejectsBadInput();
    TestSplitValidation();
    TestShareEncoding();
    TestLagrangeCoefficients();
    TestRecommendShareDistribution();
    TestDealFamilyKey();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Shamir tests passed" << '\n';
  return 0;
}
