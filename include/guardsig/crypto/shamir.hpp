#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/scalar.hpp"

namespace guardsig {

constexpr uint32_t kMinShareThreshold = 2;
constexpr uint32_t kMaxShares = 255;

// One guardian's point on the sharing polynomial. `threshold` and
// `total_shares` travel with the share so a reconstruction can tell when it
// holds too few.
struct Share {
  uint32_t index = 0;
  Scalar value;
  std::string secret_id;
  uint32_t threshold = 0;
  uint32_t total_shares = 0;
};

void SecureZeroize(Share* share) noexcept;
void SecureZeroize(std::vector<Share>* shares) noexcept;

using ShareSet = Zeroizing<std::vector<Share>>;

// Splits `secret` into `total_shares` shares over the secp256k1 scalar
// field; any `threshold` of them reconstruct it.
ShareSet SplitSecret(const Scalar& secret,
                     uint32_t threshold,
                     uint32_t total_shares,
                     const std::string& secret_id);

// Lagrange interpolation at x = 0. Throws std::invalid_argument for fewer
// than two shares, fewer than the recorded threshold, mixed secrets or
// duplicate indices.
Zeroizing<Scalar> ReconstructSecret(const std::vector<Share>& shares);

bool ValidateShare(const Share& share, std::string* error);

// "<secret_id>:<index>:<threshold>:<total>:<64 hex>"
std::string EncodeShare(const Share& share);
Share DecodeShare(std::string_view encoded);

Scalar EvaluatePolynomialAt(const std::vector<Scalar>& coefficients, uint32_t x);

std::unordered_map<uint32_t, Scalar> ComputeLagrangeAtZero(const std::vector<uint32_t>& indices);

struct ShareDistribution {
  uint32_t threshold = 0;
  uint32_t total_shares = 0;
  std::string distribution;
  std::string description;
};

ShareDistribution RecommendShareDistribution(size_t family_size);

}  // namespace guardsig
