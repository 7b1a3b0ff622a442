#include "guardsig/crypto/shamir.hpp"

#include <charconv>
#include <stdexcept>
#include <unordered_set>

#include "guardsig/crypto/random.hpp"

namespace guardsig {
namespace {

constexpr char kShareFieldSeparator = ':';
constexpr size_t kShareFieldCount = 5;
constexpr size_t kShareValueHexLen = 64;

std::vector<std::string_view> SplitFields(std::string_view encoded) {
  std::vector<std::string_view> fields;
  size_t start = 0;
  while (true) {
    const size_t pos = encoded.find(kShareFieldSeparator, start);
    if (pos == std::string_view::npos) {
      fields.push_back(encoded.substr(start));
      break;
    }
    fields.push_back(encoded.substr(start, pos - start));
    start = pos + 1;
  }
  return fields;
}

uint32_t ParseDecimalField(std::string_view field, const char* field_name) {
  if (field.empty()) {
    throw std::invalid_argument(std::string(field_name) + " must not be empty");
  }
  for (char c : field) {
    if (c < '0' || c > '9') {
      throw std::invalid_argument(std::string(field_name) + " must be numeric");
    }
  }

  uint32_t value = 0;
  const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
  if (ec != std::errc() || ptr != field.data() + field.size()) {
    throw std::invalid_argument(std::string(field_name) + " is out of range");
  }
  return value;
}

}  // namespace

void SecureZeroize(Share* share) noexcept {
  if (share == nullptr) {
    return;
  }
  SecureZeroize(&share->value);
  share->index = 0;
}

void SecureZeroize(std::vector<Share>* shares) noexcept {
  if (shares == nullptr) {
    return;
  }
  for (Share& share : *shares) {
    SecureZeroize(&share);
  }
  shares->clear();
}

ShareSet SplitSecret(const Scalar& secret,
                     uint32_t threshold,
                     uint32_t total_shares,
                     const std::string& secret_id) {
  if (threshold < kMinShareThreshold) {
    throw std::invalid_argument("threshold must be at least 2");
  }
  if (total_shares < threshold) {
    throw std::invalid_argument("total shares must be >= threshold");
  }
  if (total_shares > kMaxShares) {
    throw std::invalid_argument("total shares must not exceed 255");
  }
  if (secret.IsZero()) {
    throw std::invalid_argument("secret must be non-zero");
  }
  if (secret_id.empty() || secret_id.find(kShareFieldSeparator) != std::string::npos) {
    throw std::invalid_argument("secret_id must be non-empty and must not contain ':'");
  }

  Zeroizing<std::vector<Scalar>> coefficients;
  coefficients->reserve(threshold);
  coefficients->push_back(secret);
  for (uint32_t i = 1; i < threshold; ++i) {
    coefficients->push_back(Csprng::RandomNonZeroScalar());
  }

  ShareSet shares;
  shares->reserve(total_shares);
  for (uint32_t x = 1; x <= total_shares; ++x) {
    shares->push_back(Share{
        .index = x,
        .value = EvaluatePolynomialAt(coefficients.get(), x),
        .secret_id = secret_id,
        .threshold = threshold,
        .total_shares = total_shares,
    });
  }
  return shares;
}

Zeroizing<Scalar> ReconstructSecret(const std::vector<Share>& shares) {
  if (shares.size() < 2) {
    throw std::invalid_argument("at least 2 shares are required for reconstruction");
  }

  const Share& first = shares.front();
  std::vector<uint32_t> indices;
  indices.reserve(shares.size());
  std::unordered_set<uint32_t> seen;
  for (const Share& share : shares) {
    std::string error;
    if (!ValidateShare(share, &error)) {
      throw std::invalid_argument("invalid share: " + error);
    }
    if (share.secret_id != first.secret_id) {
      throw std::invalid_argument("shares belong to different secrets");
    }
    if (share.threshold != first.threshold || share.total_shares != first.total_shares) {
      throw std::invalid_argument("shares have inconsistent thresholds");
    }
    if (!seen.insert(share.index).second) {
      throw std::invalid_argument("duplicate share index");
    }
    indices.push_back(share.index);
  }

  if (shares.size() < first.threshold) {
    throw std::invalid_argument("insufficient shares: need " + std::to_string(first.threshold) +
                                ", got " + std::to_string(shares.size()));
  }

  const std::unordered_map<uint32_t, Scalar> lambdas = ComputeLagrangeAtZero(indices);
  Zeroizing<Scalar> secret;
  for (const Share& share : shares) {
    Scalar term = lambdas.at(share.index) * share.value;
    secret.get() = secret.get() + term;
    SecureZeroize(&term);
  }
  return secret;
}

bool ValidateShare(const Share& share, std::string* error) {
  auto fail = [error](const char* reason) {
    if (error != nullptr) {
      *error = reason;
    }
    return false;
  };

  if (share.index == 0) {
    return fail("share index must be >= 1");
  }
  if (share.secret_id.empty()) {
    return fail("share secret_id must not be empty");
  }
  if (share.secret_id.find(kShareFieldSeparator) != std::string::npos) {
    return fail("share secret_id must not contain ':'");
  }
  if (share.threshold < kMinShareThreshold) {
    return fail("share threshold must be at least 2");
  }
  if (share.total_shares < share.threshold || share.total_shares > kMaxShares) {
    return fail("share total must be between threshold and 255");
  }
  if (share.index > share.total_shares) {
    return fail("share index exceeds total shares");
  }
  if (share.value.value() < 0 || share.value.value() >= Scalar::ModulusQ()) {
    return fail("share value is outside the field");
  }
  return true;
}

std::string EncodeShare(const Share& share) {
  std::string out = share.secret_id;
  out.push_back(kShareFieldSeparator);
  out += std::to_string(share.index);
  out.push_back(kShareFieldSeparator);
  out += std::to_string(share.threshold);
  out.push_back(kShareFieldSeparator);
  out += std::to_string(share.total_shares);
  out.push_back(kShareFieldSeparator);
  std::string value_hex = share.value.ToCanonicalHex();
  out += value_hex;
  SecureZeroize(&value_hex);
  return out;
}

Share DecodeShare(std::string_view encoded) {
  const std::vector<std::string_view> fields = SplitFields(encoded);
  if (fields.size() != kShareFieldCount) {
    throw std::invalid_argument("share must have 5 ':'-separated fields");
  }
  if (fields[4].size() != kShareValueHexLen) {
    throw std::invalid_argument("share value must be 64 hex characters");
  }

  Share share;
  share.secret_id = std::string(fields[0]);
  share.index = ParseDecimalField(fields[1], "share index");
  share.threshold = ParseDecimalField(fields[2], "share threshold");
  share.total_shares = ParseDecimalField(fields[3], "share total");
  share.value = Scalar::FromCanonicalHex(fields[4]);

  std::string error;
  if (!ValidateShare(share, &error)) {
    SecureZeroize(&share);
    throw std::invalid_argument(error);
  }
  return share;
}

Scalar EvaluatePolynomialAt(const std::vector<Scalar>& coefficients, uint32_t x) {
  if (coefficients.empty()) {
    throw std::invalid_argument("Polynomial coefficients must not be empty");
  }
  if (x == 0) {
    throw std::invalid_argument("evaluation point must be non-zero");
  }

  // Horner's rule, highest degree first.
  const Scalar point = Scalar::FromUint64(x);
  Scalar acc;
  for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
    acc = acc * point + *it;
  }
  return acc;
}

std::unordered_map<uint32_t, Scalar> ComputeLagrangeAtZero(const std::vector<uint32_t>& indices) {
  std::unordered_map<uint32_t, Scalar> out;
  out.reserve(indices.size());

  for (uint32_t i : indices) {
    if (i == 0) {
      throw std::invalid_argument("lagrange index must be non-zero");
    }

    Scalar numerator = Scalar::FromUint64(1);
    Scalar denominator = Scalar::FromUint64(1);
    for (uint32_t j : indices) {
      if (j == i) {
        continue;
      }
      const Scalar xj = Scalar::FromUint64(j);
      const Scalar diff = xj - Scalar::FromUint64(i);
      if (diff.IsZero()) {
        throw std::invalid_argument("duplicate index in lagrange coefficient set");
      }
      numerator = numerator * xj;
      denominator = denominator * diff;
    }

    out.emplace(i, numerator * denominator.Inverse());
  }

  return out;
}

ShareDistribution RecommendShareDistribution(size_t family_size) {
  if (family_size <= 3) {
    return ShareDistribution{
        .threshold = 2,
        .total_shares = 3,
        .distribution = "2-of-3",
        .description = "Any 2 of 3 guardians can reconstruct the key. Tolerates one unavailable guardian.",
    };
  }
  if (family_size == 4) {
    return ShareDistribution{
        .threshold = 3,
        .total_shares = 4,
        .distribution = "3-of-4",
        .description = "Majority (3 of 4) required. Balances security and availability.",
    };
  }
  if (family_size == 5) {
    return ShareDistribution{
        .threshold = 3,
        .total_shares = 5,
        .distribution = "3-of-5",
        .description = "Majority (3 of 5) required. Two guardians may be unavailable.",
    };
  }
  if (family_size <= 7) {
    return ShareDistribution{
        .threshold = 4,
        .total_shares = 7,
        .distribution = "4-of-7",
        .description = "Super-majority (4 of 7) required for larger families.",
    };
  }
  return ShareDistribution{
      .threshold = 5,
      .total_shares = 7,
      .distribution = "5-of-7",
      .description = "High-security threshold for very large families.",
  };
}

}  // namespace guardsig
