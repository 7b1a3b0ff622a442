#include "guardsig/crypto/threshold_scheme.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/hash.hpp"
#include "guardsig/crypto/random.hpp"
#include "guardsig/crypto/shamir.hpp"

namespace guardsig {
namespace {

constexpr char kChallengeTag[] = "BIP0340/challenge";
constexpr char kBindingTag[] = "guardsig/binding";
constexpr size_t kCompressedPointHexLen = 66;

void AppendUint32(Bytes* out, uint32_t value) {
  out->push_back(static_cast<uint8_t>(value >> 24));
  out->push_back(static_cast<uint8_t>(value >> 16));
  out->push_back(static_cast<uint8_t>(value >> 8));
  out->push_back(static_cast<uint8_t>(value));
}

void AppendPoint(Bytes* out, const ECPoint& point) {
  const Bytes compressed = point.ToCompressedBytes();
  out->insert(out->end(), compressed.begin(), compressed.end());
}

// rho_i = H_binding(Y || msg || H(index_j || D_j || E_j for all j) || i),
// signers sorted by share index.
std::unordered_map<uint32_t, Scalar> ComputeBindingFactors(const ECPoint& group_public_key,
                                                           std::span<const uint8_t> message_digest,
                                                           const std::vector<SignerCommitment>& signers) {
  Bytes encoded_commitments;
  encoded_commitments.reserve(signers.size() * (4 + 33 + 33));
  for (const SignerCommitment& signer : signers) {
    AppendUint32(&encoded_commitments, signer.share_index);
    AppendPoint(&encoded_commitments, signer.nonce_commitment.hiding);
    AppendPoint(&encoded_commitments, signer.nonce_commitment.binding);
  }
  const Bytes commitments_hash = Sha256(encoded_commitments);

  Bytes prefix;
  prefix.reserve(33 + message_digest.size() + commitments_hash.size());
  AppendPoint(&prefix, group_public_key);
  prefix.insert(prefix.end(), message_digest.begin(), message_digest.end());
  prefix.insert(prefix.end(), commitments_hash.begin(), commitments_hash.end());

  std::unordered_map<uint32_t, Scalar> out;
  out.reserve(signers.size());
  for (const SignerCommitment& signer : signers) {
    Bytes preimage = prefix;
    AppendUint32(&preimage, signer.share_index);
    out.emplace(signer.share_index, Scalar::FromBigEndianModQ(TaggedHash(kBindingTag, preimage)));
  }
  return out;
}

const SignerCommitment& FindSigner(const SigningPackage& package, uint32_t share_index) {
  for (const SignerCommitment& signer : package.signers) {
    if (signer.share_index == share_index) {
      return signer;
    }
  }
  throw std::invalid_argument("share index is not part of the signing package");
}

Scalar ComputeChallenge(const ECPoint& aggregate_nonce,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> message_digest) {
  const std::array<uint8_t, 32> r_x = aggregate_nonce.XOnlyBytes();
  const std::array<uint8_t, 32> y_x = group_public_key.XOnlyBytes();

  Bytes preimage;
  preimage.reserve(r_x.size() + y_x.size() + message_digest.size());
  preimage.insert(preimage.end(), r_x.begin(), r_x.end());
  preimage.insert(preimage.end(), y_x.begin(), y_x.end());
  preimage.insert(preimage.end(), message_digest.begin(), message_digest.end());
  return Scalar::FromBigEndianModQ(TaggedHash(kChallengeTag, preimage));
}

}  // namespace

std::string NonceCommitmentPair::ToHex() const {
  return hiding.ToCompressedHex() + binding.ToCompressedHex();
}

SigningNonce SigningNonce::Generate() {
  SigningNonce nonce;
  nonce.hiding = Csprng::RandomNonZeroScalar();
  nonce.binding = Csprng::RandomNonZeroScalar();
  nonce.commitment.hiding = ECPoint::GeneratorMultiply(nonce.hiding);
  nonce.commitment.binding = ECPoint::GeneratorMultiply(nonce.binding);
  return nonce;
}

void SecureZeroize(SigningNonce* nonce) noexcept {
  if (nonce == nullptr) {
    return;
  }
  SecureZeroize(&nonce->hiding);
  SecureZeroize(&nonce->binding);
}

NonceCommitmentPair SchnorrThresholdScheme::ParseCommitment(std::string_view encoded) const {
  if (encoded.size() != 2 * kCompressedPointHexLen) {
    throw std::invalid_argument("commitment must be two 33-byte compressed points in hex");
  }
  NonceCommitmentPair pair{
      .hiding = ECPoint::FromCompressedHex(encoded.substr(0, kCompressedPointHexLen)),
      .binding = ECPoint::FromCompressedHex(encoded.substr(kCompressedPointHexLen)),
  };
  if (pair.hiding == pair.binding) {
    throw std::invalid_argument("hiding and binding commitments must differ");
  }
  return pair;
}

SigningPackage SchnorrThresholdScheme::BuildSigningPackage(const ECPoint& group_public_key,
                                                           std::span<const uint8_t> message_digest,
                                                           std::vector<SignerCommitment> signers) const {
  if (message_digest.size() != 32) {
    throw std::invalid_argument("message digest must be 32 bytes");
  }
  if (signers.empty()) {
    throw std::invalid_argument("signing package requires at least one signer");
  }

  std::sort(signers.begin(), signers.end(), [](const SignerCommitment& a, const SignerCommitment& b) {
    return a.share_index < b.share_index;
  });

  std::vector<uint32_t> indices;
  indices.reserve(signers.size());
  std::unordered_set<uint32_t> seen;
  for (const SignerCommitment& signer : signers) {
    if (!seen.insert(signer.share_index).second) {
      throw std::invalid_argument("duplicate signer share index");
    }
    indices.push_back(signer.share_index);
  }

  SigningPackage package;
  std::copy(message_digest.begin(), message_digest.end(), package.message_digest.begin());
  package.group_public_key = group_public_key;
  package.binding_factors = ComputeBindingFactors(group_public_key, message_digest, signers);
  for (const SignerCommitment& signer : signers) {
    const NonceCommitmentPair& pair = signer.nonce_commitment;
    const ECPoint r_i = pair.hiding.Add(pair.binding.Mul(package.binding_factors.at(signer.share_index)));
    package.signer_nonces.emplace(signer.share_index, r_i);
  }
  package.aggregate_nonce = package.signer_nonces.at(signers.front().share_index);
  for (size_t i = 1; i < signers.size(); ++i) {
    package.aggregate_nonce = package.aggregate_nonce.Add(package.signer_nonces.at(signers[i].share_index));
  }
  package.negate_nonces = !package.aggregate_nonce.HasEvenY();
  package.negate_key = !group_public_key.HasEvenY();
  package.challenge = ComputeChallenge(package.aggregate_nonce, group_public_key, message_digest);
  package.lagrange_coefficients = ComputeLagrangeAtZero(indices);
  package.signers = std::move(signers);
  return package;
}

Scalar SchnorrThresholdScheme::SignPartial(const SigningPackage& package,
                                           uint32_t share_index,
                                           const Scalar& share,
                                           const SigningNonce& nonce) const {
  const SignerCommitment& signer = FindSigner(package, share_index);
  if (signer.nonce_commitment.hiding != nonce.commitment.hiding ||
      signer.nonce_commitment.binding != nonce.commitment.binding) {
    throw std::invalid_argument("nonce does not match the signer's commitment");
  }
  const Scalar& lambda = package.lagrange_coefficients.at(share_index);
  const Scalar& rho = package.binding_factors.at(share_index);

  Scalar k = nonce.hiding + rho * nonce.binding;
  if (package.negate_nonces) {
    k = -k;
  }
  Scalar x = package.negate_key ? -share : share;
  Scalar partial = k + package.challenge * lambda * x;
  SecureZeroize(&k);
  SecureZeroize(&x);
  return partial;
}

bool SchnorrThresholdScheme::VerifyPartial(const SigningPackage& package,
                                           uint32_t share_index,
                                           const Scalar& partial) const {
  try {
    const SignerCommitment& signer = FindSigner(package, share_index);
    const Scalar& lambda = package.lagrange_coefficients.at(share_index);

    // z_i * G == R_i' + (e * lambda_i) * X_i', with R_i' and X_i' parity-adjusted.
    const ECPoint& r_i = package.signer_nonces.at(share_index);
    const ECPoint nonce_point = package.negate_nonces ? r_i.Negate() : r_i;
    const ECPoint key_point =
        package.negate_key ? signer.verification_share.Negate() : signer.verification_share;
    const ECPoint expected = nonce_point.Add(key_point.Mul(package.challenge * lambda));
    return ECPoint::GeneratorMultiply(partial) == expected;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

SchnorrSignature SchnorrThresholdScheme::Aggregate(
    const SigningPackage& package,
    const std::unordered_map<uint32_t, Scalar>& partials) const {
  Scalar z;
  for (const SignerCommitment& signer : package.signers) {
    const auto it = partials.find(signer.share_index);
    if (it == partials.end()) {
      throw std::runtime_error("missing partial signature for a signer");
    }
    z = z + it->second;
  }

  SchnorrSignature signature{};
  const std::array<uint8_t, 32> r_x = package.aggregate_nonce.XOnlyBytes();
  const std::array<uint8_t, 32> z_bytes = z.ToCanonicalBytes();
  std::copy(r_x.begin(), r_x.end(), signature.begin());
  std::copy(z_bytes.begin(), z_bytes.end(), signature.begin() + 32);

  if (!VerifySignature(package.group_public_key, package.message_digest, signature)) {
    throw std::runtime_error("aggregated signature failed verification");
  }
  return signature;
}

bool SchnorrThresholdScheme::VerifySignature(const ECPoint& group_public_key,
                                             std::span<const uint8_t> message_digest,
                                             std::span<const uint8_t> signature) const {
  const std::array<uint8_t, 32> xonly = group_public_key.XOnlyBytes();
  return SchnorrVerify(signature, message_digest, xonly);
}

}  // namespace guardsig
