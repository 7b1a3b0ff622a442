#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "guardsig/crypto/ec_point.hpp"
#include "guardsig/crypto/scalar.hpp"
#include "guardsig/crypto/schnorr.hpp"

namespace guardsig {

// A signer's round-1 public commitment: the hiding point D = d*G and the
// binding point E = e*G. Encoded as D || E, both compressed, in hex.
struct NonceCommitmentPair {
  ECPoint hiding;
  ECPoint binding;

  std::string ToHex() const;
};

// One round-1 participant as seen by the scheme.
struct SignerCommitment {
  std::string participant_id;
  uint32_t share_index = 0;
  ECPoint verification_share;
  NonceCommitmentPair nonce_commitment;
};

// Everything a signer needs to compute its partial signature.
//
// Each signer's effective nonce is R_i = D_i + rho_i * E_i, where the
// binding factor rho_i hashes the group key, the message and the full
// commitment list. Changing any one commitment changes every rho_i.
struct SigningPackage {
  std::array<uint8_t, 32> message_digest{};
  ECPoint group_public_key;
  std::vector<SignerCommitment> signers;
  std::unordered_map<uint32_t, Scalar> binding_factors;
  std::unordered_map<uint32_t, ECPoint> signer_nonces;
  ECPoint aggregate_nonce;
  bool negate_nonces = false;
  bool negate_key = false;
  Scalar challenge;
  std::unordered_map<uint32_t, Scalar> lagrange_coefficients;
};

// A guardian's secret round-1 nonce pair and its public commitment.
struct SigningNonce {
  Scalar hiding;
  Scalar binding;
  NonceCommitmentPair commitment;

  static SigningNonce Generate();
};

void SecureZeroize(SigningNonce* nonce) noexcept;

class IThresholdScheme {
 public:
  virtual ~IThresholdScheme() = default;

  // Throws std::invalid_argument for malformed commitments.
  virtual NonceCommitmentPair ParseCommitment(std::string_view encoded) const = 0;

  virtual SigningPackage BuildSigningPackage(const ECPoint& group_public_key,
                                             std::span<const uint8_t> message_digest,
                                             std::vector<SignerCommitment> signers) const = 0;

  virtual Scalar SignPartial(const SigningPackage& package,
                             uint32_t share_index,
                             const Scalar& share,
                             const SigningNonce& nonce) const = 0;

  virtual bool VerifyPartial(const SigningPackage& package,
                             uint32_t share_index,
                             const Scalar& partial) const = 0;

  // Throws std::runtime_error when a signer's partial is missing or the
  // combined signature does not verify.
  virtual SchnorrSignature Aggregate(const SigningPackage& package,
                                     const std::unordered_map<uint32_t, Scalar>& partials) const = 0;

  virtual bool VerifySignature(const ECPoint& group_public_key,
                               std::span<const uint8_t> message_digest,
                               std::span<const uint8_t> signature) const = 0;
};

// Two-nonce (FROST-style) threshold Schnorr over secp256k1. Aggregated
// signatures are ordinary BIP-340 signatures for the x-only group key.
class SchnorrThresholdScheme : public IThresholdScheme {
 public:
  NonceCommitmentPair ParseCommitment(std::string_view encoded) const override;

  SigningPackage BuildSigningPackage(const ECPoint& group_public_key,
                                     std::span<const uint8_t> message_digest,
                                     std::vector<SignerCommitment> signers) const override;

  Scalar SignPartial(const SigningPackage& package,
                     uint32_t share_index,
                     const Scalar& share,
                     const SigningNonce& nonce) const override;

  bool VerifyPartial(const SigningPackage& package,
                     uint32_t share_index,
                     const Scalar& partial) const override;

  SchnorrSignature Aggregate(const SigningPackage& package,
                             const std::unordered_map<uint32_t, Scalar>& partials) const override;

  bool VerifySignature(const ECPoint& group_public_key,
                       std::span<const uint8_t> message_digest,
                       std::span<const uint8_t> signature) const override;
};

}  // namespace guardsig
