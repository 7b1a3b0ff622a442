#include "guardsig/crypto/schnorr.hpp"

#include <stdexcept>

extern "C" {
#include <secp256k1_extrakeys.h>
#include <secp256k1_schnorrsig.h>
}

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/random.hpp"
#include "secp_context.hpp"

namespace guardsig {
namespace {

secp256k1_keypair CreateKeypair(const Scalar& secret_key) {
  std::array<uint8_t, 32> seckey = secret_key.ToCanonicalBytes();
  secp256k1_keypair keypair;
  const int ok = secp256k1_keypair_create(GetSecpContext(), &keypair, seckey.data());
  SecureZeroizeMemory(seckey.data(), seckey.size());
  if (ok != 1) {
    throw std::invalid_argument("secret key must be in [1, q-1]");
  }
  return keypair;
}

}  // namespace

XOnlyPublicKey DeriveXOnlyPublicKey(const Scalar& secret_key) {
  secp256k1_keypair keypair = CreateKeypair(secret_key);
  secp256k1_xonly_pubkey xonly;
  const int ok = secp256k1_keypair_xonly_pub(GetSecpContext(), &xonly, nullptr, &keypair);
  SecureZeroizeMemory(&keypair, sizeof(keypair));
  if (ok != 1) {
    throw std::runtime_error("Failed to derive x-only public key");
  }

  XOnlyPublicKey out{};
  if (secp256k1_xonly_pubkey_serialize(GetSecpContext(), out.data(), &xonly) != 1) {
    throw std::runtime_error("Failed to serialize x-only public key");
  }
  return out;
}

SchnorrSignature SchnorrSign(const Scalar& secret_key, std::span<const uint8_t> digest) {
  if (digest.size() != 32) {
    throw std::invalid_argument("Schnorr digest must be 32 bytes");
  }

  secp256k1_keypair keypair = CreateKeypair(secret_key);
  Bytes aux_rand = Csprng::RandomBytes(32);

  SchnorrSignature sig{};
  const int ok = secp256k1_schnorrsig_sign32(
      GetSecpContext(), sig.data(), digest.data(), &keypair, aux_rand.data());
  SecureZeroizeMemory(&keypair, sizeof(keypair));
  SecureZeroize(&aux_rand);
  if (ok != 1) {
    throw std::runtime_error("Schnorr signing failed");
  }
  return sig;
}

bool SchnorrVerify(std::span<const uint8_t> signature,
                   std::span<const uint8_t> digest,
                   std::span<const uint8_t> xonly_public_key) {
  if (signature.size() != 64 || digest.size() != 32 || xonly_public_key.size() != 32) {
    return false;
  }

  secp256k1_xonly_pubkey xonly;
  if (secp256k1_xonly_pubkey_parse(GetSecpContext(), &xonly, xonly_public_key.data()) != 1) {
    return false;
  }
  return secp256k1_schnorrsig_verify(
             GetSecpContext(), signature.data(), digest.data(), digest.size(), &xonly) == 1;
}

}  // namespace guardsig
