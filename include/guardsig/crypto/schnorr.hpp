#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "guardsig/crypto/scalar.hpp"

namespace guardsig {

using SchnorrSignature = std::array<uint8_t, 64>;
using XOnlyPublicKey = std::array<uint8_t, 32>;

// BIP-340 over libsecp256k1. `digest` must be 32 bytes.
XOnlyPublicKey DeriveXOnlyPublicKey(const Scalar& secret_key);
SchnorrSignature SchnorrSign(const Scalar& secret_key, std::span<const uint8_t> digest);
bool SchnorrVerify(std::span<const uint8_t> signature,
                   std::span<const uint8_t> digest,
                   std::span<const uint8_t> xonly_public_key);

}  // namespace guardsig
