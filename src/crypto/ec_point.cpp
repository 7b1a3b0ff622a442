#include "guardsig/crypto/ec_point.hpp"

#include <algorithm>
#include <array>
#include <stdexcept>

#include "guardsig/crypto/encoding.hpp"
#include "secp_context.hpp"

namespace guardsig {
namespace {

secp256k1_pubkey ParsePubkey(const std::array<uint8_t, 33>& compressed) {
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(GetSecpContext(), &pubkey, compressed.data(), compressed.size()) != 1) {
    throw std::invalid_argument("Compressed point is not a valid secp256k1 point");
  }
  return pubkey;
}

std::array<uint8_t, 33> SerializeCompressed(const secp256k1_pubkey& pubkey) {
  std::array<uint8_t, 33> out{};
  size_t out_len = out.size();
  if (secp256k1_ec_pubkey_serialize(
          GetSecpContext(), out.data(), &out_len, &pubkey, SECP256K1_EC_COMPRESSED) != 1 ||
      out_len != out.size()) {
    throw std::runtime_error("Failed to serialize secp256k1 point");
  }
  return out;
}

}  // namespace

ECPoint::ECPoint() {
  compressed_.fill(0);
  compressed_[0] = 0x02;
}

ECPoint ECPoint::FromCompressed(std::span<const uint8_t> compressed_bytes) {
  if (compressed_bytes.size() != 33) {
    throw std::invalid_argument("Compressed point must be 33 bytes");
  }

  std::array<uint8_t, 33> compressed{};
  std::copy(compressed_bytes.begin(), compressed_bytes.end(), compressed.begin());
  (void)ParsePubkey(compressed);

  ECPoint out;
  out.compressed_ = compressed;
  return out;
}

ECPoint ECPoint::FromCompressedHex(std::string_view hex) {
  return FromCompressed(HexDecode(hex));
}

ECPoint ECPoint::GeneratorMultiply(const Scalar& scalar) {
  std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  secp256k1_pubkey pubkey;
  const int ok = secp256k1_ec_pubkey_create(GetSecpContext(), &pubkey, scalar_bytes.data());
  std::fill(scalar_bytes.begin(), scalar_bytes.end(), 0);
  if (ok != 1) {
    throw std::invalid_argument("Generator multiplication failed: scalar must be in [1, q-1]");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Add(const ECPoint& other) const {
  secp256k1_pubkey lhs = ParsePubkey(compressed_);
  secp256k1_pubkey rhs = ParsePubkey(other.compressed_);

  const secp256k1_pubkey* inputs[2] = {&lhs, &rhs};
  secp256k1_pubkey combined;
  if (secp256k1_ec_pubkey_combine(GetSecpContext(), &combined, inputs, 2) != 1) {
    throw std::invalid_argument("Point addition failed (sum is point at infinity?)");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(combined);
  return out;
}

ECPoint ECPoint::Mul(const Scalar& scalar) const {
  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  const std::array<uint8_t, 32> scalar_bytes = scalar.ToCanonicalBytes();

  if (secp256k1_ec_pubkey_tweak_mul(GetSecpContext(), &pubkey, scalar_bytes.data()) != 1) {
    throw std::invalid_argument("Point scalar multiplication failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

ECPoint ECPoint::Negate() const {
  secp256k1_pubkey pubkey = ParsePubkey(compressed_);
  if (secp256k1_ec_pubkey_negate(GetSecpContext(), &pubkey) != 1) {
    throw std::runtime_error("Point negation failed");
  }

  ECPoint out;
  out.compressed_ = SerializeCompressed(pubkey);
  return out;
}

bool ECPoint::HasEvenY() const {
  return compressed_[0] == 0x02;
}

Bytes ECPoint::ToCompressedBytes() const {
  return Bytes(compressed_.begin(), compressed_.end());
}

std::string ECPoint::ToCompressedHex() const {
  return HexEncode(compressed_);
}

std::array<uint8_t, 32> ECPoint::XOnlyBytes() const {
  std::array<uint8_t, 32> out{};
  std::copy(compressed_.begin() + 1, compressed_.end(), out.begin());
  return out;
}

bool ECPoint::operator==(const ECPoint& other) const {
  return compressed_ == other.compressed_;
}

bool ECPoint::operator!=(const ECPoint& other) const {
  return !(*this == other);
}

}  // namespace guardsig
