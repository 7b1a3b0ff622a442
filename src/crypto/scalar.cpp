#include "guardsig/crypto/scalar.hpp"

#include <algorithm>
#include <stdexcept>

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/encoding.hpp"

namespace guardsig {
namespace {

const mpz_class kSecp256k1Order(
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141");

mpz_class NormalizeToQ(const mpz_class& input) {
  mpz_class normalized = input % kSecp256k1Order;
  if (normalized < 0) {
    normalized += kSecp256k1Order;
  }
  return normalized;
}

mpz_class ImportBigEndian(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    throw std::invalid_argument("Big-endian input must not be empty");
  }

  mpz_class out;
  mpz_import(out.get_mpz_t(), bytes.size(), 1, sizeof(uint8_t), 1, 0, bytes.data());
  return out;
}

}  // namespace

Scalar::Scalar() : value_(0) {}

Scalar::Scalar(const mpz_class& value) : value_(NormalizeToQ(value)) {}

Scalar Scalar::FromUint64(uint64_t value) {
  return Scalar(mpz_class(value));
}

Scalar Scalar::FromBigEndianModQ(std::span<const uint8_t> bytes) {
  return Scalar(ImportBigEndian(bytes));
}

Scalar Scalar::FromCanonicalBytes(std::span<const uint8_t> bytes) {
  if (bytes.size() != 32) {
    throw std::invalid_argument("Canonical scalar must be exactly 32 bytes");
  }

  mpz_class imported = ImportBigEndian(bytes);
  if (imported >= kSecp256k1Order) {
    throw std::invalid_argument("Canonical scalar is out of range");
  }
  return Scalar(imported);
}

Scalar Scalar::FromCanonicalHex(std::string_view hex) {
  Bytes decoded = HexDecode(hex);
  try {
    Scalar out = FromCanonicalBytes(decoded);
    SecureZeroize(&decoded);
    return out;
  } catch (const std::invalid_argument&) {
    SecureZeroize(&decoded);
    throw;
  }
}

std::array<uint8_t, 32> Scalar::ToCanonicalBytes() const {
  std::array<uint8_t, 32> out{};

  if (value_ == 0) {
    return out;
  }

  size_t count = 0;
  mpz_export(out.data(), &count, 1, sizeof(uint8_t), 1, 0, value_.get_mpz_t());
  if (count > out.size()) {
    throw std::runtime_error("Scalar is larger than 32 bytes");
  }

  const size_t offset = out.size() - count;
  std::rotate(out.begin(), out.begin() + count, out.end());
  std::fill(out.begin(), out.begin() + offset, 0);
  return out;
}

std::string Scalar::ToCanonicalHex() const {
  std::array<uint8_t, 32> bytes = ToCanonicalBytes();
  std::string out = HexEncode(bytes);
  SecureZeroizeMemory(bytes.data(), bytes.size());
  return out;
}

const mpz_class& Scalar::value() const {
  return value_;
}

bool Scalar::IsZero() const {
  return value_ == 0;
}

Scalar Scalar::operator+(const Scalar& other) const {
  return Scalar(value_ + other.value_);
}

Scalar Scalar::operator-(const Scalar& other) const {
  return Scalar(value_ - other.value_);
}

Scalar Scalar::operator*(const Scalar& other) const {
  return Scalar(value_ * other.value_);
}

Scalar Scalar::operator-() const {
  return Scalar(-value_);
}

Scalar Scalar::Inverse() const {
  if (value_ == 0) {
    throw std::invalid_argument("zero has no multiplicative inverse");
  }

  // g = s*value + t*q; with q prime and value != 0, g == 1 and s is the inverse.
  mpz_class g;
  mpz_class s;
  mpz_class t;
  mpz_gcdext(g.get_mpz_t(), s.get_mpz_t(), t.get_mpz_t(), value_.get_mpz_t(),
             kSecp256k1Order.get_mpz_t());
  if (g != 1) {
    throw std::invalid_argument("value is not invertible modulo q");
  }
  return Scalar(s);
}

void Scalar::Zeroize() noexcept {
  mpz_ptr raw = value_.get_mpz_t();
  const size_t limbs = mpz_size(raw);
  if (limbs > 0) {
    mp_limb_t* data = mpz_limbs_modify(raw, static_cast<mp_size_t>(limbs));
    SecureZeroizeMemory(data, limbs * sizeof(mp_limb_t));
    mpz_limbs_finish(raw, 0);
  }
  value_ = 0;
}

bool Scalar::operator==(const Scalar& other) const {
  return value_ == other.value_;
}

bool Scalar::operator!=(const Scalar& other) const {
  return !(*this == other);
}

const mpz_class& Scalar::ModulusQ() {
  return kSecp256k1Order;
}

}  // namespace guardsig
