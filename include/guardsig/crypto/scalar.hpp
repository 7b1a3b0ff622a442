#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <gmpxx.h>

namespace guardsig {

// Element of the field of integers modulo the secp256k1 group order q.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalHex(std::string_view hex);

  std::array<uint8_t, 32> ToCanonicalBytes() const;
  std::string ToCanonicalHex() const;

  const mpz_class& value() const;
  bool IsZero() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar operator-() const;

  // Multiplicative inverse via the extended Euclidean algorithm.
  // Throws std::invalid_argument for zero.
  Scalar Inverse() const;

  // Overwrites the limbs holding the value, then resets to zero.
  void Zeroize() noexcept;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

  static const mpz_class& ModulusQ();

 private:
  mpz_class value_;
};

}  // namespace guardsig
