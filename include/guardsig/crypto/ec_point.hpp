#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "guardsig/common/bytes.hpp"
#include "guardsig/crypto/scalar.hpp"

namespace guardsig {

class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint FromCompressedHex(std::string_view hex);
  static ECPoint GeneratorMultiply(const Scalar& scalar);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;
  ECPoint Negate() const;

  bool HasEvenY() const;

  Bytes ToCompressedBytes() const;
  std::string ToCompressedHex() const;
  std::array<uint8_t, 32> XOnlyBytes() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, 33> compressed_{};
};

}  // namespace guardsig
