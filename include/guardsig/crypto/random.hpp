#pragma once

#include <cstddef>
#include <string>

#include "guardsig/common/bytes.hpp"
#include "guardsig/crypto/scalar.hpp"

namespace guardsig {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  static Scalar RandomScalar();
  static Scalar RandomNonZeroScalar();

  // Hex identifier built from `byte_len` random bytes.
  static std::string RandomId(size_t byte_len = 16);
};

}  // namespace guardsig
