#include "guardsig/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/encoding.hpp"

namespace guardsig {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomScalar() {
  while (true) {
    Bytes bytes = RandomBytes(32);
    try {
      Scalar out = Scalar::FromCanonicalBytes(bytes);
      SecureZeroize(&bytes);
      return out;
    } catch (const std::invalid_argument&) {
      SecureZeroize(&bytes);
      continue;
    }
  }
}

Scalar Csprng::RandomNonZeroScalar() {
  while (true) {
    Scalar candidate = RandomScalar();
    if (!candidate.IsZero()) {
      return candidate;
    }
  }
}

std::string Csprng::RandomId(size_t byte_len) {
  if (byte_len == 0) {
    throw std::invalid_argument("identifier length must be positive");
  }
  return HexEncode(RandomBytes(byte_len));
}

}  // namespace guardsig
