#include "guardsig/crypto/hash.hpp"

#include <array>
#include <stdexcept>

#include <openssl/sha.h>

namespace guardsig {

Bytes Sha256(std::span<const uint8_t> data) {
  std::array<uint8_t, SHA256_DIGEST_LENGTH> digest{};
  if (SHA256(data.data(), data.size(), digest.data()) == nullptr) {
    throw std::runtime_error("SHA256 failed");
  }
  return Bytes(digest.begin(), digest.end());
}

Bytes TaggedHash(std::string_view tag, std::span<const uint8_t> data) {
  const Bytes tag_hash = Sha256(
      std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(tag.data()), tag.size()));

  Bytes preimage;
  preimage.reserve(tag_hash.size() * 2 + data.size());
  preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
  preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
  preimage.insert(preimage.end(), data.begin(), data.end());
  return Sha256(preimage);
}

}  // namespace guardsig
