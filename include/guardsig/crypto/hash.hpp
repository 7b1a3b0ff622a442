#pragma once

#include <span>
#include <string_view>

#include "guardsig/common/bytes.hpp"

namespace guardsig {

Bytes Sha256(std::span<const uint8_t> data);

// BIP-340 tagged hash: SHA256(SHA256(tag) || SHA256(tag) || data).
Bytes TaggedHash(std::string_view tag, std::span<const uint8_t> data);

}  // namespace guardsig
