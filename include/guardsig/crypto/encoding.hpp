#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "guardsig/common/bytes.hpp"

namespace guardsig {

// Lower-case hex without prefix.
std::string HexEncode(std::span<const uint8_t> bytes);

// Accepts upper or lower case; throws std::invalid_argument on odd length
// or non-hex characters.
Bytes HexDecode(std::string_view hex);

bool IsHex(std::string_view text);

}  // namespace guardsig
