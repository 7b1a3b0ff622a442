#pragma once

#include <cstdint>
#include <vector>

namespace guardsig {

using Bytes = std::vector<uint8_t>;

}  // namespace guardsig
