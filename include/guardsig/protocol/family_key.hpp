#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "guardsig/common/secure_zeroize.hpp"
#include "guardsig/crypto/shamir.hpp"
#include "guardsig/protocol/types.hpp"

namespace guardsig {

struct DealtFamilyKey {
  FamilyKey key;
  std::map<GuardianId, Share> shares;
};

void SecureZeroize(DealtFamilyKey* dealt) noexcept;

// Trusted-dealer split of a family private key. Guardians receive share
// indices 1..N in the order given.
Zeroizing<DealtFamilyKey> DealFamilyKey(const Scalar& secret,
                                        const std::string& family_id,
                                        const std::vector<GuardianId>& guardian_ids,
                                        uint32_t threshold);

}  // namespace guardsig
