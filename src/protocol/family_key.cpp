#include "guardsig/protocol/family_key.hpp"

#include <set>
#include <stdexcept>

#include "guardsig/crypto/random.hpp"

namespace guardsig {

void SecureZeroize(DealtFamilyKey* dealt) noexcept {
  if (dealt == nullptr) {
    return;
  }
  for (auto& [guardian, share] : dealt->shares) {
    (void)guardian;
    SecureZeroize(&share);
  }
  dealt->shares.clear();
}

Zeroizing<DealtFamilyKey> DealFamilyKey(const Scalar& secret,
                                        const std::string& family_id,
                                        const std::vector<GuardianId>& guardian_ids,
                                        uint32_t threshold) {
  if (family_id.empty()) {
    throw std::invalid_argument("family_id must not be empty");
  }
  const std::set<GuardianId> unique(guardian_ids.begin(), guardian_ids.end());
  if (unique.size() != guardian_ids.size()) {
    throw std::invalid_argument("guardian ids must be unique");
  }
  for (const GuardianId& id : guardian_ids) {
    if (id.empty()) {
      throw std::invalid_argument("guardian id must not be empty");
    }
  }

  const std::string secret_id = Csprng::RandomId();
  ShareSet shares = SplitSecret(secret, threshold, static_cast<uint32_t>(guardian_ids.size()), secret_id);

  Zeroizing<DealtFamilyKey> dealt;
  dealt->key.family_id = family_id;
  dealt->key.secret_id = secret_id;
  dealt->key.group_public_key = ECPoint::GeneratorMultiply(secret);
  dealt->key.threshold = threshold;
  for (size_t i = 0; i < guardian_ids.size(); ++i) {
    Share& share = shares.get()[i];
    dealt->key.guardians.emplace(guardian_ids[i], GuardianKeyInfo{
        .share_index = share.index,
        .verification_share = ECPoint::GeneratorMultiply(share.value),
    });
    dealt->shares.emplace(guardian_ids[i], share);
  }
  return dealt;
}

}  // namespace guardsig
