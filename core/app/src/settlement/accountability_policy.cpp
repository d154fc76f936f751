#include "vault/settlement/accountability_policy.hpp"
#include "vault/errors/vault_error.hpp"

namespace vault {

AccountabilityPolicy::AccountabilityPolicy(std::uint32_t min_owner_bps)
    : min_owner_bps_(min_owner_bps) {
  if (min_owner_bps_ > domain::kBpsDenominator) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "minimum owner stake above 10000 bps");
  }
}

bool AccountabilityPolicy::isAccountable(
    const ShareLedger& ledger, const domain::AccountId& manager) const {
  const domain::Uint256& supply = ledger.totalSupply();
  if (supply == 0) {
    return true;
  }
  return ledger.balanceOf(manager) * domain::kBpsDenominator >=
         supply * min_owner_bps_;
}

}  // namespace vault
