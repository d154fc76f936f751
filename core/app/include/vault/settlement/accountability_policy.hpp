#pragma once

#include "vault/ledger/share_ledger.hpp"

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// AccountabilityPolicy: manager skin-in-the-game gate
// -----------------------------------------------------------------------------
//
// @brief  Decides whether the manager holds enough of the vault to exercise
//         privileged rights and to participate in fee settlement.
//
// @details
//   accountable  <=>  managerShares * 10'000 / totalSupply >= min_owner_bps
//
// Evaluated without the floor division (managerShares * 10'000 >=
// min_owner_bps * totalSupply), which is equivalent for an integer bound.
// Vacuously true while total supply is zero.
//
// The default of 500 bps (5 %) matches the bucket contracts this engine
// models.
// -----------------------------------------------------------------------------
class AccountabilityPolicy {
 public:
  static constexpr std::uint32_t kDefaultMinOwnerBps = 500;

  // Throws VaultError(InvalidParameter) when min_owner_bps > 10'000.
  explicit AccountabilityPolicy(
      std::uint32_t min_owner_bps = kDefaultMinOwnerBps);

  bool isAccountable(const ShareLedger& ledger,
                     const domain::AccountId& manager) const;

  std::uint32_t minOwnerBps() const { return min_owner_bps_; }

 private:
  std::uint32_t min_owner_bps_;
};

}  // namespace vault
