#pragma once

#include "vault/domain/asset.hpp"

#include <cstddef>
#include <map>

namespace vault {

// -----------------------------------------------------------------------------
// ShareLedger: per-holder share balances and total supply
// -----------------------------------------------------------------------------
//
// @brief  Records who owns how many vault shares (18 decimals).
//
// @details
// Invariant: totalSupply() == Σ balanceOf(h) over all holders, after every
// operation. Holders whose balance returns to zero are removed so that
// balances() lists only live positions.
//
// Only VaultEngine (and FeeSettlement on its behalf) mints and burns.
// Shares are not transferable between holders.
//
// Thread model:
//   Not internally synchronized. Owned and guarded by VaultEngine.
//
// Value semantics:
//   Copyable. The engine's rollback checkpoint is a plain copy.
// -----------------------------------------------------------------------------
class ShareLedger {
 public:
  ShareLedger() = default;

  // Rebuilds a ledger from persisted balances. Zero entries are dropped;
  // supply is recomputed as their sum.
  static ShareLedger fromBalances(
      const std::map<domain::AccountId, domain::Uint256>& balances);

  domain::Uint256 balanceOf(const domain::AccountId& holder) const;
  const domain::Uint256& totalSupply() const { return total_supply_; }

  const std::map<domain::AccountId, domain::Uint256>& balances() const {
    return balances_;
  }
  std::size_t holderCount() const { return balances_.size(); }

  // Credits `amount` shares to `holder`. Zero is a no-op.
  void mint(const domain::AccountId& holder, const domain::Uint256& amount);

  // -------------------------------------------------------------------------
  // burn(holder, amount)
  // -------------------------------------------------------------------------
  // @brief  Debits `amount` shares from `holder`.
  //
  // @throws VaultError(InsufficientBalance) when the holder owns fewer than
  //         `amount` shares. The ledger is unchanged in that case.
  // -------------------------------------------------------------------------
  void burn(const domain::AccountId& holder, const domain::Uint256& amount);

 private:
  std::map<domain::AccountId, domain::Uint256> balances_;
  domain::Uint256 total_supply_{0};
};

}  // namespace vault
