#pragma once

#include "vault/custody/i_asset_custody.hpp"

#include <map>
#include <mutex>
#include <utility>

namespace vault {

// -----------------------------------------------------------------------------
// InMemoryCustody: wallet book for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Tracks external account balances per (account, asset). The vault
//         side of every transfer is the engine's own holdings book, so only
//         the external wallets live here.
//
// @details
// collect() fails with InsufficientBalance when the wallet is short.
// release() always succeeds (it only credits the recipient).
//
// Both operations are virtual so test doubles can inject failures or
// reentrant callbacks.
//
// Thread model:
//   mutex_ guards the wallet map. Safe to call from any thread.
// -----------------------------------------------------------------------------
class InMemoryCustody : public IAssetCustody {
 public:
  InMemoryCustody() = default;

  InMemoryCustody(const InMemoryCustody&) = delete;
  InMemoryCustody& operator=(const InMemoryCustody&) = delete;

  // Mints `amount` of `asset` into `account`'s wallet (faucet).
  void credit(const domain::AccountId& account, const domain::AssetId& asset,
              const domain::Uint256& amount);

  domain::Uint256 balanceOf(const domain::AccountId& account,
                            const domain::AssetId& asset) const;

  void collect(const domain::AccountId& from, const domain::AssetId& asset,
               const domain::Uint256& amount) override;

  void release(const domain::AccountId& to, const domain::AssetId& asset,
               const domain::Uint256& amount) override;

 private:
  using WalletKey = std::pair<domain::AccountId, domain::AssetId>;

  mutable std::mutex mutex_;
  std::map<WalletKey, domain::Uint256> wallets_;
};

}  // namespace vault
