#pragma once

#include "vault/domain/asset.hpp"

namespace vault {

// -----------------------------------------------------------------------------
// IAssetCustody: moves assets between external accounts and the vault
// -----------------------------------------------------------------------------
//
// @brief  Abstracts the token transfer layer. The engine never touches
//         external balances directly; it asks custody to pull deposits in
//         and push payouts out.
//
// @details
// Both operations either complete fully or throw. A throwing collect()
// aborts the deposit before any engine state changes. A throwing release()
// rolls the whole redeem (or sweep) back.
//
// Implementations may call back into the engine (a token hook, for
// example). Such callbacks may read views but any mutating call is rejected
// with ReentrantCall.
//
// Ownership:
//   VaultEngine holds a non-owning reference. The custody must outlive the
//   engine.
// -----------------------------------------------------------------------------
class IAssetCustody {
 public:
  virtual ~IAssetCustody() = default;

  // Pulls `amount` of `asset` from `from` into the vault.
  virtual void collect(const domain::AccountId& from,
                       const domain::AssetId& asset,
                       const domain::Uint256& amount) = 0;

  // Pushes `amount` of `asset` from the vault to `to`.
  virtual void release(const domain::AccountId& to,
                       const domain::AssetId& asset,
                       const domain::Uint256& amount) = 0;
};

}  // namespace vault
