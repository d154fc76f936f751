#pragma once

#include "vault/domain/asset.hpp"

#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// IPriceOracle: price feed, asset registry and platform policy
// -----------------------------------------------------------------------------
//
// @brief  The single source of truth the engine consults for whether the
//         platform is operational, which assets are accepted, their decimals
//         and unit prices, and the platform's performance-fee policy.
//
// @details
// Prices are 8-decimal USD per whole unit of the asset (10^decimals native
// units). A price of zero means "no usable price"; the engine rejects
// deposits of such an asset with InvalidAsset.
//
// getPrice() and decimals() are only meaningful for assets the registry
// knows about. Implementations throw VaultError(InvalidAsset) for unknown
// ids. Delisted assets (known but not accepted) still report decimals so
// residual holdings can be swept.
//
// Thread-safety contract:
//   Implementations MUST tolerate concurrent reads. The engine calls the
//   oracle while holding its call lock, and views may call it from any
//   thread.
//
// Ownership:
//   VaultEngine and FeeSettlement hold a const reference. The oracle must
//   outlive every engine that references it.
// -----------------------------------------------------------------------------
class IPriceOracle {
 public:
  virtual ~IPriceOracle() = default;

  // Global halt switch. When false every mutating engine call fails with
  // PlatformHalted.
  virtual bool isPlatformOperational() const = 0;

  virtual bool isAssetAccepted(const domain::AssetId& asset) const = 0;

  // 8-decimal USD price per whole unit.
  virtual domain::Uint256 getPrice(const domain::AssetId& asset) const = 0;

  virtual unsigned decimals(const domain::AssetId& asset) const = 0;

  // Every currently accepted asset, in registration order.
  virtual std::vector<domain::AssetId> acceptedAssets() const = 0;

  // -------------------------------------------------------------------------
  // computeFee(gain)
  // -------------------------------------------------------------------------
  // @brief  Platform performance fee owed on a rebalance gain.
  //
  // @param  gain  USD gain (8 decimals) of one rebalance.
  // @return USD fee (8 decimals). Must not exceed gain.
  // -------------------------------------------------------------------------
  virtual domain::Uint256 computeFee(const domain::Uint256& gain) const = 0;
};

}  // namespace vault
