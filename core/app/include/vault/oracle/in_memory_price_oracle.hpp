#pragma once

#include "vault/oracle/i_price_oracle.hpp"

#include <cstdint>
#include <map>
#include <shared_mutex>
#include <vector>

namespace vault {

// -----------------------------------------------------------------------------
// InMemoryPriceOracle: mutable reference oracle for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Keeps the registry and price table in memory. Prices, acceptance,
//         the halt switch and the fee rate can all be changed at runtime.
//
// @details
// The performance fee is a flat basis-point rate on the gain:
//   fee = floor(gain * performance_fee_bps / 10'000)
//
// Thread model:
//   All accessors take a shared_lock; all setters take a unique_lock on
//   mutex_. Safe to drive prices from one thread while engines read them
//   from others.
// -----------------------------------------------------------------------------
class InMemoryPriceOracle final : public IPriceOracle {
 public:
  InMemoryPriceOracle() = default;

  InMemoryPriceOracle(const InMemoryPriceOracle&) = delete;
  InMemoryPriceOracle& operator=(const InMemoryPriceOracle&) = delete;

  // -------------------------------------------------------------------------
  // setAsset(asset, decimals, price, accepted)
  // -------------------------------------------------------------------------
  // @brief  Registers an asset or overwrites an existing registration.
  //
  // @details
  // A newly registered asset is appended to the registration order that
  // acceptedAssets() reports. Re-registering keeps its original position.
  // -------------------------------------------------------------------------
  void setAsset(const domain::AssetId& asset, unsigned decimals,
                const domain::Uint256& price, bool accepted = true);

  // Updates the price of a registered asset. Throws InvalidAsset otherwise.
  void setPrice(const domain::AssetId& asset, const domain::Uint256& price);

  // Marks a registered asset as not accepted (or accepted again).
  void setAccepted(const domain::AssetId& asset, bool accepted);

  void setOperational(bool operational);

  // Throws InvalidParameter when bps > 10'000.
  void setPerformanceFeeBps(std::uint32_t bps);

  bool isPlatformOperational() const override;
  bool isAssetAccepted(const domain::AssetId& asset) const override;
  domain::Uint256 getPrice(const domain::AssetId& asset) const override;
  unsigned decimals(const domain::AssetId& asset) const override;
  std::vector<domain::AssetId> acceptedAssets() const override;
  domain::Uint256 computeFee(const domain::Uint256& gain) const override;

 private:
  struct Entry {
    unsigned decimals{0};
    domain::Uint256 price{0};
    bool accepted{false};
  };

  // Requires mutex_ held (shared or unique).
  const Entry& entryFor(const domain::AssetId& asset) const;

  mutable std::shared_mutex mutex_;
  std::map<domain::AssetId, Entry> entries_;
  std::vector<domain::AssetId> order_;
  bool operational_{true};
  std::uint32_t performance_fee_bps_{0};
};

}  // namespace vault
