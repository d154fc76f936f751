#pragma once

#include "vault/domain/asset.hpp"

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// IVenueQuoter: price discovery on one trading venue
// -----------------------------------------------------------------------------
//
// @brief  Answers "how much `out` would `amount_in` of `in` buy right now?"
//
// @details
// Quoters are unreliable by assumption: they may throw for unsupported
// pairs, empty pools or transient failures. QuoteRouter treats a throwing
// quoter as "no quote" and carries on with the remaining venues.
//
// Not const: on-chain style quoters simulate the swap and may mutate
// caches.
// -----------------------------------------------------------------------------
class IVenueQuoter {
 public:
  virtual ~IVenueQuoter() = default;

  virtual domain::Uint256 quoteExactInput(const domain::AssetId& in,
                                          const domain::AssetId& out,
                                          const domain::Uint256& amount_in,
                                          std::uint32_t fee_tier) = 0;
};

// -----------------------------------------------------------------------------
// IVenueExecutor: trade execution on one trading venue
// -----------------------------------------------------------------------------
//
// @brief  Swaps exactly `amount_in` of `in` for at least `min_out` of `out`.
//
// @return The amount of `out` actually received.
//
// @details
// Implementations throw when the swap cannot honour `min_out`. QuoteRouter
// additionally checks the returned amount, so an executor that reports a
// short fill is rejected the same way.
// -----------------------------------------------------------------------------
class IVenueExecutor {
 public:
  virtual ~IVenueExecutor() = default;

  virtual domain::Uint256 swapExactInput(const domain::AssetId& in,
                                         const domain::AssetId& out,
                                         const domain::Uint256& amount_in,
                                         const domain::Uint256& min_out,
                                         std::uint32_t fee_tier) = 0;
};

}  // namespace vault
