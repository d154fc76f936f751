#pragma once

#include "vault/domain/fixed_point.hpp"

#include <string>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// AssetId / AccountId
// -----------------------------------------------------------------------------
// Responsibility: Identify an asset (token) and an external party (holder,
// manager, platform treasury) respectively.
// Why plain string aliases:
// - The engine never interprets identifiers; it only compares and hashes
//   them. Registry addresses, tickers or test labels all fit.
// - Aliases keep signatures self-documenting (AssetId vs AccountId) while
//   remaining cheap value types.
// -----------------------------------------------------------------------------
using AssetId = std::string;
using AccountId = std::string;

// Identifier of the chain's native currency. Venues that only trade the
// wrapped form see the configured wrapped-native id in its place.
inline const AssetId kNativeAsset = "native";

// -----------------------------------------------------------------------------
// AssetValuation
// -----------------------------------------------------------------------------
// @brief  Point-in-time valuation of one vault holding.
//
// @details
// Built by the engine from the holdings book and the oracle at the start of
// a rebalance (and again after trading). price is 8-decimal USD per whole
// unit; value_usd = balance * price / 10^decimals.
// -----------------------------------------------------------------------------
struct AssetValuation {
  AssetId asset;
  Uint256 balance{0};
  Uint256 price{0};
  unsigned decimals{0};
  Uint256 value_usd{0};
};

}  // namespace domain
}  // namespace vault
