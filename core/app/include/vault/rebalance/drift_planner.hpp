#pragma once

#include "vault/domain/asset.hpp"
#include "vault/domain/target_allocation.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace vault {

// Actual vs target weight of one asset, in basis points of total value.
struct AssetWeight {
  domain::AssetId asset;
  std::uint32_t actual_bps{0};
  std::uint32_t target_bps{0};
};

// -----------------------------------------------------------------------------
// TradeLeg: one seller→buyer transfer of a correction plan
// -----------------------------------------------------------------------------
// amount_in is in native units of sell_asset; value_usd is its oracle value
// at planning time (informational).
// -----------------------------------------------------------------------------
struct TradeLeg {
  domain::AssetId sell_asset;
  domain::AssetId buy_asset;
  domain::Uint256 amount_in{0};
  domain::Uint256 value_usd{0};
};

struct CorrectionPlan {
  std::vector<TradeLeg> legs;
  domain::Uint256 total_value_usd{0};
  domain::Uint256 total_deficit_usd{0};
};

// -----------------------------------------------------------------------------
// DriftPlanner: allocation drift detection and correction planning
// -----------------------------------------------------------------------------
//
// @brief  Pure functions over a set of asset valuations and a target
//         allocation: compute weights, check tolerance, and build the list
//         of trades that moves the vault back to target.
//
// @details
// Valuations must cover every accepted asset the vault holds or targets
// (the engine builds them from the oracle's accepted list). Assets absent
// from the allocation have a target weight of zero and are sold off.
//
// USD targets:
//   target_usd(a) = floor(total * weight(a) / 100)
//   The rounding remainder (total - Σ target_usd) is assigned to the
//   largest-weight asset (first in allocation order on ties), so
//   Σ target_usd == total exactly.
//
// Classification:
//   seller  value > target_usd. excess_native = amount worth
//           (value - target_usd) at the oracle price, capped at balance.
//   buyer   value < target_usd. deficit_usd = target_usd - value.
//   Σ seller excess (in USD) == Σ deficit_usd == total_deficit.
//
// Matching (single pass, O(S×B)):
//   leg(s, b).amount_in = floor(excess_native(s) * deficit(b) / total_deficit)
//   Zero-amount legs are omitted. Per seller, Σ legs ≤ excess_native(s).
//
// A vault with zero total value has no weights to correct: every asset is
// considered within tolerance and the plan is empty. plan() throws
// InvalidAsset for a seller valued at a zero price.
//
// Thread model:
//   Stateless apart from the tolerance; const methods only.
// -----------------------------------------------------------------------------
class DriftPlanner {
 public:
  explicit DriftPlanner(std::uint32_t tolerance_bps);

  static domain::Uint256 totalValue(
      const std::vector<domain::AssetValuation>& valuations);

  // One entry per valuation, in valuation order, followed by any allocation
  // asset missing from the valuations (actual 0).
  std::vector<AssetWeight> weights(
      const std::vector<domain::AssetValuation>& valuations,
      const domain::TargetAllocation& allocation) const;

  // First asset whose |actual - target| exceeds the tolerance, if any.
  std::optional<AssetWeight> firstOutOfTolerance(
      const std::vector<domain::AssetValuation>& valuations,
      const domain::TargetAllocation& allocation) const;

  CorrectionPlan plan(const std::vector<domain::AssetValuation>& valuations,
                      const domain::TargetAllocation& allocation) const;

  std::uint32_t toleranceBps() const { return tolerance_bps_; }

 private:
  std::uint32_t tolerance_bps_;
};

}  // namespace vault
