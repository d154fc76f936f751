#pragma once

#include "vault/domain/fixed_point.hpp"

#include <cstdint>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// FeeSplit
// -----------------------------------------------------------------------------
// Share of a rebalance gain paid to the manager (owner) and to the account
// that triggered the rebalance (caller), in basis points of the gain. On a
// loss the same two rates, summed, size the manager's penalty. The platform
// fee is not part of the split; the oracle's fee policy computes it.
//
// Invariant (enforced by VaultEngine::setFeeSplit and config loading):
//   owner_fee_bps + caller_fee_bps <= kBpsDenominator
// -----------------------------------------------------------------------------
struct FeeSplit {
  std::uint32_t owner_fee_bps{0};
  std::uint32_t caller_fee_bps{0};
};

// -----------------------------------------------------------------------------
// VaultState: scalar accounting state of one vault
// -----------------------------------------------------------------------------
//
// @brief  Everything the engine tracks about a vault apart from holdings,
//         share balances, the target allocation and the venue table.
//
// @details
// Lifetime counters (8-decimal USD, monotonically non-decreasing):
//   total_deposit_value_usd   Σ depositValueUSD over all deposits.
//   total_withdraw_value_usd  Σ shares·sharePrice/SCALE over all redeems,
//                             using the stored price at redeem time.
//
// share_price_usd lifecycle:
//   0                       before the first deposit.
//   kInitialSharePrice      on a deposit into an empty vault, and whenever
//                           an operation leaves total supply at zero.
//   ceil(value·SCALE/supply) after every committed mutating call.
//
// fee_baseline_usd:
//   Vault value that fees have already been settled against. A deposit adds
//   its value, a redeem removes the redeemed fraction, and a rebalance of
//   either kind resets it to the post-rebalance value after settling the
//   difference. Oracle drift between rebalances therefore accumulates here
//   and settles on the next rebalance, traded or not.
//
// Administrative flags:
//   paused              blocks deposit, redeem and both rebalance kinds.
//   rebalancing_paused  blocks only the rebalance operations.
// -----------------------------------------------------------------------------
struct VaultState {
  Uint256 total_deposit_value_usd{0};
  Uint256 total_withdraw_value_usd{0};
  Uint256 share_price_usd{0};
  Uint256 fee_baseline_usd{0};
  bool paused{false};
  bool rebalancing_paused{false};
  FeeSplit fee_split;
};

}  // namespace domain
}  // namespace vault
