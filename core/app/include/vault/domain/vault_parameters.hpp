#pragma once

#include <cstdint>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// VaultParameters: rebalance guard rails
// -----------------------------------------------------------------------------
//
// @brief  Basis-point thresholds applied by every rebalance.
//
// @details
// Passed by value to VaultEngine at construction (usually from VaultConfig)
// and constant for the lifetime of the engine.
//
//   drift_tolerance_bps
//     Maximum |actual weight - target weight| per asset, in basis points of
//     total value. 200 bps == ±2 percentage points. Used both to decide
//     whether a rebalance trades at all and to verify the result.
//
//   max_value_loss_bps
//     Value-loss budget per rebalance. The call aborts with
//     ValueLossExceeded when
//       totalValueAfter < totalValueBefore * (10'000 - max_value_loss_bps)
//                         / 10'000.
//
//   quote_slippage_bps
//     Execution tolerance against the winning quote. The executor is asked
//     for at least quoted * (10'000 - quote_slippage_bps) / 10'000.
//
// Thread model:
//   Plain data struct with value semantics. No shared mutable state.
// -----------------------------------------------------------------------------
struct VaultParameters {
  std::uint32_t drift_tolerance_bps{200};
  std::uint32_t max_value_loss_bps{50};
  std::uint32_t quote_slippage_bps{500};
};

}  // namespace domain
}  // namespace vault
