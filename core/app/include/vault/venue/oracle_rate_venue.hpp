#pragma once

#include "vault/oracle/i_price_oracle.hpp"
#include "vault/venue/i_venue.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>

namespace vault {

// -----------------------------------------------------------------------------
// OracleRateVenue: simulated venue that trades at oracle prices
// -----------------------------------------------------------------------------
//
// @brief  Quotes and fills swaps at the oracle's USD cross rate scaled by a
//         configurable quality factor. Serves as both IVenueQuoter and
//         IVenueExecutor.
//
// @details
// Output for amount_in of `in`:
//
//   value_usd  = amount_in * price(in) / 10^decimals(in)
//   value_usd' = value_usd * quality_bps / 10'000
//   amount_out = value_usd' * 10^decimals(out) / price(out)
//
// quality_bps == 10'000 is a frictionless venue; 9'800 loses 2 % per trade.
//
// Knobs for simulations and tests:
//   setQuotesFailing(true)      quoteExactInput() throws.
//   setExecutionsFailing(true)  swapExactInput() throws.
//   setExecutionShortfallBps(n) fills n bps below the quoted output.
//   mapAsset(venue_id, oracle_id) prices `venue_id` (e.g. the wrapped
//                               native token) as `oracle_id`.
//
// Failures are reported as std::runtime_error, like a real venue adapter
// would; QuoteRouter translates them.
//
// Thread model:
//   Knobs are atomics; the alias map is mutex-protected. Reads the oracle
//   through its thread-safe interface.
//
// Ownership:
//   Holds a const reference to the oracle, which must outlive the venue.
// -----------------------------------------------------------------------------
class OracleRateVenue final : public IVenueQuoter, public IVenueExecutor {
 public:
  explicit OracleRateVenue(const IPriceOracle& oracle,
                           std::uint32_t quality_bps = 10'000);

  OracleRateVenue(const OracleRateVenue&) = delete;
  OracleRateVenue& operator=(const OracleRateVenue&) = delete;

  domain::Uint256 quoteExactInput(const domain::AssetId& in,
                                  const domain::AssetId& out,
                                  const domain::Uint256& amount_in,
                                  std::uint32_t fee_tier) override;

  domain::Uint256 swapExactInput(const domain::AssetId& in,
                                 const domain::AssetId& out,
                                 const domain::Uint256& amount_in,
                                 const domain::Uint256& min_out,
                                 std::uint32_t fee_tier) override;

  void setQualityBps(std::uint32_t quality_bps) { quality_bps_ = quality_bps; }
  void setQuotesFailing(bool failing) { quotes_failing_ = failing; }
  void setExecutionsFailing(bool failing) { executions_failing_ = failing; }
  void setExecutionShortfallBps(std::uint32_t bps) { shortfall_bps_ = bps; }
  void mapAsset(const domain::AssetId& venue_asset,
                const domain::AssetId& oracle_asset);

  std::uint64_t executedSwaps() const { return executed_swaps_.load(); }

 private:
  domain::AssetId oracleAsset(const domain::AssetId& asset) const;
  domain::Uint256 rate(const domain::AssetId& in, const domain::AssetId& out,
                       const domain::Uint256& amount_in) const;

  const IPriceOracle& oracle_;
  std::atomic<std::uint32_t> quality_bps_;
  std::atomic<bool> quotes_failing_{false};
  std::atomic<bool> executions_failing_{false};
  std::atomic<std::uint32_t> shortfall_bps_{0};
  std::atomic<std::uint64_t> executed_swaps_{0};

  mutable std::mutex alias_mutex_;
  std::map<domain::AssetId, domain::AssetId> aliases_;
};

}  // namespace vault
