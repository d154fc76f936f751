#include "vault/venue/oracle_rate_venue.hpp"

#include <stdexcept>

namespace vault {

using domain::AssetId;
using domain::Uint256;

OracleRateVenue::OracleRateVenue(const IPriceOracle& oracle,
                                 std::uint32_t quality_bps)
    : oracle_(oracle), quality_bps_(quality_bps) {}

void OracleRateVenue::mapAsset(const AssetId& venue_asset,
                               const AssetId& oracle_asset) {
  std::lock_guard lock(alias_mutex_);
  aliases_[venue_asset] = oracle_asset;
}

AssetId OracleRateVenue::oracleAsset(const AssetId& asset) const {
  std::lock_guard lock(alias_mutex_);
  auto it = aliases_.find(asset);
  return it == aliases_.end() ? asset : it->second;
}

// -----------------------------------------------------------------------------
// rate: USD cross conversion scaled by venue quality
// -----------------------------------------------------------------------------
Uint256 OracleRateVenue::rate(const AssetId& in, const AssetId& out,
                              const Uint256& amount_in) const {
  const AssetId oracle_in = oracleAsset(in);
  const AssetId oracle_out = oracleAsset(out);

  if (!oracle_.isAssetAccepted(oracle_in) ||
      !oracle_.isAssetAccepted(oracle_out)) {
    throw std::runtime_error("pair " + in + "/" + out + " not listed");
  }

  const Uint256 price_in = oracle_.getPrice(oracle_in);
  const Uint256 price_out = oracle_.getPrice(oracle_out);
  if (price_in == 0 || price_out == 0) {
    throw std::runtime_error("pair " + in + "/" + out + " has no price");
  }

  Uint256 value = domain::toUsdValue(amount_in, price_in,
                                     oracle_.decimals(oracle_in));
  value = domain::applyBps(value, quality_bps_.load());
  return domain::fromUsdValue(value, price_out, oracle_.decimals(oracle_out));
}

Uint256 OracleRateVenue::quoteExactInput(const AssetId& in, const AssetId& out,
                                         const Uint256& amount_in,
                                         std::uint32_t /*fee_tier*/) {
  if (quotes_failing_) {
    throw std::runtime_error("quoter unavailable");
  }
  return rate(in, out, amount_in);
}

Uint256 OracleRateVenue::swapExactInput(const AssetId& in, const AssetId& out,
                                        const Uint256& amount_in,
                                        const Uint256& min_out,
                                        std::uint32_t /*fee_tier*/) {
  if (executions_failing_) {
    throw std::runtime_error("swap reverted");
  }
  Uint256 amount_out = rate(in, out, amount_in);
  const std::uint32_t shortfall = shortfall_bps_.load();
  if (shortfall > 0) {
    amount_out = domain::applyBps(amount_out,
                                  domain::kBpsDenominator - shortfall);
  }
  if (amount_out < min_out) {
    throw std::runtime_error("insufficient output amount");
  }
  ++executed_swaps_;
  return amount_out;
}

}  // namespace vault
