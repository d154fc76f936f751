#pragma once

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>

namespace vault {
namespace domain {

// -----------------------------------------------------------------------------
// Uint256
// -----------------------------------------------------------------------------
// Responsibility: The single numeric type for token amounts, USD values,
// share amounts and prices throughout the engine.
//
// Why a 256-bit unsigned integer instead of double:
// - Share accounting must be exact. Sums of balances have to equal total
//   supply to the last unit, which floating point cannot promise.
// - Token amounts carry up to 18 decimals. 1'000 units of an 18-decimal
//   asset is 10^21, already beyond std::uint64_t. Intermediate products
//   (amount * price, value * SCALE) reach ~10^40, so 128 bits is not enough.
// - boost::multiprecision::uint256_t is a fixed-width value type: cheap to
//   copy, no heap allocation, totally ordered, streamable.
// -----------------------------------------------------------------------------
using Uint256 = boost::multiprecision::uint256_t;

// USD prices and USD values carry 8 decimals ($1.00 == 100'000'000).
constexpr unsigned kPriceDecimals = 8;
constexpr std::uint64_t kPriceScale = 100'000'000ULL;

// Shares carry 18 decimals. SCALE in all share conversions.
constexpr unsigned kShareDecimals = 18;
constexpr std::uint64_t kShareScale = 1'000'000'000'000'000'000ULL;

// Share price assigned on the first deposit and whenever supply is zero.
constexpr std::uint64_t kInitialSharePrice = kPriceScale;

// Denominator for every basis-point quantity (fees, tolerances, budgets).
constexpr std::uint32_t kBpsDenominator = 10'000;

// Target weights are whole percentages and must sum to exactly this.
constexpr std::uint32_t kWeightSum = 100;

// -----------------------------------------------------------------------------
// Arithmetic helpers
// -----------------------------------------------------------------------------
// All helpers take the divisor last and require it to be non-zero; callers
// guard the zero-supply and zero-price cases before calling.
// -----------------------------------------------------------------------------

// floor(a * b / c)
inline Uint256 mulDiv(const Uint256& a, const Uint256& b, const Uint256& c) {
  return (a * b) / c;
}

// ceil(a * b / c)
inline Uint256 mulDivUp(const Uint256& a, const Uint256& b, const Uint256& c) {
  Uint256 product = a * b;
  Uint256 quotient = product / c;
  return (quotient * c == product) ? quotient : quotient + 1;
}

// 10^exponent
inline Uint256 pow10(unsigned exponent) {
  Uint256 result{1};
  for (unsigned i = 0; i < exponent; ++i) {
    result *= 10;
  }
  return result;
}

// USD value (8 decimals) of `amount` native units of an asset priced at
// `price` with `decimals` decimals. Rounds down.
inline Uint256 toUsdValue(const Uint256& amount, const Uint256& price,
                          unsigned decimals) {
  return mulDiv(amount, price, pow10(decimals));
}

// Native units of an asset worth `value_usd` at `price`. Rounds down.
// `price` must be non-zero.
inline Uint256 fromUsdValue(const Uint256& value_usd, const Uint256& price,
                            unsigned decimals) {
  return mulDiv(value_usd, pow10(decimals), price);
}

// Share price (8-decimal USD per whole share) for a vault worth
// `total_value` with `total_supply` shares outstanding. Rounds up so that
// shares minted against it never dilute existing holders. Zero supply
// yields the initial price.
inline Uint256 computeSharePrice(const Uint256& total_value,
                                 const Uint256& total_supply) {
  if (total_supply == 0) {
    return Uint256{kInitialSharePrice};
  }
  return mulDivUp(total_value, Uint256{kShareScale}, total_supply);
}

// Shares worth `value_usd` at `share_price`. Rounds down. `share_price`
// must be non-zero.
inline Uint256 sharesForValue(const Uint256& value_usd,
                              const Uint256& share_price) {
  return mulDiv(value_usd, Uint256{kShareScale}, share_price);
}

// USD value of `shares` at `share_price`. Rounds down.
inline Uint256 valueOfShares(const Uint256& shares,
                             const Uint256& share_price) {
  return mulDiv(shares, share_price, Uint256{kShareScale});
}

// Applies a basis-point fraction: floor(value * bps / 10'000).
inline Uint256 applyBps(const Uint256& value, std::uint32_t bps) {
  return mulDiv(value, Uint256{bps}, Uint256{kBpsDenominator});
}

}  // namespace domain
}  // namespace vault
