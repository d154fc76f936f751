#pragma once

#include "vault/domain/asset.hpp"
#include "vault/venue/i_native_wrapper.hpp"
#include "vault/venue/venue_config.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vault {

// Winning quote: which venue, and how much it promised.
struct VenueQuote {
  std::size_t venue_index{0};
  domain::Uint256 amount_out{0};
};

// -----------------------------------------------------------------------------
// TradeFill: outcome of one executed leg
// -----------------------------------------------------------------------------
// asset_in / asset_out are the vault-side ids (never the wrapped-native
// substitute), so the engine can book them directly against holdings.
// -----------------------------------------------------------------------------
struct TradeFill {
  std::size_t venue_index{0};
  std::string venue_name;
  domain::AssetId asset_in;
  domain::AssetId asset_out;
  domain::Uint256 amount_in{0};
  domain::Uint256 quoted_out{0};
  domain::Uint256 min_out{0};
  domain::Uint256 amount_out{0};
};

// -----------------------------------------------------------------------------
// QuoteRouter: best-of-N venue selection and execution
// -----------------------------------------------------------------------------
//
// @brief  Owns the venue table. For a given (in, out, amount) it asks every
//         enabled venue for a quote, picks the largest output and executes
//         the trade on that venue with a slippage floor.
//
// @details
// Selection rules:
//   - Disabled venues are skipped.
//   - A quoter that throws (std::exception) counts as "no quote". The
//     failure is logged to std::cerr; the remaining venues are still asked.
//   - A zero quote counts as "no quote".
//   - The maximum quote wins; ties go to the lowest venue index.
//   - No positive quote at all → VaultError(NoQuoteAvailable).
//
// Execution rules:
//   - min_out = quoted * (10'000 - slippage_bps) / 10'000.
//   - An executor exception, or a reported output below min_out, fails the
//     leg with VaultError(ExecutionFailed). The one exception is
//     ReentrantCall (a nested engine call from inside the executor), which
//     propagates unchanged.
//
// Native asset handling:
//   A venue with wraps_native == true sees `wrapped_native` wherever the
//   vault says kNativeAsset. When a native wrapper is installed, the router
//   wraps the input before such a swap and unwraps the output after it.
//
// Thread model:
//   Not internally synchronized. VaultEngine calls it only while holding
//   its call lock.
//
// Ownership:
//   Owned by VaultEngine as a value member. Venue handles are shared.
// -----------------------------------------------------------------------------
class QuoteRouter {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  slippage_bps    Execution tolerance below the winning quote.
  // @param  wrapped_native  Asset id of the wrapped native token; empty
  //                         disables substitution.
  // @param  wrapper         Optional wrap/unwrap hook (may be null).
  //
  // @throws VaultError(InvalidParameter) when slippage_bps > 10'000.
  // -------------------------------------------------------------------------
  QuoteRouter(std::uint32_t slippage_bps, domain::AssetId wrapped_native,
              std::shared_ptr<INativeWrapper> wrapper = nullptr);

  // -------------------------------------------------------------------------
  // configureVenue(id, config)
  // -------------------------------------------------------------------------
  // @brief  Appends (id == venueCount()) or replaces (id < venueCount()) a
  //         venue.
  //
  // @throws VaultError(InvalidParameter) for any other id, an empty name,
  //         or a missing quoter/executor handle.
  // -------------------------------------------------------------------------
  void configureVenue(std::size_t id, VenueConfig config);

  std::size_t venueCount() const { return venues_.size(); }
  const std::vector<VenueConfig>& venues() const { return venues_; }

  // Wholesale replacement, used for rollback and restore.
  void setVenues(std::vector<VenueConfig> venues) {
    venues_ = std::move(venues);
  }

  // -------------------------------------------------------------------------
  // quoteAll(in, out, amount_in)
  // -------------------------------------------------------------------------
  // @return One entry per venue, index-aligned with venues(). nullopt for
  //         disabled venues and quoters that threw.
  // -------------------------------------------------------------------------
  std::vector<std::optional<domain::Uint256>> quoteAll(
      const domain::AssetId& in, const domain::AssetId& out,
      const domain::Uint256& amount_in) const;

  // Best positive quote, or nullopt when no venue offers one.
  std::optional<VenueQuote> bestQuote(const domain::AssetId& in,
                                      const domain::AssetId& out,
                                      const domain::Uint256& amount_in) const;

  // -------------------------------------------------------------------------
  // execute(in, out, amount_in)
  // -------------------------------------------------------------------------
  // @brief  bestQuote() followed by a swap on the winner.
  //
  // @throws VaultError(NoQuoteAvailable)  no venue quoted.
  // @throws VaultError(ExecutionFailed)   swap threw or under-delivered.
  // -------------------------------------------------------------------------
  TradeFill execute(const domain::AssetId& in, const domain::AssetId& out,
                    const domain::Uint256& amount_in) const;

  std::uint32_t slippageBps() const { return slippage_bps_; }

 private:
  // The id a given venue expects for `asset`.
  const domain::AssetId& venueAsset(const domain::AssetId& asset,
                                    const VenueConfig& venue) const;

  std::uint32_t slippage_bps_;
  domain::AssetId wrapped_native_;
  std::shared_ptr<INativeWrapper> wrapper_;
  std::vector<VenueConfig> venues_;
};

}  // namespace vault
