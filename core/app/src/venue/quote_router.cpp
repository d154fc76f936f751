#include "vault/venue/quote_router.hpp"
#include "vault/errors/vault_error.hpp"

#include <iostream>
#include <utility>

namespace vault {

using domain::AssetId;
using domain::Uint256;

namespace {

VaultError executionFailed(const std::string& venue, const AssetId& in,
                           const AssetId& out, const Uint256& min_out,
                           const char* reason) {
  ErrorDetail detail;
  detail.asset = in + "->" + out;
  detail.limit = min_out;
  return VaultError(ErrorCode::ExecutionFailed,
                    "venue " + venue + " failed: " + reason, detail);
}

}  // namespace

QuoteRouter::QuoteRouter(std::uint32_t slippage_bps, AssetId wrapped_native,
                         std::shared_ptr<INativeWrapper> wrapper)
    : slippage_bps_(slippage_bps),
      wrapped_native_(std::move(wrapped_native)),
      wrapper_(std::move(wrapper)) {
  if (slippage_bps_ > domain::kBpsDenominator) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "quote slippage above 10000 bps");
  }
}

// -----------------------------------------------------------------------------
// configureVenue: append at id == size, replace below it
// -----------------------------------------------------------------------------
void QuoteRouter::configureVenue(std::size_t id, VenueConfig config) {
  if (id > venues_.size()) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "venue id " + std::to_string(id) + " out of range (count " +
                         std::to_string(venues_.size()) + ")");
  }
  if (config.name.empty()) {
    throw VaultError(ErrorCode::InvalidParameter, "venue name is empty");
  }
  if (!config.executor || !config.quoter) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "venue " + config.name + " lacks a quoter or executor");
  }

  if (id == venues_.size()) {
    venues_.push_back(std::move(config));
  } else {
    venues_[id] = std::move(config);
  }
}

const AssetId& QuoteRouter::venueAsset(const AssetId& asset,
                                       const VenueConfig& venue) const {
  if (venue.wraps_native && !wrapped_native_.empty() &&
      asset == domain::kNativeAsset) {
    return wrapped_native_;
  }
  return asset;
}

// -----------------------------------------------------------------------------
// quoteAll: ask every enabled venue; a failing quoter never aborts the call
// -----------------------------------------------------------------------------
std::vector<std::optional<Uint256>> QuoteRouter::quoteAll(
    const AssetId& in, const AssetId& out, const Uint256& amount_in) const {
  std::vector<std::optional<Uint256>> quotes;
  quotes.reserve(venues_.size());

  for (const auto& venue : venues_) {
    if (!venue.enabled) {
      quotes.emplace_back(std::nullopt);
      continue;
    }
    try {
      quotes.emplace_back(venue.quoter->quoteExactInput(
          venueAsset(in, venue), venueAsset(out, venue), amount_in,
          venue.fee_tier));
    } catch (const std::exception& e) {
      std::cerr << "[QuoteRouter] Quoter " << venue.name << " failed for "
                << in << "->" << out << ": " << e.what() << std::endl;
      quotes.emplace_back(std::nullopt);
    }
  }
  return quotes;
}

std::optional<VenueQuote> QuoteRouter::bestQuote(
    const AssetId& in, const AssetId& out, const Uint256& amount_in) const {
  auto quotes = quoteAll(in, out, amount_in);

  std::optional<VenueQuote> best;
  for (std::size_t i = 0; i < quotes.size(); ++i) {
    if (!quotes[i] || *quotes[i] == 0) {
      continue;
    }
    // Strictly greater: an equal quote from a later venue does not displace
    // the earlier one.
    if (!best || *quotes[i] > best->amount_out) {
      best = VenueQuote{i, *quotes[i]};
    }
  }
  return best;
}

// -----------------------------------------------------------------------------
// execute: quote, then swap on the winner with a slippage floor
// -----------------------------------------------------------------------------
TradeFill QuoteRouter::execute(const AssetId& in, const AssetId& out,
                               const Uint256& amount_in) const {
  auto best = bestQuote(in, out, amount_in);
  if (!best) {
    ErrorDetail detail;
    detail.asset = in + "->" + out;
    detail.limit = amount_in;
    throw VaultError(ErrorCode::NoQuoteAvailable,
                     "no venue quoted " + in + "->" + out, detail);
  }

  const auto& venue = venues_[best->venue_index];
  const bool wrap_in = venue.wraps_native && wrapper_ &&
                       in == domain::kNativeAsset;
  const bool unwrap_out = venue.wraps_native && wrapper_ &&
                          out == domain::kNativeAsset;

  TradeFill fill;
  fill.venue_index = best->venue_index;
  fill.venue_name = venue.name;
  fill.asset_in = in;
  fill.asset_out = out;
  fill.amount_in = amount_in;
  fill.quoted_out = best->amount_out;
  fill.min_out = domain::applyBps(
      best->amount_out, domain::kBpsDenominator - slippage_bps_);

  try {
    if (wrap_in) {
      wrapper_->wrap(amount_in);
    }
    fill.amount_out = venue.executor->swapExactInput(
        venueAsset(in, venue), venueAsset(out, venue), amount_in,
        fill.min_out, venue.fee_tier);
    if (unwrap_out) {
      wrapper_->unwrap(fill.amount_out);
    }
  } catch (const VaultError& e) {
    if (e.code() == ErrorCode::ReentrantCall) {
      throw;
    }
    throw executionFailed(venue.name, in, out, fill.min_out, e.what());
  } catch (const std::exception& e) {
    throw executionFailed(venue.name, in, out, fill.min_out, e.what());
  }

  if (fill.amount_out < fill.min_out) {
    ErrorDetail detail;
    detail.asset = in + "->" + out;
    detail.actual = fill.amount_out;
    detail.limit = fill.min_out;
    throw VaultError(ErrorCode::ExecutionFailed,
                     "venue " + venue.name + " delivered below minimum output",
                     detail);
  }
  return fill;
}

}  // namespace vault
