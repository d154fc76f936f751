#pragma once

#include "vault/domain/asset.hpp"
#include "event_types.hpp"

#include <cstdint>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// TradeEvent
// -----------------------------------------------------------------------------
// One executed rebalance leg. venue is the venue name for best-quote legs
// and "external-route" for rebalanceByExternalRoute.
// -----------------------------------------------------------------------------
struct TradeEvent {
  std::string venue;
  domain::AssetId asset_in;
  domain::AssetId asset_out;
  domain::Uint256 amount_in{0};
  domain::Uint256 quoted_out{0};
  domain::Uint256 amount_out{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace vault
