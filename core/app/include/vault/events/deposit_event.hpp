#pragma once

#include "vault/domain/asset.hpp"
#include "event_types.hpp"

#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// DepositEvent
// -----------------------------------------------------------------------------
// Responsibility: Records one committed deposit: what came in, what it was
// worth, and the shares minted for it.
// Published after the call lock is released; a rolled-back deposit never
// produces one.
// -----------------------------------------------------------------------------
struct DepositEvent {
  domain::AccountId holder;
  domain::AssetId asset;
  domain::Uint256 amount{0};
  domain::Uint256 value_usd{0};
  domain::Uint256 shares_minted{0};
  domain::Uint256 share_price{0};     // Price the shares were minted at
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace vault
