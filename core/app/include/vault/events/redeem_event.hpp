#pragma once

#include "vault/domain/asset.hpp"
#include "event_types.hpp"

#include <cstdint>
#include <string>

namespace vault {

// -----------------------------------------------------------------------------
// RedeemEvent
// -----------------------------------------------------------------------------
// One committed redeem. value_usd is the amount added to the lifetime
// withdraw counter (shares at the stored price). The individual asset
// transfers follow as PayoutEvents with the same redeem.
// -----------------------------------------------------------------------------
struct RedeemEvent {
  domain::AccountId holder;
  domain::Uint256 shares_burned{0};
  domain::Uint256 value_usd{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PayoutEvent
// -----------------------------------------------------------------------------
// One asset transfer out of the vault. reason is "redeem" or "sweep".
// -----------------------------------------------------------------------------
struct PayoutEvent {
  domain::AccountId recipient;
  domain::AssetId asset;
  domain::Uint256 amount{0};
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace vault
