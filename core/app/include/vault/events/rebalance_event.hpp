#pragma once

#include "vault/domain/asset.hpp"
#include "event_types.hpp"

#include <cstddef>
#include <cstdint>

namespace vault {

// -----------------------------------------------------------------------------
// RebalanceEvent
// -----------------------------------------------------------------------------
// Summary of one committed rebalance. traded == false means every weight
// was already within tolerance and only fee settlement ran.
// -----------------------------------------------------------------------------
struct RebalanceEvent {
  domain::AccountId caller;
  domain::Uint256 value_before{0};
  domain::Uint256 value_after{0};
  std::size_t trade_count{0};
  bool traded{false};
  domain::Uint256 share_price{0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// FeeSettlementEvent
// -----------------------------------------------------------------------------
// Emitted only when settlement minted or burned something.
// -----------------------------------------------------------------------------
struct FeeSettlementEvent {
  domain::Uint256 gain{0};
  domain::Uint256 loss{0};
  domain::Uint256 platform_shares{0};
  domain::Uint256 owner_shares{0};
  domain::Uint256 caller_shares{0};
  domain::Uint256 penalty_shares{0};
  bool accountable{true};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace vault
