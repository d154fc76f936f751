#pragma once

#include "admin_event.hpp"
#include "deposit_event.hpp"
#include "rebalance_event.hpp"
#include "redeem_event.hpp"
#include "trade_event.hpp"
#include <variant>

namespace vault {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope type for everything VaultEngine
// publishes. One EventBus carries every kind; subscribers dispatch with
// std::visit or the typed EventBus::subscribe<T>.
// -----------------------------------------------------------------------------
using Event = std::variant<
    DepositEvent,
    RedeemEvent,
    PayoutEvent,
    TradeEvent,
    RebalanceEvent,
    FeeSettlementEvent,
    AdminEvent>;

}  // namespace vault
