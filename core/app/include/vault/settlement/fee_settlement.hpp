#pragma once

#include "vault/domain/vault_state.hpp"
#include "vault/ledger/share_ledger.hpp"
#include "vault/oracle/i_price_oracle.hpp"

namespace vault {

// Accounts that can receive or forfeit shares during settlement.
struct SettlementParties {
  domain::AccountId manager;
  domain::AccountId platform;
  domain::AccountId caller;
};

// -----------------------------------------------------------------------------
// SettlementOutcome
// -----------------------------------------------------------------------------
// What one settlement did. At most one of gain / loss is non-zero.
// share_price is the post-operation price used for every conversion.
// -----------------------------------------------------------------------------
struct SettlementOutcome {
  domain::Uint256 gain{0};
  domain::Uint256 loss{0};
  domain::Uint256 share_price{0};
  domain::Uint256 platform_shares{0};
  domain::Uint256 owner_shares{0};
  domain::Uint256 caller_shares{0};
  domain::Uint256 penalty_shares{0};
  bool accountable{true};
};

// -----------------------------------------------------------------------------
// FeeSettlement: gain/loss splitting after a rebalance
// -----------------------------------------------------------------------------
//
// @brief  Converts the value change of one rebalance into share mints (on a
//         gain) or a manager penalty burn (on a loss).
//
// @details
// Conversion price: ceil(valueAfter * SCALE / totalSupply), taken once
// before any mint or burn, so fee shares never dilute holders beyond the
// fee's value.
//
// Gain (valueAfter > valueBefore):
//   platform  oracle.computeFee(gain)                   always
//   manager   gain * owner_fee_bps / 10'000             only if accountable
//   caller    gain * caller_fee_bps / 10'000            always
//
// Loss (valueAfter < valueBefore), only if the manager is accountable:
//   penalty   loss * (owner_fee_bps + caller_fee_bps) / 10'000, converted
//             to shares and burned from the manager, capped at the manager's
//             balance.
//
// No change, or zero total supply: nothing happens.
//
// Thread model:
//   Stateless. The ledger passed in is guarded by VaultEngine.
//
// Ownership:
//   Holds a const reference to the oracle.
// -----------------------------------------------------------------------------
class FeeSettlement {
 public:
  explicit FeeSettlement(const IPriceOracle& oracle);

  SettlementOutcome settle(ShareLedger& ledger,
                           const domain::Uint256& value_before,
                           const domain::Uint256& value_after,
                           const SettlementParties& parties,
                           const domain::FeeSplit& split,
                           bool accountable) const;

 private:
  const IPriceOracle& oracle_;
};

}  // namespace vault
