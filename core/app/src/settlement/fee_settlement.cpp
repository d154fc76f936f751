#include "vault/settlement/fee_settlement.hpp"

namespace vault {

using domain::Uint256;

FeeSettlement::FeeSettlement(const IPriceOracle& oracle) : oracle_(oracle) {}

SettlementOutcome FeeSettlement::settle(ShareLedger& ledger,
                                        const Uint256& value_before,
                                        const Uint256& value_after,
                                        const SettlementParties& parties,
                                        const domain::FeeSplit& split,
                                        bool accountable) const {
  SettlementOutcome outcome;
  outcome.accountable = accountable;

  if (ledger.totalSupply() == 0 || value_after == value_before) {
    return outcome;
  }

  outcome.share_price =
      domain::computeSharePrice(value_after, ledger.totalSupply());
  if (outcome.share_price == 0) {
    return outcome;
  }

  if (value_after > value_before) {
    outcome.gain = value_after - value_before;

    const Uint256 platform_fee = oracle_.computeFee(outcome.gain);
    outcome.platform_shares =
        domain::sharesForValue(platform_fee, outcome.share_price);

    if (accountable) {
      outcome.owner_shares = domain::sharesForValue(
          domain::applyBps(outcome.gain, split.owner_fee_bps),
          outcome.share_price);
    }
    outcome.caller_shares = domain::sharesForValue(
        domain::applyBps(outcome.gain, split.caller_fee_bps),
        outcome.share_price);

    ledger.mint(parties.platform, outcome.platform_shares);
    ledger.mint(parties.manager, outcome.owner_shares);
    ledger.mint(parties.caller, outcome.caller_shares);
    return outcome;
  }

  outcome.loss = value_before - value_after;
  if (!accountable) {
    return outcome;
  }

  const Uint256 penalty_value = domain::applyBps(
      outcome.loss, split.owner_fee_bps + split.caller_fee_bps);
  Uint256 penalty = domain::sharesForValue(penalty_value, outcome.share_price);
  const Uint256 manager_balance = ledger.balanceOf(parties.manager);
  if (penalty > manager_balance) {
    penalty = manager_balance;
  }
  outcome.penalty_shares = penalty;
  ledger.burn(parties.manager, penalty);
  return outcome;
}

}  // namespace vault
