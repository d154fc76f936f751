#include "vault/ledger/share_ledger.hpp"
#include "vault/errors/vault_error.hpp"

namespace vault {

using domain::AccountId;
using domain::Uint256;

ShareLedger ShareLedger::fromBalances(
    const std::map<AccountId, Uint256>& balances) {
  ShareLedger ledger;
  for (const auto& [holder, amount] : balances) {
    ledger.mint(holder, amount);
  }
  return ledger;
}

Uint256 ShareLedger::balanceOf(const AccountId& holder) const {
  auto it = balances_.find(holder);
  return it == balances_.end() ? Uint256{0} : it->second;
}

void ShareLedger::mint(const AccountId& holder, const Uint256& amount) {
  if (amount == 0) {
    return;
  }
  balances_[holder] += amount;
  total_supply_ += amount;
}

void ShareLedger::burn(const AccountId& holder, const Uint256& amount) {
  if (amount == 0) {
    return;
  }
  auto it = balances_.find(holder);
  const Uint256 available = it == balances_.end() ? Uint256{0} : it->second;
  if (available < amount) {
    ErrorDetail detail;
    detail.asset = holder;
    detail.actual = available;
    detail.limit = amount;
    throw VaultError(ErrorCode::InsufficientBalance,
                     holder + " holds fewer shares than requested", detail);
  }

  it->second -= amount;
  total_supply_ -= amount;
  if (it->second == 0) {
    balances_.erase(it);
  }
}

}  // namespace vault
