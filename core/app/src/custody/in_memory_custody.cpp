#include "vault/custody/in_memory_custody.hpp"
#include "vault/errors/vault_error.hpp"

namespace vault {

using domain::AccountId;
using domain::AssetId;
using domain::Uint256;

void InMemoryCustody::credit(const AccountId& account, const AssetId& asset,
                             const Uint256& amount) {
  std::lock_guard lock(mutex_);
  wallets_[{account, asset}] += amount;
}

Uint256 InMemoryCustody::balanceOf(const AccountId& account,
                                   const AssetId& asset) const {
  std::lock_guard lock(mutex_);
  auto it = wallets_.find({account, asset});
  return it == wallets_.end() ? Uint256{0} : it->second;
}

// -----------------------------------------------------------------------------
// collect: debit the depositor's wallet or fail without touching it
// -----------------------------------------------------------------------------
void InMemoryCustody::collect(const AccountId& from, const AssetId& asset,
                              const Uint256& amount) {
  if (amount == 0) {
    return;
  }
  std::lock_guard lock(mutex_);
  auto it = wallets_.find({from, asset});
  Uint256 available = it == wallets_.end() ? Uint256{0} : it->second;
  if (available < amount) {
    ErrorDetail detail;
    detail.asset = asset;
    detail.actual = available;
    detail.limit = amount;
    throw VaultError(ErrorCode::InsufficientBalance,
                     from + " holds too little " + asset, detail);
  }
  it->second -= amount;
}

void InMemoryCustody::release(const AccountId& to, const AssetId& asset,
                              const Uint256& amount) {
  std::lock_guard lock(mutex_);
  wallets_[{to, asset}] += amount;
}

}  // namespace vault
