#include "vault/oracle/in_memory_price_oracle.hpp"
#include "vault/errors/vault_error.hpp"

#include <mutex>

namespace vault {

using domain::AssetId;
using domain::Uint256;

// -----------------------------------------------------------------------------
// Registry mutation
// -----------------------------------------------------------------------------
void InMemoryPriceOracle::setAsset(const AssetId& asset, unsigned decimals,
                                   const Uint256& price, bool accepted) {
  std::unique_lock lock(mutex_);
  auto [it, inserted] = entries_.try_emplace(asset);
  if (inserted) {
    order_.push_back(asset);
  }
  it->second.decimals = decimals;
  it->second.price = price;
  it->second.accepted = accepted;
}

void InMemoryPriceOracle::setPrice(const AssetId& asset, const Uint256& price) {
  std::unique_lock lock(mutex_);
  auto it = entries_.find(asset);
  if (it == entries_.end()) {
    ErrorDetail detail;
    detail.asset = asset;
    throw VaultError(ErrorCode::InvalidAsset, "unknown asset " + asset, detail);
  }
  it->second.price = price;
}

void InMemoryPriceOracle::setAccepted(const AssetId& asset, bool accepted) {
  std::unique_lock lock(mutex_);
  auto it = entries_.find(asset);
  if (it == entries_.end()) {
    ErrorDetail detail;
    detail.asset = asset;
    throw VaultError(ErrorCode::InvalidAsset, "unknown asset " + asset, detail);
  }
  it->second.accepted = accepted;
}

void InMemoryPriceOracle::setOperational(bool operational) {
  std::unique_lock lock(mutex_);
  operational_ = operational;
}

void InMemoryPriceOracle::setPerformanceFeeBps(std::uint32_t bps) {
  if (bps > domain::kBpsDenominator) {
    throw VaultError(ErrorCode::InvalidParameter,
                     "performance fee above 10000 bps");
  }
  std::unique_lock lock(mutex_);
  performance_fee_bps_ = bps;
}

// -----------------------------------------------------------------------------
// IPriceOracle
// -----------------------------------------------------------------------------
const InMemoryPriceOracle::Entry& InMemoryPriceOracle::entryFor(
    const AssetId& asset) const {
  auto it = entries_.find(asset);
  if (it == entries_.end()) {
    ErrorDetail detail;
    detail.asset = asset;
    throw VaultError(ErrorCode::InvalidAsset, "unknown asset " + asset, detail);
  }
  return it->second;
}

bool InMemoryPriceOracle::isPlatformOperational() const {
  std::shared_lock lock(mutex_);
  return operational_;
}

bool InMemoryPriceOracle::isAssetAccepted(const AssetId& asset) const {
  std::shared_lock lock(mutex_);
  auto it = entries_.find(asset);
  return it != entries_.end() && it->second.accepted;
}

Uint256 InMemoryPriceOracle::getPrice(const AssetId& asset) const {
  std::shared_lock lock(mutex_);
  return entryFor(asset).price;
}

unsigned InMemoryPriceOracle::decimals(const AssetId& asset) const {
  std::shared_lock lock(mutex_);
  return entryFor(asset).decimals;
}

std::vector<AssetId> InMemoryPriceOracle::acceptedAssets() const {
  std::shared_lock lock(mutex_);
  std::vector<AssetId> result;
  for (const auto& asset : order_) {
    if (entries_.at(asset).accepted) {
      result.push_back(asset);
    }
  }
  return result;
}

Uint256 InMemoryPriceOracle::computeFee(const Uint256& gain) const {
  std::shared_lock lock(mutex_);
  return domain::applyBps(gain, performance_fee_bps_);
}

}  // namespace vault
