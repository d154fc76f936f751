#include "vault/rebalance/drift_planner.hpp"

#include "vault/errors/vault_error.hpp"

#include <map>

namespace vault {

using domain::AssetId;
using domain::AssetValuation;
using domain::TargetAllocation;
using domain::Uint256;

namespace {

std::uint32_t weightBps(const Uint256& value, const Uint256& total) {
  if (total == 0) {
    return 0;
  }
  return domain::mulDiv(value, Uint256{domain::kBpsDenominator}, total)
      .convert_to<std::uint32_t>();
}

std::uint32_t distance(std::uint32_t a, std::uint32_t b) {
  return a > b ? a - b : b - a;
}

// Per-asset USD targets summing exactly to `total`.
std::map<AssetId, Uint256> usdTargets(const TargetAllocation& allocation,
                                      const Uint256& total) {
  std::map<AssetId, Uint256> targets;
  Uint256 assigned{0};
  const domain::AllocationEntry* largest = nullptr;

  for (const auto& entry : allocation.entries()) {
    Uint256 target = domain::mulDiv(total, Uint256{entry.weight},
                                    Uint256{domain::kWeightSum});
    targets[entry.asset] = target;
    assigned += target;
    if (largest == nullptr || entry.weight > largest->weight) {
      largest = &entry;
    }
  }

  targets[largest->asset] += total - assigned;
  return targets;
}

}  // namespace

DriftPlanner::DriftPlanner(std::uint32_t tolerance_bps)
    : tolerance_bps_(tolerance_bps) {}

Uint256 DriftPlanner::totalValue(const std::vector<AssetValuation>& valuations) {
  Uint256 total{0};
  for (const auto& v : valuations) {
    total += v.value_usd;
  }
  return total;
}

std::vector<AssetWeight> DriftPlanner::weights(
    const std::vector<AssetValuation>& valuations,
    const TargetAllocation& allocation) const {
  const Uint256 total = totalValue(valuations);
  std::vector<AssetWeight> result;
  result.reserve(valuations.size());

  for (const auto& v : valuations) {
    result.push_back(
        {v.asset, weightBps(v.value_usd, total), allocation.targetBps(v.asset)});
  }

  for (const auto& entry : allocation.entries()) {
    bool present = false;
    for (const auto& v : valuations) {
      if (v.asset == entry.asset) {
        present = true;
        break;
      }
    }
    if (!present) {
      result.push_back({entry.asset, 0, allocation.targetBps(entry.asset)});
    }
  }
  return result;
}

std::optional<AssetWeight> DriftPlanner::firstOutOfTolerance(
    const std::vector<AssetValuation>& valuations,
    const TargetAllocation& allocation) const {
  if (totalValue(valuations) == 0) {
    return std::nullopt;
  }
  for (const auto& w : weights(valuations, allocation)) {
    if (distance(w.actual_bps, w.target_bps) > tolerance_bps_) {
      return w;
    }
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// plan: classify sellers and buyers, then match them proportionally
// -----------------------------------------------------------------------------
CorrectionPlan DriftPlanner::plan(const std::vector<AssetValuation>& valuations,
                                  const TargetAllocation& allocation) const {
  CorrectionPlan plan;
  plan.total_value_usd = totalValue(valuations);
  if (plan.total_value_usd == 0) {
    return plan;
  }

  auto targets = usdTargets(allocation, plan.total_value_usd);

  struct Seller {
    const AssetValuation* valuation;
    Uint256 excess_native;
  };
  struct Buyer {
    AssetId asset;
    Uint256 deficit_usd;
  };
  std::vector<Seller> sellers;
  std::vector<Buyer> buyers;

  for (const auto& v : valuations) {
    auto it = targets.find(v.asset);
    const Uint256 target = it == targets.end() ? Uint256{0} : it->second;

    if (v.value_usd > target) {
      if (v.price == 0) {
        ErrorDetail detail;
        detail.asset = v.asset;
        throw VaultError(ErrorCode::InvalidAsset,
                         "cannot size a sale of unpriced asset " + v.asset,
                         detail);
      }
      Uint256 excess = domain::fromUsdValue(v.value_usd - target, v.price,
                                            v.decimals);
      if (excess > v.balance) {
        excess = v.balance;
      }
      if (excess > 0) {
        sellers.push_back({&v, excess});
      }
    } else if (v.value_usd < target) {
      buyers.push_back({v.asset, target - v.value_usd});
      plan.total_deficit_usd += target - v.value_usd;
    }
    if (it != targets.end()) {
      targets.erase(it);
    }
  }

  // Allocation assets the vault holds none of (and that were not valued).
  for (const auto& entry : allocation.entries()) {
    auto it = targets.find(entry.asset);
    if (it != targets.end() && it->second > 0) {
      buyers.push_back({entry.asset, it->second});
      plan.total_deficit_usd += it->second;
    }
  }

  if (plan.total_deficit_usd == 0) {
    return plan;
  }

  for (const auto& seller : sellers) {
    for (const auto& buyer : buyers) {
      Uint256 amount = domain::mulDiv(seller.excess_native, buyer.deficit_usd,
                                      plan.total_deficit_usd);
      if (amount == 0) {
        continue;
      }
      TradeLeg leg;
      leg.sell_asset = seller.valuation->asset;
      leg.buy_asset = buyer.asset;
      leg.amount_in = amount;
      leg.value_usd = domain::toUsdValue(amount, seller.valuation->price,
                                         seller.valuation->decimals);
      plan.legs.push_back(std::move(leg));
    }
  }
  return plan;
}

}  // namespace vault
