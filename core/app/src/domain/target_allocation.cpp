#include "vault/domain/target_allocation.hpp"
#include "vault/errors/vault_error.hpp"

#include <set>
#include <utility>

namespace vault {
namespace domain {

TargetAllocation::TargetAllocation(std::vector<AllocationEntry> entries)
    : entries_(std::move(entries)) {}

// -----------------------------------------------------------------------------
// create: reject the table wholesale on the first broken rule
// -----------------------------------------------------------------------------
TargetAllocation TargetAllocation::create(
    std::vector<AllocationEntry> entries) {
  if (entries.empty()) {
    throw VaultError(ErrorCode::AllocationInvalid,
                     "target allocation must not be empty");
  }

  std::set<AssetId> seen;
  std::uint64_t sum = 0;

  for (const auto& entry : entries) {
    if (entry.weight == 0) {
      ErrorDetail detail;
      detail.asset = entry.asset;
      throw VaultError(ErrorCode::AllocationInvalid,
                       "zero weight for asset " + entry.asset, detail);
    }
    if (!seen.insert(entry.asset).second) {
      ErrorDetail detail;
      detail.asset = entry.asset;
      throw VaultError(ErrorCode::AllocationInvalid,
                       "duplicate asset " + entry.asset, detail);
    }
    sum += entry.weight;
  }

  if (sum != kWeightSum) {
    ErrorDetail detail;
    detail.actual = Uint256{sum};
    detail.limit = Uint256{kWeightSum};
    throw VaultError(ErrorCode::AllocationInvalid,
                     "weights sum to " + std::to_string(sum) +
                         ", expected " + std::to_string(kWeightSum),
                     detail);
  }

  return TargetAllocation(std::move(entries));
}

bool TargetAllocation::contains(const AssetId& asset) const {
  for (const auto& entry : entries_) {
    if (entry.asset == asset) {
      return true;
    }
  }
  return false;
}

std::uint32_t TargetAllocation::weightOf(const AssetId& asset) const {
  for (const auto& entry : entries_) {
    if (entry.asset == asset) {
      return entry.weight;
    }
  }
  return 0;
}

std::uint32_t TargetAllocation::targetBps(const AssetId& asset) const {
  return weightOf(asset) * (kBpsDenominator / kWeightSum);
}

}  // namespace domain
}  // namespace vault
